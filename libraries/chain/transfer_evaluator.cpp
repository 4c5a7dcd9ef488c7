/*
 * Copyright (c) 2023 Michel Santos and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#include <tessera/chain/database.hpp>
#include <tessera/chain/exceptions.hpp>
#include <tessera/chain/registry_evaluator.hpp>
#include <tessera/protocol/config.hpp>

#include <fc/log/logger.hpp>

namespace tessera { namespace chain {

void evaluate_transfer( const database& d, const account_id_type& sender,
                        const account_id_type& from, const account_id_type& to,
                        token_id_type token_id )
{
   TESSERA_ASSERT( d.exists( token_id ), not_found_exception,
                   "Cannot transfer token ${t}: it does not exist", ("t", token_id) );

   const account_id_type owner = d.owner_of( token_id );

   TESSERA_ASSERT( d.is_approved_or_owner( sender, token_id ), not_authorized_exception,
                   "${s} may not transfer token ${t} owned by ${o}",
                   ("s", sender)("t", token_id)("o", owner) );

   TESSERA_ASSERT( owner == from, owner_mismatch_exception,
                   "Token ${t} is owned by ${o}, not by ${f}",
                   ("t", token_id)("o", owner)("f", from) );

   TESSERA_ASSERT( !to.is_null(), invalid_recipient_exception,
                   "Cannot transfer token ${t} to the null account", ("t", token_id) );

   d.hook().before_token_transfer( from, to, token_id );
}

void_result transfer_evaluator::do_evaluate( const transfer_operation& op )
{ try {
   evaluate_transfer( db(), op.sender, op.from, op.to, op.token_id );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result transfer_evaluator::do_apply( const transfer_operation& o )
{ try {
   db().move_token( o.from, o.to, o.token_id );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }



void_result safe_transfer_evaluator::do_evaluate( const safe_transfer_operation& op )
{ try {
   evaluate_transfer( db(), op.sender, op.from, op.to, op.token_id );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result safe_transfer_evaluator::do_apply( const safe_transfer_operation& o )
{ try {
   database& d = db();

   // The recipient is only consulted once the registry reflects the transfer
   const transfer_receipt receipt = d.move_token( o.from, o.to, o.token_id );

   if( !d.is_programmable( o.to ) )
      return void_result();

   uint32_t ack = 0;
   try {
      ack = d.notify_receiver( o.to, o.sender, o.from, o.token_id, o.data );
   } catch( ... ) {
      d.revert_transfer( receipt );
      throw;
   }

   if( ack != TESSERA_TOKEN_RECEIVED_ACK )
   {
      d.revert_transfer( receipt );
      wlog( "Recipient ${to} declined token ${t} from ${f}", ("to", o.to)("t", o.token_id)("f", o.from) );
      FC_THROW_EXCEPTION( transfer_rejected_exception,
                          "Recipient ${to} answered ${ack} instead of ${expected}",
                          ("to", o.to)("ack", ack)("expected", TESSERA_TOKEN_RECEIVED_ACK) );
   }

   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

} } // tessera::chain
