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
#include "registry_fixture.hpp"

#include <set>

namespace tessera { namespace chain { namespace test {

registry_fixture::registry_fixture()
   : registry_fixture( registry_config() )
{
}

registry_fixture::registry_fixture( const registry_config& config )
   : db( config )
{
}

registry_fixture::~registry_fixture()
{
}

account_id_type registry_fixture::create_account( const string& name )
{
   const account_id_type id( _next_account++ );
   account_names[id] = name;
   return id;
}

extension_id_type registry_fixture::create_extension( uint64_t target_supply, const vector<token_id_type>& token_ids )
{
   extension_create_operation op;
   op.target_supply = target_supply;
   op.token_ids = token_ids;
   return db.apply_operation( op ).get<extension_id_type>();
}

void registry_fixture::mint( const account_id_type& to, token_id_type token_id )
{
   mint_operation op;
   op.to = to;
   op.token_id = token_id;
   db.apply_operation( op );
}

void registry_fixture::burn( token_id_type token_id )
{
   burn_operation op;
   op.token_id = token_id;
   db.apply_operation( op );
}

void registry_fixture::transfer( const account_id_type& from, const account_id_type& to, token_id_type token_id )
{
   transfer( from, from, to, token_id );
}

void registry_fixture::transfer( const account_id_type& sender, const account_id_type& from,
                                 const account_id_type& to, token_id_type token_id )
{
   transfer_operation op;
   op.sender = sender;
   op.from = from;
   op.to = to;
   op.token_id = token_id;
   db.apply_operation( op );
}

void registry_fixture::safe_transfer( const account_id_type& from, const account_id_type& to,
                                      token_id_type token_id, const vector<char>& data )
{
   safe_transfer_operation op;
   op.sender = from;
   op.from = from;
   op.to = to;
   op.token_id = token_id;
   op.data = data;
   db.apply_operation( op );
}

void registry_fixture::approve( const account_id_type& sender, const account_id_type& to, token_id_type token_id )
{
   approve_operation op;
   op.sender = sender;
   op.to = to;
   op.token_id = token_id;
   db.apply_operation( op );
}

void registry_fixture::set_approval_for_all( const account_id_type& owner, const account_id_type& operator_account,
                                             bool approved )
{
   set_approval_for_all_operation op;
   op.owner = owner;
   op.operator_account = operator_account;
   op.approved = approved;
   db.apply_operation( op );
}

void registry_fixture::finalize( extension_id_type extension_id )
{
   finalize_distribution_operation op;
   op.extension_id = extension_id;
   db.apply_operation( op );
}

void registry_fixture::set_token_uri( token_id_type token_id, const string& uri_suffix )
{
   set_token_uri_operation op;
   op.token_id = token_id;
   op.uri_suffix = uri_suffix;
   db.apply_operation( op );
}

vector<token_id_type> registry_fixture::all_tokens()const
{
   vector<token_id_type> result;
   for( uint64_t i = 0; i < db.total_supply(); ++i )
      result.push_back( db.token_by_index( i ) );
   return result;
}

vector<token_id_type> registry_fixture::tokens_of( const account_id_type& owner )const
{
   vector<token_id_type> result;
   const uint64_t balance = db.balance_of( owner );
   for( uint64_t i = 0; i < balance; ++i )
      result.push_back( db.token_of_owner_by_index( owner, i ) );
   return result;
}

vector<transfer_event> registry_fixture::transfer_events()const
{
   vector<transfer_event> result;
   for( const event_type& e : db.get_applied_events() )
   {
      if( e.which() == event_type::tag<transfer_event>::value )
         result.push_back( e.get<transfer_event>() );
   }
   return result;
}

void registry_fixture::verify_registry_consistency()const
{
   const extension_registry& registry = db.extensions();
   const holder_index& holders = db.holders();

   BOOST_REQUIRE_EQUAL( db.total_supply(), registry.count_live_tokens() );

   std::set<token_id_type> seen;
   std::map<account_id_type, uint64_t> balances;
   for( uint64_t e = 0; e < registry.extension_count(); ++e )
   {
      const extension_object& ext = registry.get_extension( extension_id_type( e ) );
      for( uint64_t i = 0; i < ext.live_count(); ++i )
      {
         const auto entry = ext.tokens.at( i );
         BOOST_REQUIRE_MESSAGE( seen.insert( entry.first ).second,
                                "token " << entry.first << " is in more than one extension" );
         BOOST_REQUIRE_EQUAL( ext.tokens.position_of( entry.first ), i );
         BOOST_REQUIRE_EQUAL( db.extension_by_token( entry.first ), ext.id );
         BOOST_REQUIRE( holders.contains( entry.second, entry.first ) );
         ++balances[entry.second];
      }
   }

   // No holder set carries a token the extension maps do not know about
   BOOST_REQUIRE_EQUAL( holders.holder_count(), balances.size() );
   for( const auto& b : balances )
      BOOST_REQUIRE_EQUAL( holders.length( b.first ), b.second );

   std::set<token_id_type> enumerated;
   for( uint64_t i = 0; i < db.total_supply(); ++i )
      BOOST_REQUIRE( enumerated.insert( db.token_by_index( i ) ).second );
   BOOST_REQUIRE( enumerated == seen );
}

} } } // tessera::chain::test
