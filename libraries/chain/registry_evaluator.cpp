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

namespace tessera {
   namespace chain {
      void_result extension_create_evaluator::do_evaluate(const extension_create_operation &op) {
         try {
            const database &d = db();
            const extension_registry &registry = d.extensions();

            // Assignments are permanent: a token may not change extension,
            // not even one it only resolves to by default
            for (const token_id_type token_id : op.token_ids) {
               TESSERA_ASSERT(!registry.is_assigned(token_id), already_exists_exception,
                              "Token ${t} is already assigned to extension ${e}",
                              ("t", token_id)("e", registry.extension_by_token(token_id)));
               TESSERA_ASSERT(!registry.exists(token_id), already_exists_exception,
                              "Token ${t} was already minted into extension ${e}",
                              ("t", token_id)("e", registry.extension_by_token(token_id)));
            }

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      extension_id_type extension_create_evaluator::do_apply(const extension_create_operation &op) {
         try {
            const extension_id_type id = db().create_extension(op.target_supply, op.token_ids);
            ilog("Created extension ${e} with a target supply of ${s} and ${n} assigned tokens",
                 ("e", id)("s", op.target_supply)("n", op.token_ids.size()));
            return id;
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result mint_evaluator::do_evaluate(const mint_operation &op) {
         try {
            const database &d = db();

            TESSERA_ASSERT(!op.to.is_null(), invalid_recipient_exception,
                           "Cannot mint token ${t} to the null account", ("t", op.token_id));

            const extension_id_type extension_id = d.extension_by_token(op.token_id);
            TESSERA_ASSERT(d.extensions().has_extension(extension_id), not_found_exception,
                           "Token ${t} resolves to extension ${e} which does not exist",
                           ("t", op.token_id)("e", extension_id));

            TESSERA_ASSERT(!d.exists(op.token_id), already_exists_exception,
                           "Token ${t} already exists", ("t", op.token_id));

            d.hook().before_token_transfer(TESSERA_NULL_ACCOUNT, op.to, op.token_id);

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result mint_evaluator::do_apply(const mint_operation &op) {
         try {
            db().create_token(op.to, op.token_id);
            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result burn_evaluator::do_evaluate(const burn_operation &op) {
         try {
            const database &d = db();

            TESSERA_ASSERT(d.exists(op.token_id), not_found_exception,
                           "Cannot burn token ${t}: it does not exist", ("t", op.token_id));
            _owner = d.owner_of(op.token_id);

            d.hook().before_token_transfer(_owner, TESSERA_NULL_ACCOUNT, op.token_id);

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result burn_evaluator::do_apply(const burn_operation &op) {
         try {
            db().destroy_token(op.token_id);
            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result approve_evaluator::do_evaluate(const approve_operation &op) {
         try {
            const database &d = db();

            TESSERA_ASSERT(d.exists(op.token_id), not_found_exception,
                           "Cannot approve token ${t}: it does not exist", ("t", op.token_id));
            _owner = d.owner_of(op.token_id);

            TESSERA_ASSERT(op.to != _owner, invalid_recipient_exception,
                           "Approval of token ${t} to its current owner ${o}",
                           ("t", op.token_id)("o", _owner));

            TESSERA_ASSERT(op.sender == _owner || d.is_approved_for_all(_owner, op.sender),
                           not_authorized_exception,
                           "${s} is neither the owner of token ${t} nor an operator of ${o}",
                           ("s", op.sender)("t", op.token_id)("o", _owner));

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result approve_evaluator::do_apply(const approve_operation &op) {
         try {
            database &d = db();
            d.set_approval(op.token_id, op.to);
            d.push_event(approval_event(_owner, op.to, op.token_id));
            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result set_approval_for_all_evaluator::do_evaluate(const set_approval_for_all_operation &op) {
         try {
            TESSERA_ASSERT(!op.owner.is_null(), invalid_owner_exception,
                           "The null account cannot appoint operator ${op}",
                           ("op", op.operator_account));
            TESSERA_ASSERT(!op.operator_account.is_null(), invalid_recipient_exception,
                           "The null account cannot be an operator of ${o}",
                           ("o", op.owner));
            TESSERA_ASSERT(op.operator_account != op.owner, invalid_recipient_exception,
                           "${o} cannot be its own operator", ("o", op.owner));

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result set_approval_for_all_evaluator::do_apply(const set_approval_for_all_operation &op) {
         try {
            database &d = db();
            d.set_approval_for_all(op.owner, op.operator_account, op.approved);
            d.push_event(approval_for_all_event(op.owner, op.operator_account, op.approved));
            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result finalize_distribution_evaluator::do_evaluate(const finalize_distribution_operation &op) {
         try {
            const database &d = db();
            const extension_registry &registry = d.extensions();

            TESSERA_ASSERT(registry.has_extension(op.extension_id), out_of_range_exception,
                           "Extension ${e} is out of range for ${n} extensions",
                           ("e", op.extension_id)("n", registry.extension_count()));

            const extension_object &ext = registry.get_extension(op.extension_id);
            if (ext.finalized) {
               wlog("Extension ${e} is finalized again; its ${n} tokens are added to the finalized supply a second time",
                    ("e", op.extension_id)("n", ext.live_count()));
            }

            d.hook().before_distribution_finalized(op.extension_id);

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result finalize_distribution_evaluator::do_apply(const finalize_distribution_operation &op) {
         try {
            const uint64_t realized = db().finalize_distribution(op.extension_id);
            ilog("Finalized extension ${e} at a realized supply of ${n}",
                 ("e", op.extension_id)("n", realized));
            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result set_token_uri_evaluator::do_evaluate(const set_token_uri_operation &op) {
         try {
            TESSERA_ASSERT(db().exists(op.token_id), not_found_exception,
                           "Cannot set the URI of token ${t}: it does not exist", ("t", op.token_id));
            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result set_token_uri_evaluator::do_apply(const set_token_uri_operation &op) {
         try {
            db().set_token_uri_suffix(op.token_id, op.uri_suffix);
            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

   } // namespace chain
} // namespace tessera
