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
#include <tessera/protocol/config.hpp>

namespace tessera {
   namespace chain {

      namespace {
         /// Marks the database as busy notifying a receiver for the lifetime of the guard
         struct receiver_notification_guard {
            explicit receiver_notification_guard(bool &flag) : _flag(flag) { _flag = true; }
            ~receiver_notification_guard() { _flag = false; }

            bool &_flag;
         };
      }

      extension_id_type database::create_extension(uint64_t target_supply, const vector<token_id_type> &token_ids) {
         const extension_id_type id = _registry.create_extension(target_supply);
         for (const token_id_type token_id : token_ids) {
            _registry.assign_token(token_id, id);
         }
         return id;
      }

      uint64_t database::finalize_distribution(extension_id_type extension_id) {
         return _registry.finalize_distribution(extension_id);
      }

      void database::create_token(const account_id_type &to, token_id_type token_id) {
         _registry.insert_token(token_id, to);
         _holders.add(to, token_id);
         push_event(protocol::transfer_event(TESSERA_NULL_ACCOUNT, to, token_id));
      }

      void database::destroy_token(token_id_type token_id) {
         const account_id_type owner = _registry.owner_of(token_id);

         _token_approvals.erase(token_id);
         _token_uri_suffixes.erase(token_id);
         _holders.remove(owner, token_id);
         _registry.erase_token(token_id);

         push_event(protocol::transfer_event(owner, TESSERA_NULL_ACCOUNT, token_id));
      }

      transfer_receipt database::move_token(const account_id_type &from, const account_id_type &to,
                                            token_id_type token_id) {
         transfer_receipt receipt;
         receipt.from = from;
         receipt.to = to;
         receipt.token_id = token_id;
         receipt.from_position = _holders.position_of(from, token_id);

         auto approval = _token_approvals.find(token_id);
         if (approval != _token_approvals.end()) {
            receipt.prior_approval = approval->second;
            _token_approvals.erase(approval);
         }

         _holders.remove(from, token_id);
         _holders.add(to, token_id);
         _registry.set_owner(token_id, to);

         push_event(protocol::transfer_event(from, to, token_id));
         return receipt;
      }

      void database::revert_transfer(const transfer_receipt &receipt) {
         // The token was appended to the recipient's set, so removing it restores that set exactly
         _holders.remove(receipt.to, receipt.token_id);
         _holders.restore(receipt.from, receipt.token_id, receipt.from_position);
         _registry.set_owner(receipt.token_id, receipt.from);

         if (receipt.prior_approval.valid()) {
            _token_approvals[receipt.token_id] = *receipt.prior_approval;
         }

         discard_pending_events();
      }

      void database::set_approval(token_id_type token_id, const account_id_type &approved) {
         if (approved.is_null()) {
            _token_approvals.erase(token_id);
         } else {
            _token_approvals[token_id] = approved;
         }
      }

      void database::set_approval_for_all(const account_id_type &owner, const account_id_type &operator_account,
                                          bool approved) {
         const auto key = std::make_pair(owner, operator_account);
         if (approved) {
            _operator_approvals.insert(key);
         } else {
            _operator_approvals.erase(key);
         }
      }

      void database::set_token_uri_suffix(token_id_type token_id, const string &suffix) {
         if (suffix.empty()) {
            _token_uri_suffixes.erase(token_id);
         } else {
            _token_uri_suffixes[token_id] = suffix;
         }
      }

      uint32_t database::notify_receiver(const account_id_type &to, const account_id_type &operator_account,
                                         const account_id_type &from, token_id_type token_id,
                                         const vector<char> &data) {
         auto itr = _receivers.find(to);
         FC_ASSERT(itr != _receivers.end(), "${a} has no registered receiver", ("a", to));

         // The receiver may unregister itself while it runs
         std::shared_ptr<token_receiver> receiver = itr->second;
         receiver_notification_guard guard(_notifying_receiver);
         return receiver->on_token_received(operator_account, from, token_id, data);
      }

   }
} // tessera::chain
