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
#pragma once

#include <tessera/chain/extension_registry.hpp>
#include <tessera/chain/holder_index.hpp>
#include <tessera/chain/registry_config.hpp>
#include <tessera/chain/transfer_hook.hpp>
#include <tessera/protocol/events.hpp>
#include <tessera/protocol/operations.hpp>

#include <fc/optional.hpp>
#include <fc/signals.hpp>

#include <map>
#include <memory>
#include <set>

namespace tessera {
   namespace chain {
      using protocol::event_type;
      using protocol::operation;
      using protocol::void_result;
      using std::string;

      typedef fc::static_variant<void_result, extension_id_type> operation_result;

      /// State needed to undo a transfer exactly
      struct transfer_receipt {
         account_id_type from;
         account_id_type to;
         token_id_type token_id = 0;
         /// Position the token held in the previous owner's holder set
         uint64_t from_position = 0;
         fc::optional<account_id_type> prior_approval;
      };

      /**
       *  @brief The token registry
       *
       *  Holds every extension, the holder index and the approval and
       *  metadata side tables. Writes arrive as operations through
       *  apply_operation(); each one either succeeds completely or leaves
       *  the registry untouched.
       */
      class database {
      public:
         explicit database(const registry_config &config = registry_config());
         ~database();

         /**
          * Validate, evaluate and apply a single operation
          *
          * Events produced by the operation are appended to the event log
          * and published through applied_event only once it succeeded.
          */
         operation_result apply_operation(const operation &op);

         /// Install the pre-mutation policy; nullptr restores the permissive default
         void set_transfer_hook(std::shared_ptr<transfer_hook> hook);

         void register_receiver(const account_id_type &account, std::shared_ptr<token_receiver> receiver);
         void unregister_receiver(const account_id_type &account);
         bool is_programmable(const account_id_type &account) const;

         /// Emitted for every event of a successful operation, in order
         fc::signal<void(const event_type &)> applied_event;

         //////////////////// db_getter.cpp ////////////////////

         uint64_t balance_of(const account_id_type &owner) const;
         account_id_type owner_of(token_id_type token_id) const;
         bool exists(token_id_type token_id) const;
         uint64_t total_supply() const;
         token_id_type token_of_owner_by_index(const account_id_type &owner, uint64_t index) const;
         token_id_type token_by_index(uint64_t global_index) const;
         uint64_t supply_of_extension(extension_id_type extension_id) const;
         extension_id_type extension_by_token(token_id_type token_id) const;
         token_id_type token_by_extension_and_index(extension_id_type extension_id, uint64_t index) const;
         uint64_t finalized_supply() const;
         uint64_t extension_count() const;

         /// Approved account of a token, or the null account
         account_id_type get_approved(token_id_type token_id) const;
         bool is_approved_for_all(const account_id_type &owner, const account_id_type &operator_account) const;
         /// True if the account may move the token on behalf of its owner
         bool is_approved_or_owner(const account_id_type &spender, token_id_type token_id) const;

         string token_uri(token_id_type token_id) const;

         const vector<event_type> &get_applied_events() const { return _applied_events; }
         registry_snapshot get_snapshot() const;
         const registry_config &get_config() const { return _config; }

         const extension_registry &extensions() const { return _registry; }
         const holder_index &holders() const { return _holders; }

         //////////////////// db_token.cpp ////////////////////
         // Primitives used by the evaluators. They assume the evaluation
         // step has already checked every precondition.

         extension_id_type create_extension(uint64_t target_supply, const vector<token_id_type> &token_ids);
         uint64_t finalize_distribution(extension_id_type extension_id);

         void create_token(const account_id_type &to, token_id_type token_id);
         void destroy_token(token_id_type token_id);
         transfer_receipt move_token(const account_id_type &from, const account_id_type &to, token_id_type token_id);
         void revert_transfer(const transfer_receipt &receipt);

         void set_approval(token_id_type token_id, const account_id_type &approved);
         void set_approval_for_all(const account_id_type &owner, const account_id_type &operator_account, bool approved);
         void set_token_uri_suffix(token_id_type token_id, const string &suffix);

         /**
          * Call the receiver registered for an account
          *
          * Writes are rejected with reentrant_call_exception until the
          * receiver returns.
          */
         uint32_t notify_receiver(const account_id_type &to, const account_id_type &operator_account,
                                  const account_id_type &from, token_id_type token_id,
                                  const vector<char> &data);

         transfer_hook &hook() const { return *_hook; }

         void push_event(const event_type &e);
         void discard_pending_events();

      private:
         void commit_pending_events();

         registry_config _config;
         extension_registry _registry;
         holder_index _holders;

         std::map<token_id_type, account_id_type> _token_approvals;
         std::set<std::pair<account_id_type, account_id_type>> _operator_approvals;
         std::map<token_id_type, string> _token_uri_suffixes;

         std::shared_ptr<transfer_hook> _hook;
         std::map<account_id_type, std::shared_ptr<token_receiver>> _receivers;

         vector<event_type> _applied_events;
         vector<event_type> _pending_events;
         bool _notifying_receiver = false;
      };

   }
} // tessera::chain
