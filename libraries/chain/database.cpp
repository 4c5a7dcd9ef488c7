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

#include <fc/log/logger.hpp>

namespace tessera {
   namespace chain {

      namespace {
         struct operation_dispatcher {
            typedef operation_result result_type;

            database &d;

            explicit operation_dispatcher(database &db) : d(db) {}

            operation_result operator()(const extension_create_operation &op) const {
               return extension_create_evaluator(d).start_evaluate(op);
            }
            operation_result operator()(const mint_operation &op) const {
               return mint_evaluator(d).start_evaluate(op);
            }
            operation_result operator()(const burn_operation &op) const {
               return burn_evaluator(d).start_evaluate(op);
            }
            operation_result operator()(const transfer_operation &op) const {
               return transfer_evaluator(d).start_evaluate(op);
            }
            operation_result operator()(const safe_transfer_operation &op) const {
               return safe_transfer_evaluator(d).start_evaluate(op);
            }
            operation_result operator()(const approve_operation &op) const {
               return approve_evaluator(d).start_evaluate(op);
            }
            operation_result operator()(const set_approval_for_all_operation &op) const {
               return set_approval_for_all_evaluator(d).start_evaluate(op);
            }
            operation_result operator()(const finalize_distribution_operation &op) const {
               return finalize_distribution_evaluator(d).start_evaluate(op);
            }
            operation_result operator()(const set_token_uri_operation &op) const {
               return set_token_uri_evaluator(d).start_evaluate(op);
            }
         };
      }

      database::database(const registry_config &config)
         : _config(config),
           _hook(std::make_shared<transfer_hook>()) {
      }

      database::~database() {
      }

      operation_result database::apply_operation(const operation &op) {
         try {
            TESSERA_ASSERT(!_notifying_receiver, reentrant_call_exception,
                           "Operation ${which} was issued while a token receiver is being notified",
                           ("which", op.which()));

            protocol::operation_validate(op);

            _pending_events.clear();
            operation_result result = op.visit(operation_dispatcher(*this));
            commit_pending_events();

            return result;
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void database::set_transfer_hook(std::shared_ptr<transfer_hook> hook) {
         if (hook) {
            _hook = std::move(hook);
         } else {
            _hook = std::make_shared<transfer_hook>();
         }
      }

      void database::register_receiver(const account_id_type &account, std::shared_ptr<token_receiver> receiver) {
         FC_ASSERT(!account.is_null(), "The null account cannot receive notifications");
         FC_ASSERT(receiver, "A receiver is required for ${a}", ("a", account));
         _receivers[account] = std::move(receiver);
      }

      void database::unregister_receiver(const account_id_type &account) {
         _receivers.erase(account);
      }

      bool database::is_programmable(const account_id_type &account) const {
         return _receivers.find(account) != _receivers.end();
      }

      void database::push_event(const event_type &e) {
         _pending_events.push_back(e);
      }

      void database::discard_pending_events() {
         _pending_events.clear();
      }

      void database::commit_pending_events() {
         vector<event_type> committed;
         committed.swap(_pending_events);
         for (const event_type &e : committed) {
            _applied_events.push_back(e);
            applied_event(e);
         }
      }

   }
} // tessera::chain
