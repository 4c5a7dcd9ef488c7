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
#include <tessera/transfer_history/transfer_history.hpp>

#include <boost/signals2/connection.hpp>

#include <fc/log/logger.hpp>

#include <map>

namespace tessera {
   namespace transfer_history {

      namespace detail {

         class transfer_history_impl {
         public:
            explicit transfer_history_impl(transfer_history &_plugin);

            virtual ~transfer_history_impl();

            void on_event(const event_type &e);

            void record(const transfer_event &e);

            void prune();

            tessera::chain::database &database() const {
               return _self.database();
            }

            friend class tessera::transfer_history::transfer_history;

         private:
            transfer_history &_self;

            transfer_history_multi_index_type _transfers;

            uint64_t _next_sequence = 0;

            uint64_t _max_entries = 0;

            boost::signals2::scoped_connection _event_connection;
         };

         struct event_process_transfer_related {
            transfer_history_impl &_impl;

            explicit event_process_transfer_related(transfer_history_impl &history_impl)
               :_impl(history_impl) {

            }

            typedef void result_type;

            /** do nothing for other event types */
            template<typename T>
            void operator()( const T& )const{}

            void operator()( const transfer_event& e ) const {
               _impl.record(e);
            }
         };

         transfer_history_impl::transfer_history_impl(transfer_history &_plugin) :
            _self(_plugin) {
         }

         transfer_history_impl::~transfer_history_impl() {
         }

         void transfer_history_impl::on_event(const event_type &e) {
            try {
               e.visit( event_process_transfer_related(*this) );
            } FC_CAPTURE_AND_LOG( (e) )
         }

         void transfer_history_impl::record(const transfer_event &e) {
            const uint64_t sequence = _next_sequence++;
            _transfers.insert( transfer_history_object{ sequence, e.token_id, e.from, e.to } );
            prune();
         }

         void transfer_history_impl::prune() {
            if (_max_entries == 0) {
               return;
            }

            // Oldest entries go first
            auto &seq_idx = _transfers.get<by_sequence>();
            while (seq_idx.size() > _max_entries) {
               seq_idx.erase(seq_idx.begin());
            }
         }

      } // end namespace detail

      transfer_history::transfer_history(tessera::chain::database &db) :
         plugin(db),
         my(std::make_unique<detail::transfer_history_impl>(*this)) {
      }

      transfer_history::~transfer_history() {
         cleanup();
      }

      std::string transfer_history::plugin_name() const {
         return "transfer_history";
      }

      std::string transfer_history::plugin_description() const {
         return "Records every committed token transfer, mint and burn";
      }

      void transfer_history::plugin_set_program_options(
         boost::program_options::options_description &cli,
         boost::program_options::options_description &cfg
      ) {
         cli.add_options()
            ("transfer-history-max-entries", boost::program_options::value<uint64_t>()->default_value(0),
             "Maximum number of transfers to retain, oldest dropped first (0 = unlimited)");
         cfg.add(cli);
      }

      void transfer_history::plugin_initialize(const boost::program_options::variables_map &options) {
         my->_event_connection = database().applied_event.connect([this](const event_type &e) {
            my->on_event(e);
         });

         if (options.count("transfer-history-max-entries") > 0) {
            my->_max_entries = options["transfer-history-max-entries"].as<uint64_t>();
         }
      }

      void transfer_history::plugin_startup() {
         ilog("transfer_history: plugin_startup() begin");
      }

      void transfer_history::plugin_shutdown() {
         ilog("transfer_history: plugin_shutdown() begin");
         cleanup();
      }

      void transfer_history::cleanup() {
         my->_event_connection.disconnect();
      }

      vector<transfer_history_object> transfer_history::get_transfers_by_token(const token_id_type token_id) const {
         const auto &token_idx = my->_transfers.get<by_token_sequence>();

         vector<transfer_history_object> result;
         auto itr = token_idx.lower_bound(boost::make_tuple(token_id));
         while (itr != token_idx.end() && itr->token_id == token_id) {
            result.emplace_back(*itr);
            ++itr;
         }

         return result;
      }

      vector<transfer_history_object> transfer_history::get_transfers_by_account(const account_id_type account,
                                                                                 uint32_t limit) const {
         FC_ASSERT(!account.is_null(), "The null account takes part in every mint and burn");

         // Keyed by sequence so a transfer to oneself is listed once
         std::map<uint64_t, const transfer_history_object*, std::greater<uint64_t>> matches;

         const auto &from_idx = my->_transfers.get<by_from_sequence>();
         for (auto itr = from_idx.lower_bound(boost::make_tuple(account));
              itr != from_idx.end() && itr->from == account; ++itr) {
            matches[itr->sequence] = &*itr;
         }

         const auto &to_idx = my->_transfers.get<by_to_sequence>();
         for (auto itr = to_idx.lower_bound(boost::make_tuple(account));
              itr != to_idx.end() && itr->to == account; ++itr) {
            matches[itr->sequence] = &*itr;
         }

         vector<transfer_history_object> result;
         for (const auto &m : matches) {
            if (result.size() >= limit) {
               break;
            }
            result.emplace_back(*m.second);
         }

         return result;
      }

      vector<transfer_history_object> transfer_history::get_transfers() const {
         const auto &seq_idx = my->_transfers.get<by_sequence>();
         return vector<transfer_history_object>(seq_idx.begin(), seq_idx.end());
      }

      uint64_t transfer_history::size() const {
         return my->_transfers.size();
      }

      uint64_t transfer_history::max_entries() const {
         return my->_max_entries;
      }

   }
}
