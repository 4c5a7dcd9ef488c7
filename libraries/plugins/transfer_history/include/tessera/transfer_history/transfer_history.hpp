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

#include <tessera/app/plugin.hpp>
#include <tessera/chain/database.hpp>

#include <boost/multi_index/composite_key.hpp>
#include <boost/multi_index/ordered_index.hpp>

#include <memory>

namespace tessera { namespace transfer_history {
using namespace chain;
using namespace protocol;

/// One committed Transfer event: a mint, a burn or a change of owner
struct transfer_history_object
{
   /// Order of the event among all recorded transfers
   uint64_t sequence = 0;

   token_id_type token_id = 0;

   /// Null for a mint
   account_id_type from;

   /// Null for a burn
   account_id_type to;

   bool is_mint()const { return from.is_null(); }
   bool is_burn()const { return to.is_null(); }
};

namespace detail
{
    class transfer_history_impl;
}

class transfer_history : public tessera::app::plugin
{
   public:
      explicit transfer_history(chain::database& db);
      ~transfer_history() override;

      std::string plugin_name()const override;
      std::string plugin_description()const override;
      void plugin_set_program_options(
         boost::program_options::options_description& cli,
         boost::program_options::options_description& cfg) override;
      void plugin_initialize(const boost::program_options::variables_map& options) override;
      void plugin_startup() override;
      void plugin_shutdown() override;

      /**
       * @brief Get every recorded transfer of a token
       * @param token_id Token ID
       * @return Transfers in the order they happened
       */
      vector<transfer_history_object> get_transfers_by_token(const token_id_type token_id) const;

      /**
       * @brief Get the transfers an account took part in
       * @param account Sender or recipient
       * @param limit Maximum number of entries to return
       * @return Transfers from the most recent to the oldest
       */
      vector<transfer_history_object> get_transfers_by_account(const account_id_type account,
                                                               uint32_t limit = 100) const;

      /// Every retained transfer, oldest first
      vector<transfer_history_object> get_transfers() const;

      /// Number of transfers currently retained
      uint64_t size() const;

      /// Maximum number of transfers retained; 0 keeps everything
      uint64_t max_entries() const;

   private:
      void cleanup();
      std::unique_ptr<detail::transfer_history_impl> my;
};

struct by_sequence;
struct by_token_sequence;
struct by_from_sequence;
struct by_to_sequence;
typedef multi_index_container <
   transfer_history_object,
   indexed_by<
      ordered_unique< tag<by_sequence>, member<transfer_history_object, uint64_t, &transfer_history_object::sequence> >,
      ordered_unique< tag<by_token_sequence>,
         composite_key< transfer_history_object,
            member<transfer_history_object, token_id_type, &transfer_history_object::token_id>,
            member<transfer_history_object, uint64_t, &transfer_history_object::sequence>
         >
      >,
      ordered_unique< tag<by_from_sequence>,
         composite_key< transfer_history_object,
            member<transfer_history_object, account_id_type, &transfer_history_object::from>,
            member<transfer_history_object, uint64_t, &transfer_history_object::sequence>
         >
      >,
      ordered_unique< tag<by_to_sequence>,
         composite_key< transfer_history_object,
            member<transfer_history_object, account_id_type, &transfer_history_object::to>,
            member<transfer_history_object, uint64_t, &transfer_history_object::sequence>
         >
      >
   >
> transfer_history_multi_index_type;

} } //tessera::transfer_history

FC_REFLECT( tessera::transfer_history::transfer_history_object, (sequence)(token_id)(from)(to) )
