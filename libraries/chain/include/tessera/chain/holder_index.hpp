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

#include <tessera/chain/enumerable_set.hpp>
#include <tessera/protocol/types.hpp>

#include <map>

namespace tessera {
   namespace chain {
      using protocol::account_id_type;
      using protocol::token_id_type;

      /**
       *  @brief Tokens held by each account
       *
       *  One enumerable set per holder, created with the holder's first token
       *  and erased with the last one. An account without an entry holds
       *  nothing.
       */
      class holder_index {
      public:
         /// @return False if the holder already had the token
         bool add(const account_id_type &owner, token_id_type token_id);

         /// @return False if the holder did not have the token
         bool remove(const account_id_type &owner, token_id_type token_id);

         bool contains(const account_id_type &owner, token_id_type token_id) const;

         /// Number of tokens held by the owner
         uint64_t length(const account_id_type &owner) const;

         /// Token at a position of the owner's set; fails with out_of_range_exception
         token_id_type at(const account_id_type &owner, uint64_t position) const;

         uint64_t position_of(const account_id_type &owner, token_id_type token_id) const;

         /**
          * Re-insert a token at a position it previously held
          *
          * Reverses a remove(): the token is appended, then exchanged with the
          * entry that was moved into its old position.
          */
         void restore(const account_id_type &owner, token_id_type token_id, uint64_t position);

         /// Number of accounts currently holding at least one token
         uint64_t holder_count() const { return _holdings.size(); }

      private:
         std::map<account_id_type, enumerable_set<token_id_type>> _holdings;
      };

   }
} // tessera::chain
