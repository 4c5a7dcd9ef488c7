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
#include <tessera/chain/holder_index.hpp>

namespace tessera {
   namespace chain {

      bool holder_index::add(const account_id_type &owner, token_id_type token_id) {
         return _holdings[owner].add(token_id);
      }

      bool holder_index::remove(const account_id_type &owner, token_id_type token_id) {
         auto itr = _holdings.find(owner);
         if (itr == _holdings.end()) {
            return false;
         }

         const bool removed = itr->second.remove(token_id);
         if (itr->second.length() == 0) {
            _holdings.erase(itr);
         }
         return removed;
      }

      bool holder_index::contains(const account_id_type &owner, token_id_type token_id) const {
         auto itr = _holdings.find(owner);
         return itr != _holdings.end() && itr->second.contains(token_id);
      }

      uint64_t holder_index::length(const account_id_type &owner) const {
         auto itr = _holdings.find(owner);
         return itr == _holdings.end() ? 0 : itr->second.length();
      }

      token_id_type holder_index::at(const account_id_type &owner, uint64_t position) const {
         auto itr = _holdings.find(owner);
         TESSERA_ASSERT(itr != _holdings.end(), out_of_range_exception,
                        "Position ${p} is out of range: ${owner} holds no tokens",
                        ("p", position)("owner", owner));
         return itr->second.at(position);
      }

      uint64_t holder_index::position_of(const account_id_type &owner, token_id_type token_id) const {
         auto itr = _holdings.find(owner);
         TESSERA_ASSERT(itr != _holdings.end(), not_found_exception,
                        "${owner} holds no tokens", ("owner", owner));
         return itr->second.position_of(token_id);
      }

      void holder_index::restore(const account_id_type &owner, token_id_type token_id, uint64_t position) {
         const uint64_t n = length(owner);
         TESSERA_ASSERT(position <= n, out_of_range_exception,
                        "Cannot restore token ${t} to position ${p} of ${n}",
                        ("t", token_id)("p", position)("n", n));
         FC_ASSERT(!contains(owner, token_id), "Token ${t} is already held by ${owner}",
                   ("t", token_id)("owner", owner));

         auto &holding = _holdings[owner];
         holding.add(token_id);
         holding.swap_positions(position, n);
      }

   }
} // tessera::chain
