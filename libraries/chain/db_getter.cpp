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

      uint64_t database::balance_of(const account_id_type &owner) const {
         TESSERA_ASSERT(!owner.is_null(), invalid_owner_exception,
                        "The balance of the null account is undefined", ("owner", owner));
         return _holders.length(owner);
      }

      account_id_type database::owner_of(token_id_type token_id) const {
         return _registry.owner_of(token_id);
      }

      bool database::exists(token_id_type token_id) const {
         return _registry.exists(token_id);
      }

      uint64_t database::total_supply() const {
         return _registry.total_supply();
      }

      token_id_type database::token_of_owner_by_index(const account_id_type &owner, uint64_t index) const {
         return _holders.at(owner, index);
      }

      token_id_type database::token_by_index(uint64_t global_index) const {
         return _registry.token_by_index(global_index);
      }

      uint64_t database::supply_of_extension(extension_id_type extension_id) const {
         return _registry.supply_of_extension(extension_id);
      }

      extension_id_type database::extension_by_token(token_id_type token_id) const {
         return _registry.extension_by_token(token_id);
      }

      token_id_type database::token_by_extension_and_index(extension_id_type extension_id, uint64_t index) const {
         return _registry.token_by_extension_and_index(extension_id, index);
      }

      uint64_t database::finalized_supply() const {
         return _registry.finalized_supply();
      }

      uint64_t database::extension_count() const {
         return _registry.extension_count();
      }

      account_id_type database::get_approved(token_id_type token_id) const {
         TESSERA_ASSERT(exists(token_id), not_found_exception,
                        "Token ${t} does not exist", ("t", token_id));
         auto itr = _token_approvals.find(token_id);
         return itr == _token_approvals.end() ? TESSERA_NULL_ACCOUNT : itr->second;
      }

      bool database::is_approved_for_all(const account_id_type &owner, const account_id_type &operator_account) const {
         return _operator_approvals.find(std::make_pair(owner, operator_account)) != _operator_approvals.end();
      }

      bool database::is_approved_or_owner(const account_id_type &spender, token_id_type token_id) const {
         const account_id_type owner = owner_of(token_id);
         return spender == owner
                || (!spender.is_null() && get_approved(token_id) == spender)
                || is_approved_for_all(owner, spender);
      }

      string database::token_uri(token_id_type token_id) const {
         TESSERA_ASSERT(exists(token_id), not_found_exception,
                        "Token ${t} does not exist", ("t", token_id));

         const string &base = _config.base_uri;
         auto itr = _token_uri_suffixes.find(token_id);
         if (base.empty()) {
            return itr == _token_uri_suffixes.end() ? string() : itr->second;
         }
         if (itr != _token_uri_suffixes.end()) {
            return base + itr->second;
         }
         return base + std::to_string(token_id);
      }

      registry_snapshot database::get_snapshot() const {
         return _registry.snapshot();
      }

   }
} // tessera::chain
