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
#include <tessera/chain/extension_registry.hpp>
#include <tessera/protocol/config.hpp>

namespace tessera {
   namespace chain {

      extension_id_type extension_registry::create_extension(uint64_t target_supply) {
         extension_object ext;
         ext.id = static_cast<extension_id_type>(_extensions.size());
         ext.target_supply = target_supply;
         _extensions.push_back(std::move(ext));
         return _extensions.back().id;
      }

      void extension_registry::assign_token(token_id_type token_id, extension_id_type extension_id) {
         TESSERA_ASSERT(has_extension(extension_id), out_of_range_exception,
                        "Extension ${e} does not exist", ("e", extension_id));
         TESSERA_ASSERT(!is_assigned(token_id), already_exists_exception,
                        "Token ${t} is already assigned to extension ${e}",
                        ("t", token_id)("e", extension_by_token(token_id)));
         TESSERA_ASSERT(!exists(token_id), already_exists_exception,
                        "Token ${t} is already alive in extension ${e}",
                        ("t", token_id)("e", extension_by_token(token_id)));
         _token_extension[token_id] = extension_id;
      }

      const extension_object &extension_registry::get_extension(extension_id_type extension_id) const {
         TESSERA_ASSERT(has_extension(extension_id), out_of_range_exception,
                        "Extension ${e} is out of range for ${n} extensions",
                        ("e", extension_id)("n", _extensions.size()));
         return _extensions[extension_id];
      }

      uint64_t extension_registry::supply_of_extension(extension_id_type extension_id) const {
         return get_extension(extension_id).target_supply;
      }

      extension_id_type extension_registry::extension_by_token(token_id_type token_id) const {
         auto itr = _token_extension.find(token_id);
         return itr == _token_extension.end() ? TESSERA_DEFAULT_EXTENSION : itr->second;
      }

      bool extension_registry::is_assigned(token_id_type token_id) const {
         return _token_extension.find(token_id) != _token_extension.end();
      }

      token_id_type extension_registry::token_by_extension_and_index(extension_id_type extension_id,
                                                                     uint64_t index) const {
         return get_extension(extension_id).tokens.at(index).first;
      }

      token_id_type extension_registry::token_by_index(uint64_t global_index) const {
         TESSERA_ASSERT(global_index < _total_supply, out_of_range_exception,
                        "Global index ${i} is out of range for a supply of ${n}",
                        ("i", global_index)("n", _total_supply));

         // Bucket by live count so that every extension contributes exactly its realized tokens
         uint64_t remaining = global_index;
         for (const extension_object &ext : _extensions) {
            const uint64_t n = ext.live_count();
            if (remaining < n) {
               return ext.tokens.at(remaining).first;
            }
            remaining -= n;
         }

         FC_THROW("Global index ${i} could not be resolved although the supply is ${n}",
                  ("i", global_index)("n", _total_supply));
      }

      uint64_t extension_registry::finalize_distribution(extension_id_type extension_id) {
         TESSERA_ASSERT(has_extension(extension_id), out_of_range_exception,
                        "Extension ${e} is out of range for ${n} extensions",
                        ("e", extension_id)("n", _extensions.size()));
         extension_object &ext = _extensions[extension_id];
         const uint64_t realized = ext.live_count();
         ext.target_supply = realized;
         ext.finalized = true;
         _finalized_supply += realized;
         return realized;
      }

      bool extension_registry::exists(token_id_type token_id) const {
         const extension_id_type e = extension_by_token(token_id);
         return has_extension(e) && _extensions[e].tokens.contains(token_id);
      }

      const account_id_type &extension_registry::owner_of(token_id_type token_id) const {
         TESSERA_ASSERT(exists(token_id), not_found_exception,
                        "Token ${t} does not exist", ("t", token_id));
         return _extensions[extension_by_token(token_id)].tokens.get(token_id);
      }

      uint64_t extension_registry::position_in_extension(token_id_type token_id) const {
         TESSERA_ASSERT(exists(token_id), not_found_exception,
                        "Token ${t} does not exist", ("t", token_id));
         return _extensions[extension_by_token(token_id)].tokens.position_of(token_id);
      }

      extension_object &extension_registry::mutable_extension_of(token_id_type token_id) {
         const extension_id_type e = extension_by_token(token_id);
         TESSERA_ASSERT(has_extension(e), not_found_exception,
                        "Extension ${e} of token ${t} does not exist", ("e", e)("t", token_id));
         return _extensions[e];
      }

      void extension_registry::insert_token(token_id_type token_id, const account_id_type &owner) {
         extension_object &ext = mutable_extension_of(token_id);
         TESSERA_ASSERT(!ext.tokens.contains(token_id), already_exists_exception,
                        "Token ${t} already exists", ("t", token_id));
         ext.tokens.set(token_id, owner);
         // Record the default resolution too, so a burned token keeps its extension
         _token_extension.emplace(token_id, ext.id);
         ++_total_supply;
      }

      void extension_registry::erase_token(token_id_type token_id) {
         extension_object &ext = mutable_extension_of(token_id);
         TESSERA_ASSERT(ext.tokens.contains(token_id), not_found_exception,
                        "Token ${t} does not exist", ("t", token_id));
         ext.tokens.remove(token_id);
         --_total_supply;
      }

      void extension_registry::set_owner(token_id_type token_id, const account_id_type &owner) {
         extension_object &ext = mutable_extension_of(token_id);
         TESSERA_ASSERT(ext.tokens.contains(token_id), not_found_exception,
                        "Token ${t} does not exist", ("t", token_id));
         ext.tokens.set(token_id, owner);
      }

      uint64_t extension_registry::count_live_tokens() const {
         uint64_t total = 0;
         for (const extension_object &ext : _extensions) {
            total += ext.live_count();
         }
         return total;
      }

      registry_snapshot extension_registry::snapshot() const {
         registry_snapshot result;
         result.total_supply = _total_supply;
         result.finalized_supply = _finalized_supply;
         result.extensions.reserve(_extensions.size());
         for (const extension_object &ext : _extensions) {
            result.extensions.push_back(make_snapshot(ext));
         }
         return result;
      }

   }
} // tessera::chain
