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

#include <tessera/chain/extension_object.hpp>

#include <deque>
#include <unordered_map>

namespace tessera {
   namespace chain {

      /**
       *  @brief Ordered sequence of extensions presented as one token space
       *  @ingroup extensions
       *
       *  Global positions enumerate extension 0 first, then extension 1 and
       *  so on, each in its own enumeration order. The registry owns the
       *  immutable token to extension assignment and the supply counters.
       */
      class extension_registry {
      public:
         /// Append an extension with the given pledged supply
         extension_id_type create_extension(uint64_t target_supply);

         /**
          * Permanently attach a token to an extension
          *
          * Fails with already_exists_exception if the token is already
          * assigned or is alive in the extension it currently resolves to.
          */
         void assign_token(token_id_type token_id, extension_id_type extension_id);

         uint64_t extension_count() const { return _extensions.size(); }

         bool has_extension(extension_id_type extension_id) const {
            return extension_id < _extensions.size();
         }

         /// Fails with out_of_range_exception for an unknown extension
         const extension_object &get_extension(extension_id_type extension_id) const;

         uint64_t supply_of_extension(extension_id_type extension_id) const;

         /// Number of tokens currently alive in the extension
         uint64_t live_count(extension_id_type extension_id) const {
            return get_extension(extension_id).live_count();
         }

         bool is_finalized(extension_id_type extension_id) const {
            return get_extension(extension_id).finalized;
         }

         /**
          * Extension the token belongs to, or TESSERA_DEFAULT_EXTENSION when
          * the token was never assigned. Says nothing about existence.
          */
         extension_id_type extension_by_token(token_id_type token_id) const;

         /// True once the token was assigned explicitly or minted at least once
         bool is_assigned(token_id_type token_id) const;

         token_id_type token_by_extension_and_index(extension_id_type extension_id, uint64_t index) const;

         /// Live tokens across all extensions
         uint64_t total_supply() const { return _total_supply; }

         token_id_type token_by_index(uint64_t global_index) const;

         /// Sum of the realized supplies recorded by finalize_distribution
         uint64_t finalized_supply() const { return _finalized_supply; }

         /**
          * Replace the extension's target supply with its live count and add
          * that count to the finalized supply
          * @return The realized supply
          */
         uint64_t finalize_distribution(extension_id_type extension_id);

         /// True if the token is alive in the extension it resolves to
         bool exists(token_id_type token_id) const;

         /// Fails with not_found_exception if the token does not exist
         const account_id_type &owner_of(token_id_type token_id) const;

         /// Position of a live token within its extension
         uint64_t position_in_extension(token_id_type token_id) const;

         /// Add a token to the extension it resolves to
         void insert_token(token_id_type token_id, const account_id_type &owner);

         void erase_token(token_id_type token_id);

         /// Change the owner of a live token without moving it
         void set_owner(token_id_type token_id, const account_id_type &owner);

         /// Recount live tokens by walking every extension
         uint64_t count_live_tokens() const;

         registry_snapshot snapshot() const;

      private:
         extension_object &mutable_extension_of(token_id_type token_id);

         std::deque<extension_object> _extensions;
         std::unordered_map<token_id_type, extension_id_type> _token_extension;
         uint64_t _total_supply = 0;
         uint64_t _finalized_supply = 0;
      };

   }
} // tessera::chain
