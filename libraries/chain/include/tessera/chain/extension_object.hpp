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

#include <tessera/chain/enumerable_map.hpp>
#include <tessera/protocol/types.hpp>

#include <fc/reflect/reflect.hpp>

/**
 * @defgroup extensions Supply extensions
 */

namespace tessera {
   namespace chain {
      using protocol::account_id_type;
      using protocol::extension_id_type;
      using protocol::token_id_type;
      using std::vector;

      /**
       *  @brief A sub-collection of the registry with its own supply
       *  @ingroup extensions
       */
      class extension_object {
      public:
         extension_id_type id = 0;

         /// Supply pledged at creation; replaced by the realized supply on finalization
         uint64_t target_supply = 0;

         bool finalized = false;

         /// Live tokens of this extension and their owners
         enumerable_map<token_id_type, account_id_type> tokens;

         uint64_t live_count() const { return tokens.length(); }
      };

      struct token_ownership {
         token_id_type token_id = 0;
         account_id_type owner;
      };

      /// Reflected copy of an extension, in enumeration order
      struct extension_snapshot {
         extension_id_type id = 0;
         uint64_t target_supply = 0;
         bool finalized = false;
         vector<token_ownership> tokens;
      };

      struct registry_snapshot {
         uint64_t total_supply = 0;
         uint64_t finalized_supply = 0;
         vector<extension_snapshot> extensions;
      };

      extension_snapshot make_snapshot(const extension_object &ext);

   }
} // tessera::chain

FC_REFLECT( tessera::chain::token_ownership, (token_id)(owner) )
FC_REFLECT( tessera::chain::extension_snapshot, (id)(target_supply)(finalized)(tokens) )
FC_REFLECT( tessera::chain::registry_snapshot, (total_supply)(finalized_supply)(extensions) )
