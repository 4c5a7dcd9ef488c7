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

#include <fc/variant.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace tessera {
   namespace protocol {
      using std::string;
      using std::vector;

      /// Global identifier of a token, unique while the token exists
      typedef uint64_t token_id_type;

      /// Ordinal of an extension in the registry's extension sequence
      typedef uint32_t extension_id_type;

      /**
       * @brief Identity of a holder, operator or recipient
       *
       * Instance zero is reserved for the null identity.
       */
      struct account_id_type {
         account_id_type() = default;
         explicit account_id_type(uint64_t i) : instance(i) {}

         bool is_null() const { return instance == 0; }

         friend bool operator==(const account_id_type &a, const account_id_type &b) {
            return a.instance == b.instance;
         }
         friend bool operator!=(const account_id_type &a, const account_id_type &b) {
            return a.instance != b.instance;
         }
         friend bool operator<(const account_id_type &a, const account_id_type &b) {
            return a.instance < b.instance;
         }

         uint64_t instance = 0;
      };

      /// Result of an evaluation step that produces nothing
      struct void_result {};

   }
} // tessera::protocol

namespace fc {
   void to_variant(const tessera::protocol::account_id_type &id, fc::variant &v, uint32_t max_depth = 1);
   void from_variant(const fc::variant &v, tessera::protocol::account_id_type &id, uint32_t max_depth = 1);
}

FC_REFLECT_EMPTY( tessera::protocol::void_result )
