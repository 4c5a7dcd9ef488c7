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

namespace tessera {
   namespace chain {

      /**
       *  @brief Set with constant time membership and positional access
       *
       *  Same ordering contract as enumerable_map: removal is swap-with-last.
       */
      template<typename Key>
      class enumerable_set {
      public:
         /// @return True if the key was not already present
         bool add(const Key &key) {
            if (_map.contains(key)) {
               return false;
            }
            return _map.set(key, member_flag());
         }

         bool remove(const Key &key) { return _map.remove(key); }

         bool contains(const Key &key) const { return _map.contains(key); }

         uint64_t length() const { return _map.length(); }

         Key at(uint64_t position) const { return _map.at(position).first; }

         uint64_t position_of(const Key &key) const { return _map.position_of(key); }

         void swap_positions(uint64_t a, uint64_t b) { _map.swap_positions(a, b); }

      private:
         struct member_flag {};

         enumerable_map<Key, member_flag> _map;
      };

   }
} // tessera::chain
