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

#include <tessera/chain/exceptions.hpp>

#include <boost/multi_index_container.hpp>
#include <boost/multi_index/hashed_index.hpp>
#include <boost/multi_index/member.hpp>

#include <cstdint>
#include <utility>

namespace tessera {
   namespace chain {
      using boost::multi_index_container;
      using namespace boost::multi_index;

      struct by_key;
      struct by_position;

      /**
       *  @brief Map with constant time lookup by key and by position
       *
       *  Entries are numbered 0..length()-1 in insertion order. Removing an
       *  entry moves the last entry into the vacated position, so positions
       *  are dense but enumeration order does not survive a removal.
       */
      template<typename Key, typename Value>
      class enumerable_map {
      public:
         struct entry {
            Key      key;
            Value    value;
            uint64_t position;
         };

         typedef multi_index_container<
            entry,
            indexed_by<
               hashed_unique< tag<by_key>, member<entry, Key, &entry::key> >,
               hashed_unique< tag<by_position>, member<entry, uint64_t, &entry::position> >
            >
         > index_type;

         /**
          * Insert a new entry at the end, or update the value of an existing
          * entry without moving it
          * @return True if a new entry was inserted
          */
         bool set(const Key &key, const Value &value) {
            auto &idx = _entries.template get<by_key>();
            auto itr = idx.find(key);
            if (itr != idx.end()) {
               idx.modify(itr, [&value](entry &e) { e.value = value; });
               return false;
            }
            _entries.insert(entry{key, value, uint64_t(_entries.size())});
            return true;
         }

         const Value &get(const Key &key) const {
            const auto &idx = _entries.template get<by_key>();
            auto itr = idx.find(key);
            TESSERA_ASSERT(itr != idx.end(), not_found_exception,
                           "No entry exists for ${key}", ("key", key));
            return itr->value;
         }

         /**
          * Remove an entry, filling its position with the last entry
          * @return False if the key was absent
          */
         bool remove(const Key &key) {
            auto &idx = _entries.template get<by_key>();
            auto itr = idx.find(key);
            if (itr == idx.end()) {
               return false;
            }

            const uint64_t gap = itr->position;
            const uint64_t last = _entries.size() - 1;
            idx.erase(itr);

            if (gap != last) {
               auto &pos_idx = _entries.template get<by_position>();
               auto moved = pos_idx.find(last);
               FC_ASSERT(moved != pos_idx.end(), "Entry positions are not dense");
               pos_idx.modify(moved, [gap](entry &e) { e.position = gap; });
            }
            return true;
         }

         bool contains(const Key &key) const {
            const auto &idx = _entries.template get<by_key>();
            return idx.find(key) != idx.end();
         }

         uint64_t length() const {
            return _entries.size();
         }

         std::pair<Key, Value> at(uint64_t position) const {
            TESSERA_ASSERT(position < _entries.size(), out_of_range_exception,
                           "Position ${p} is out of range for ${n} entries",
                           ("p", position)("n", _entries.size()));
            const auto &pos_idx = _entries.template get<by_position>();
            auto itr = pos_idx.find(position);
            FC_ASSERT(itr != pos_idx.end(), "Entry positions are not dense");
            return std::make_pair(itr->key, itr->value);
         }

         uint64_t position_of(const Key &key) const {
            const auto &idx = _entries.template get<by_key>();
            auto itr = idx.find(key);
            TESSERA_ASSERT(itr != idx.end(), not_found_exception,
                           "No entry exists for ${key}", ("key", key));
            return itr->position;
         }

         /// Exchange the entries at two positions
         void swap_positions(uint64_t a, uint64_t b) {
            const uint64_t n = _entries.size();
            TESSERA_ASSERT(a < n && b < n, out_of_range_exception,
                           "Cannot swap positions ${a} and ${b} of ${n} entries",
                           ("a", a)("b", b)("n", n));
            if (a == b) {
               return;
            }

            // Park the first entry on the unused position n while the second moves
            auto &pos_idx = _entries.template get<by_position>();
            auto itr_a = pos_idx.find(a);
            auto itr_b = pos_idx.find(b);
            pos_idx.modify(itr_a, [n](entry &e) { e.position = n; });
            pos_idx.modify(itr_b, [a](entry &e) { e.position = a; });
            pos_idx.modify(itr_a, [b](entry &e) { e.position = b; });
         }

      private:
         index_type _entries;
      };

   }
} // tessera::chain
