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
#include <boost/test/unit_test.hpp>

#include <tessera/chain/enumerable_map.hpp>
#include <tessera/chain/enumerable_set.hpp>
#include <tessera/protocol/types.hpp>

#include "../common/registry_fixture.hpp"

#include <set>

using namespace tessera::chain;
using tessera::protocol::account_id_type;
using tessera::protocol::token_id_type;

namespace {
   /// Every key of the map, read positionally
   template<typename Map>
   std::set<token_id_type> keys_by_position(const Map &m) {
      std::set<token_id_type> keys;
      for (uint64_t i = 0; i < m.length(); ++i) {
         BOOST_REQUIRE(keys.insert(m.at(i).first).second);
      }
      return keys;
   }
}

BOOST_AUTO_TEST_SUITE( enumerable_map_tests )

/**
 * Insertion appends, updating an existing key keeps its position
 */
BOOST_AUTO_TEST_CASE( set_appends_and_updates_in_place ) {
   try {
      enumerable_map<token_id_type, account_id_type> m;
      const account_id_type alice(1), bob(2);

      BOOST_CHECK_EQUAL(m.length(), 0u);
      BOOST_CHECK(m.set(10, alice));
      BOOST_CHECK(m.set(20, alice));
      BOOST_CHECK(m.set(30, bob));
      BOOST_REQUIRE_EQUAL(m.length(), 3u);

      BOOST_CHECK_EQUAL(m.at(0).first, 10u);
      BOOST_CHECK_EQUAL(m.at(1).first, 20u);
      BOOST_CHECK_EQUAL(m.at(2).first, 30u);

      // Re-setting does not move the entry
      BOOST_CHECK(!m.set(20, bob));
      BOOST_REQUIRE_EQUAL(m.length(), 3u);
      BOOST_CHECK_EQUAL(m.position_of(20), 1u);
      BOOST_CHECK(m.get(20) == bob);
      BOOST_CHECK(m.at(1).second == bob);

      BOOST_CHECK(m.contains(30));
      BOOST_CHECK(!m.contains(40));
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( get_of_absent_key_fails ) {
   try {
      enumerable_map<token_id_type, account_id_type> m;
      TESSERA_REQUIRE_THROW(m.get(1), not_found_exception);
      TESSERA_REQUIRE_THROW(m.position_of(1), not_found_exception);

      m.set(1, account_id_type(7));
      m.remove(1);
      TESSERA_REQUIRE_THROW(m.get(1), not_found_exception);
   } FC_LOG_AND_RETHROW()
}

/**
 * Removal fills the gap with the last entry and leaves every other position alone
 */
BOOST_AUTO_TEST_CASE( remove_moves_last_entry_into_gap ) {
   try {
      enumerable_map<token_id_type, account_id_type> m;
      for (token_id_type t = 1; t <= 5; ++t) {
         m.set(t, account_id_type(t));
      }

      BOOST_CHECK(m.remove(2));
      BOOST_REQUIRE_EQUAL(m.length(), 4u);
      BOOST_CHECK_EQUAL(m.at(0).first, 1u);
      BOOST_CHECK_EQUAL(m.at(1).first, 5u);
      BOOST_CHECK_EQUAL(m.at(2).first, 3u);
      BOOST_CHECK_EQUAL(m.at(3).first, 4u);
      BOOST_CHECK_EQUAL(m.position_of(5), 1u);
      BOOST_CHECK(m.get(5) == account_id_type(5));

      // Removing the last entry moves nothing
      BOOST_CHECK(m.remove(4));
      BOOST_CHECK_EQUAL(m.at(0).first, 1u);
      BOOST_CHECK_EQUAL(m.at(1).first, 5u);
      BOOST_CHECK_EQUAL(m.at(2).first, 3u);

      // Absent keys are a no-op
      BOOST_CHECK(!m.remove(2));
      BOOST_CHECK(!m.remove(99));
      BOOST_CHECK_EQUAL(m.length(), 3u);
   } FC_LOG_AND_RETHROW()
}

/**
 * Positional access fails exactly at the length
 */
BOOST_AUTO_TEST_CASE( at_fails_at_length ) {
   try {
      enumerable_map<token_id_type, account_id_type> m;
      TESSERA_REQUIRE_THROW(m.at(0), out_of_range_exception);

      m.set(100, account_id_type(1));
      m.set(200, account_id_type(1));
      BOOST_CHECK_EQUAL(m.at(1).first, 200u);
      TESSERA_REQUIRE_THROW(m.at(2), out_of_range_exception);
      TESSERA_REQUIRE_THROW(m.at(uint64_t(-1)), out_of_range_exception);
   } FC_LOG_AND_RETHROW()
}

/**
 * After any mix of insertions and removals positions stay dense and every key appears once
 */
BOOST_AUTO_TEST_CASE( positions_stay_dense ) {
   try {
      enumerable_map<token_id_type, account_id_type> m;
      std::set<token_id_type> expected;

      for (token_id_type t = 0; t < 64; ++t) {
         m.set(t, account_id_type(t % 5 + 1));
         expected.insert(t);
      }
      for (token_id_type t = 0; t < 64; t += 3) {
         BOOST_CHECK(m.remove(t));
         expected.erase(t);
      }
      for (token_id_type t = 100; t < 110; ++t) {
         m.set(t, account_id_type(9));
         expected.insert(t);
      }

      BOOST_REQUIRE_EQUAL(m.length(), expected.size());
      BOOST_CHECK(keys_by_position(m) == expected);
      for (uint64_t i = 0; i < m.length(); ++i) {
         BOOST_CHECK_EQUAL(m.position_of(m.at(i).first), i);
      }
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( swap_positions_exchanges_entries ) {
   try {
      enumerable_map<token_id_type, account_id_type> m;
      m.set(1, account_id_type(1));
      m.set(2, account_id_type(2));
      m.set(3, account_id_type(3));

      m.swap_positions(0, 2);
      BOOST_CHECK_EQUAL(m.at(0).first, 3u);
      BOOST_CHECK_EQUAL(m.at(2).first, 1u);
      BOOST_CHECK(m.get(1) == account_id_type(1));
      BOOST_CHECK(m.get(3) == account_id_type(3));

      m.swap_positions(1, 1);
      BOOST_CHECK_EQUAL(m.at(1).first, 2u);

      TESSERA_REQUIRE_THROW(m.swap_positions(0, 3), out_of_range_exception);
      BOOST_CHECK(keys_by_position(m) == std::set<token_id_type>({1, 2, 3}));
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( set_rejects_duplicates ) {
   try {
      enumerable_set<token_id_type> s;
      BOOST_CHECK(s.add(5));
      BOOST_CHECK(s.add(6));
      BOOST_CHECK(!s.add(5));
      BOOST_CHECK_EQUAL(s.length(), 2u);
      BOOST_CHECK_EQUAL(s.position_of(5), 0u);

      BOOST_CHECK(s.remove(5));
      BOOST_CHECK(!s.remove(5));
      BOOST_CHECK(!s.contains(5));
      BOOST_CHECK_EQUAL(s.at(0), 6u);
      TESSERA_REQUIRE_THROW(s.at(1), out_of_range_exception);
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()
