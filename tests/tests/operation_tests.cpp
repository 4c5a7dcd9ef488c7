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

#include <tessera/chain/database.hpp>
#include <tessera/chain/exceptions.hpp>
#include <tessera/chain/registry_config.hpp>
#include <tessera/protocol/operations.hpp>

#include <fc/filesystem.hpp>
#include <fc/io/json.hpp>

#include "../common/registry_fixture.hpp"

using namespace tessera::chain;
using namespace tessera::chain::test;

BOOST_FIXTURE_TEST_SUITE( operation_tests, registry_fixture )

BOOST_AUTO_TEST_CASE( structural_validation ) {
   try {
      extension_create_operation create_op;
      create_op.target_supply = 3;
      create_op.token_ids = {1, 2, 3};
      create_op.validate();
      create_op.token_ids = {1, 2, 1};
      BOOST_CHECK_THROW(create_op.validate(), fc::assert_exception);
      BOOST_CHECK_THROW(operation_validate(operation(create_op)), fc::assert_exception);

      safe_transfer_operation safe_op;
      safe_op.data.resize(TESSERA_MAX_RECEIVER_DATA_SIZE);
      safe_op.validate();
      safe_op.data.push_back('x');
      BOOST_CHECK_THROW(safe_op.validate(), fc::assert_exception);

      set_token_uri_operation uri_op;
      uri_op.uri_suffix = std::string(TESSERA_MAX_URI_SUFFIX_LENGTH, 'u');
      uri_op.validate();
      uri_op.uri_suffix.push_back('u');
      BOOST_CHECK_THROW(uri_op.validate(), fc::assert_exception);

      operation_validate(operation(mint_operation()));
      operation_validate(operation(finalize_distribution_operation()));
   } FC_LOG_AND_RETHROW()
}

/**
 * Operations decoded from JSON apply like operations built in code
 */
BOOST_AUTO_TEST_CASE( operations_decode_from_json ) {
   try {
      const std::string ops_json = R"([
         [0, {"target_supply": 2, "token_ids": []}],
         [0, {"target_supply": 2, "token_ids": [10, 11]}],
         [1, {"to": 1, "token_id": 10}],
         [1, {"to": 1, "token_id": 1}],
         [4, {"sender": 1, "from": 1, "to": 2, "token_id": 10, "data": "6869"}],
         [5, {"sender": 1, "to": 3, "token_id": 1}],
         [3, {"sender": 3, "from": 1, "to": 2, "token_id": 1}],
         [7, {"extension_id": 0}],
         [8, {"token_id": 1, "uri_suffix": "one.json"}],
         [6, {"owner": 2, "operator_account": 3, "approved": true}],
         [2, {"token_id": 10}]
      ])";

      const auto ops = fc::json::from_string(ops_json).as<vector<operation>>(TESSERA_MAX_NESTED_OBJECTS);
      BOOST_REQUIRE_EQUAL(ops.size(), 11u);
      BOOST_CHECK_EQUAL(ops[4].which(), operation::tag<safe_transfer_operation>::value);

      const safe_transfer_operation &safe_op = ops[4].get<safe_transfer_operation>();
      BOOST_CHECK(safe_op.data == vector<char>({'h', 'i'}));
      BOOST_CHECK(safe_op.to == account_id_type(2));

      const operation_result created = db.apply_operation(ops[0]);
      BOOST_CHECK_EQUAL(created.get<extension_id_type>(), 0u);
      BOOST_CHECK_EQUAL(db.apply_operation(ops[1]).get<extension_id_type>(), 1u);
      for (size_t i = 2; i < ops.size(); ++i) {
         db.apply_operation(ops[i]);
      }

      const account_id_type first(1), second(2), third(3);
      BOOST_CHECK(db.owner_of(1) == second);
      BOOST_CHECK(!db.exists(10));
      BOOST_CHECK_EQUAL(db.supply_of_extension(0), 1u);
      BOOST_CHECK_EQUAL(db.total_supply(), 1u);
      BOOST_CHECK_EQUAL(db.token_uri(1), "one.json");
      BOOST_CHECK(db.is_approved_for_all(second, third));
      BOOST_CHECK_EQUAL(db.balance_of(first), 0u);

      // Every operation encodes back to the tag and fields it was read from
      const fc::variant encoded(ops[2], TESSERA_MAX_NESTED_OBJECTS);
      BOOST_CHECK_EQUAL(encoded.get_array()[0].as_uint64(), 1u);
      BOOST_CHECK_EQUAL(encoded.get_array()[1]["token_id"].as_uint64(), 10u);
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( events_are_reflected ) {
   try {
      ACTORS((alice));
      create_extension(1);
      mint(alice_id, 4);

      const fc::variant v(db.get_applied_events().back(), TESSERA_MAX_NESTED_OBJECTS);
      BOOST_CHECK_EQUAL(v.get_array()[0].as_uint64(), 0u);
      BOOST_CHECK_EQUAL(v.get_array()[1]["from"].as_uint64(), 0u);
      BOOST_CHECK_EQUAL(v.get_array()[1]["to"].as_uint64(), alice_id.instance);
      BOOST_CHECK_EQUAL(v.get_array()[1]["token_id"].as_uint64(), 4u);
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( registry_errors_share_a_base ) {
   try {
      BOOST_CHECK_EQUAL(registry_exception::code_value, 4000000);
      BOOST_CHECK_EQUAL(not_found_exception::code_value, 4010000);
      BOOST_CHECK_EQUAL(reentrant_call_exception::code_value, 4090000);

      create_extension(1);
      TESSERA_REQUIRE_THROW(burn(1), registry_exception);
      TESSERA_REQUIRE_THROW(db.token_by_index(0), registry_exception);

      try {
         db.owner_of(1);
         BOOST_FAIL("owner_of of a missing token should throw");
      } catch (const fc::exception &e) {
         BOOST_CHECK_EQUAL(e.code(), not_found_exception::code_value);
      }
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( configuration_loads_from_json_file ) {
   try {
      fc::temp_directory dir(fc::temp_directory_path());
      const fc::path config_file = dir.path() / "registry.json";

      registry_config written;
      written.base_uri = "ipfs://collection/";
      fc::json::save_to_file(written, config_file);

      const registry_config loaded = load_registry_config(config_file.string());
      BOOST_CHECK_EQUAL(loaded.base_uri, "ipfs://collection/");

      database configured(loaded);
      extension_create_operation create_op;
      create_op.target_supply = 1;
      configured.apply_operation(create_op);
      mint_operation mint_op;
      mint_op.to = account_id_type(1);
      mint_op.token_id = 12;
      configured.apply_operation(mint_op);
      BOOST_CHECK_EQUAL(configured.token_uri(12), "ipfs://collection/12");

      BOOST_CHECK_THROW(load_registry_config((dir.path() / "missing.json").string()), fc::exception);
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()
