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

#include "../common/registry_fixture.hpp"

#include <functional>

using namespace tessera::chain;
using namespace tessera::chain::test;

namespace {
   /// Receiver whose answer and side effects are set by each test
   struct scripted_receiver : public token_receiver {
      uint32_t on_token_received(const account_id_type &operator_account, const account_id_type &from,
                                 token_id_type token_id, const std::vector<char> &data) override {
         ++calls;
         last_operator = operator_account;
         last_from = from;
         last_token = token_id;
         last_data = data;
         if (during_call) {
            during_call();
         }
         return answer;
      }

      uint32_t answer = TESSERA_TOKEN_RECEIVED_ACK;
      std::function<void()> during_call;

      int calls = 0;
      account_id_type last_operator;
      account_id_type last_from;
      token_id_type last_token = 0;
      std::vector<char> last_data;
   };
}

BOOST_FIXTURE_TEST_SUITE( safe_transfer_tests, registry_fixture )

BOOST_AUTO_TEST_CASE( plain_recipient_needs_no_acknowledgement ) {
   try {
      ACTORS((alice)(bob));
      create_extension(2);
      mint(alice_id, 1);

      BOOST_CHECK(!db.is_programmable(bob_id));
      safe_transfer(alice_id, bob_id, 1);
      BOOST_CHECK(db.owner_of(1) == bob_id);
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( receiver_sees_transfer_already_applied ) {
   try {
      ACTORS((alice)(vault));
      create_extension(2);
      mint(alice_id, 1);

      auto receiver = std::make_shared<scripted_receiver>();
      db.register_receiver(vault_id, receiver);
      BOOST_CHECK(db.is_programmable(vault_id));

      account_id_type owner_seen;
      uint64_t balance_seen = 0;
      receiver->during_call = [&]() {
         owner_seen = db.owner_of(1);
         balance_seen = db.balance_of(vault_id);
      };

      const vector<char> payload = {'h', 'i'};
      safe_transfer(alice_id, vault_id, 1, payload);

      BOOST_CHECK_EQUAL(receiver->calls, 1);
      BOOST_CHECK(receiver->last_operator == alice_id);
      BOOST_CHECK(receiver->last_from == alice_id);
      BOOST_CHECK_EQUAL(receiver->last_token, 1u);
      BOOST_CHECK(receiver->last_data == payload);
      BOOST_CHECK(owner_seen == vault_id);
      BOOST_CHECK_EQUAL(balance_seen, 1u);
      BOOST_CHECK(db.owner_of(1) == vault_id);

      // Plain transfers never notify
      transfer(vault_id, alice_id, 1);
      transfer(alice_id, vault_id, 1);
      BOOST_CHECK_EQUAL(receiver->calls, 1);
   } FC_LOG_AND_RETHROW()
}

/**
 * A declined transfer leaves holder sets, approvals and events exactly as before
 */
BOOST_AUTO_TEST_CASE( rejected_transfer_is_undone_exactly ) {
   try {
      ACTORS((alice)(bob)(vault));
      create_extension(10);
      for (token_id_type t = 1; t <= 5; ++t) {
         mint(alice_id, t);
      }
      mint(vault_id, 9);
      approve(alice_id, bob_id, 2);

      auto receiver = std::make_shared<scripted_receiver>();
      receiver->answer = 0xdeadbeef;
      db.register_receiver(vault_id, receiver);

      const vector<token_id_type> alice_before = tokens_of(alice_id);
      const vector<token_id_type> vault_before = tokens_of(vault_id);
      const vector<token_id_type> global_before = all_tokens();
      const size_t events_before = db.get_applied_events().size();

      TESSERA_REQUIRE_THROW(safe_transfer(alice_id, vault_id, 2), transfer_rejected_exception);
      BOOST_CHECK_EQUAL(receiver->calls, 1);

      BOOST_CHECK(db.owner_of(2) == alice_id);
      BOOST_CHECK(db.get_approved(2) == bob_id);
      BOOST_CHECK(tokens_of(alice_id) == alice_before);
      BOOST_CHECK(tokens_of(vault_id) == vault_before);
      BOOST_CHECK(all_tokens() == global_before);
      BOOST_CHECK_EQUAL(db.get_applied_events().size(), events_before);

      // The next operation does not publish the discarded event
      mint(bob_id, 6);
      BOOST_CHECK_EQUAL(db.get_applied_events().size(), events_before + 1);
      BOOST_CHECK(db.get_applied_events().back().get<transfer_event>().from == TESSERA_NULL_ACCOUNT);

      verify_registry_consistency();
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( receiver_failure_undoes_transfer ) {
   try {
      ACTORS((alice)(vault));
      create_extension(3);
      mint(alice_id, 1);
      mint(alice_id, 2);

      auto receiver = std::make_shared<scripted_receiver>();
      receiver->during_call = []() { FC_THROW("vault is closed"); };
      db.register_receiver(vault_id, receiver);

      const vector<token_id_type> alice_before = tokens_of(alice_id);
      REQUIRE_EXCEPTION_WITH_TEXT(safe_transfer(alice_id, vault_id, 1), "vault is closed");
      BOOST_CHECK(db.owner_of(1) == alice_id);
      BOOST_CHECK(tokens_of(alice_id) == alice_before);
      BOOST_CHECK_EQUAL(db.balance_of(vault_id), 0u);

      // A receiver that throws a standard exception is undone the same way
      receiver->during_call = []() { throw std::runtime_error("disk full"); };
      BOOST_CHECK_THROW(safe_transfer(alice_id, vault_id, 2), fc::exception);
      BOOST_CHECK(db.owner_of(2) == alice_id);

      // Once unregistered the account takes tokens without being asked
      db.unregister_receiver(vault_id);
      safe_transfer(alice_id, vault_id, 1);
      BOOST_CHECK(db.owner_of(1) == vault_id);
      BOOST_CHECK_EQUAL(receiver->calls, 2);

      verify_registry_consistency();
   } FC_LOG_AND_RETHROW()
}

/**
 * Writes issued from inside a receiver are refused
 */
BOOST_AUTO_TEST_CASE( receiver_cannot_reenter ) {
   try {
      ACTORS((alice)(bob)(vault));
      create_extension(3);
      mint(alice_id, 1);

      auto receiver = std::make_shared<scripted_receiver>();
      bool reentry_refused = false;
      receiver->during_call = [&]() {
         try {
            transfer(vault_id, bob_id, 1);
         } catch (const reentrant_call_exception &) {
            reentry_refused = true;
         }
      };
      db.register_receiver(vault_id, receiver);

      safe_transfer(alice_id, vault_id, 1);
      BOOST_CHECK(reentry_refused);
      BOOST_CHECK(db.owner_of(1) == vault_id);

      // Reads stay available and writes are accepted again afterwards
      transfer(vault_id, bob_id, 1);
      BOOST_CHECK(db.owner_of(1) == bob_id);

      // A receiver that lets the refusal escape aborts its own transfer
      receiver->during_call = [&]() { mint(bob_id, 2); };
      transfer(bob_id, alice_id, 1);
      TESSERA_REQUIRE_THROW(safe_transfer(alice_id, vault_id, 1), reentrant_call_exception);
      BOOST_CHECK(db.owner_of(1) == alice_id);
      BOOST_CHECK(!db.exists(2));

      verify_registry_consistency();
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( receiver_may_unregister_itself ) {
   try {
      ACTORS((alice)(vault));
      create_extension(2);
      mint(alice_id, 1);

      auto receiver = std::make_shared<scripted_receiver>();
      db.register_receiver(vault_id, receiver);
      receiver->during_call = [&]() { db.unregister_receiver(vault_id); };
      receiver.reset();

      safe_transfer(alice_id, vault_id, 1);
      BOOST_CHECK(db.owner_of(1) == vault_id);
      BOOST_CHECK(!db.is_programmable(vault_id));
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( safe_transfer_checks_like_transfer ) {
   try {
      ACTORS((alice)(bob)(vault));
      create_extension(2);
      mint(alice_id, 1);

      auto receiver = std::make_shared<scripted_receiver>();
      db.register_receiver(vault_id, receiver);

      TESSERA_REQUIRE_THROW(safe_transfer(alice_id, vault_id, 2), not_found_exception);
      TESSERA_REQUIRE_THROW(safe_transfer(bob_id, vault_id, 1), not_authorized_exception);
      TESSERA_REQUIRE_THROW(safe_transfer(alice_id, TESSERA_NULL_ACCOUNT, 1), invalid_recipient_exception);
      BOOST_CHECK_THROW(safe_transfer(alice_id, vault_id, 1, vector<char>(TESSERA_MAX_RECEIVER_DATA_SIZE + 1)),
                        fc::assert_exception);
      BOOST_CHECK_EQUAL(receiver->calls, 0);

      TESSERA_REQUIRE_THROW(db.register_receiver(TESSERA_NULL_ACCOUNT, receiver), fc::assert_exception);
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()
