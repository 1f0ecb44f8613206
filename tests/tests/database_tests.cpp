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

#include <fc/io/json.hpp>

#include <stdexcept>

#include "../common/ledger_fixture.hpp"

using namespace lazymint::chain;
using namespace lazymint::chain::test;

BOOST_FIXTURE_TEST_SUITE( database_tests, ledger_fixture )

BOOST_AUTO_TEST_CASE( apply_operation_results ) {
   try {
      ACTORS((alice)(bob));

      token_prepare_operation prepare_op;
      prepare_op.creator = alice_id;
      prepare_op.descriptor = "QmArt";
      const operation_result prepared = db.apply_operation(prepare_op);
      BOOST_REQUIRE(prepared.which() == operation_result::tag<token_id_type>::value);
      BOOST_CHECK_EQUAL(prepared.get<token_id_type>(), 1u);

      token_transfer_operation transfer_op;
      transfer_op.caller = alice_id;
      transfer_op.from = alice_id;
      transfer_op.to = bob_id;
      transfer_op.token_id = 1;
      const operation_result transferred = db.apply_operation(transfer_op);
      BOOST_CHECK(transferred.which() == operation_result::tag<void_result>::value);
      BOOST_CHECK(*db.owner_of(1) == bob_id);
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( submitted_operations_are_validated ) {
   try {
      ACTOR(alice);
      const token_id_type id = db.prepare(alice_id, "QmArt");

      token_prepare_operation prepare_op;
      prepare_op.creator = alice_id;
      LAZYMINT_REQUIRE_THROW(prepare_op.validate(), empty_descriptor);

      token_prepare_operation anonymous_op;
      anonymous_op.descriptor = "QmNobody";
      REQUIRE_EXCEPTION_WITH_TEXT(db.apply_operation(anonymous_op), "null account may not prepare a token");
      BOOST_CHECK_EQUAL(db.current_token_id(), id);

      royalty_set_operation royalty_op;
      royalty_op.token_id = id;
      REQUIRE_EXCEPTION_WITH_TEXT(db.apply_operation(royalty_op), "null account may not set a royalty");

      token_transfer_operation transfer_op;
      transfer_op.from = alice_id;
      transfer_op.to = alice_id;
      transfer_op.token_id = id;
      LAZYMINT_REQUIRE_THROW(db.apply_operation(transfer_op), fc::assert_exception);

      base_path_set_operation path_op;
      path_op.path = "https://";
      LAZYMINT_REQUIRE_THROW(db.apply_operation(path_op), fc::assert_exception);

      BOOST_TEST_MESSAGE("Virtual operations may not be submitted");
      REQUIRE_EXCEPTION_WITH_TEXT(db.apply_operation(token_minted_operation(id, alice_id)),
                                  "Virtual operations may not be submitted");
      BOOST_CHECK(!db.is_minted(id));
      LAZYMINT_REQUIRE_THROW(token_minted_operation(id, alice_id).validate(), fc::exception);

      BOOST_CHECK(!db.is_applying());
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( base_descriptor_path ) {
   try {
      ACTORS((alice)(bob));
      const token_id_type id = db.prepare(alice_id, "QmArt");

      BOOST_CHECK_EQUAL(db.descriptors().base_path(), "ipfs://");
      BOOST_CHECK_EQUAL(db.token_descriptor(id), "ipfs://QmArt");

      BOOST_TEST_MESSAGE("Alice is attempting to change the base path");
      REQUIRE_EXCEPTION_WITH_TEXT(db.set_base_descriptor_path(alice_id, "https://"), "not the ledger administrator");
      LAZYMINT_REQUIRE_THROW(db.set_base_descriptor_path(bob_id, "https://"), unauthorized);
      BOOST_CHECK_EQUAL(db.token_descriptor(id), "ipfs://QmArt");

      BOOST_TEST_MESSAGE("The administrator is changing the base path");
      db.set_base_descriptor_path(admin_id, "https://cdn.example/");
      BOOST_CHECK_EQUAL(db.token_descriptor(id), "https://cdn.example/QmArt");

      // Descriptors themselves never change
      BOOST_CHECK_EQUAL(db.registry().descriptor_of(id), "QmArt");

      db.set_base_descriptor_path(admin_id, "");
      BOOST_CHECK_EQUAL(db.token_descriptor(id), "QmArt");
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( ledger_without_administrator ) {
   try {
      database unadministered;
      const account_id_type someone(1);

      BOOST_CHECK(!unadministered.admin().is_admin(someone));
      LAZYMINT_REQUIRE_THROW(unadministered.set_base_descriptor_path(someone, "x"), unauthorized);
      BOOST_CHECK_EQUAL(unadministered.descriptors().base_path(), "");

      BOOST_TEST_MESSAGE("Configuring the unused ledger");
      ledger_config cfg;
      cfg.admin_account = someone;
      cfg.base_descriptor_path = "ar://";
      unadministered.open(cfg);
      unadministered.set_base_descriptor_path(someone, "ar://v2/");
      BOOST_CHECK_EQUAL(unadministered.descriptors().base_path(), "ar://v2/");

      BOOST_TEST_MESSAGE("A ledger in use may not be reconfigured");
      unadministered.prepare(someone, "QmInUse");
      LAZYMINT_REQUIRE_THROW(unadministered.open(cfg), fc::exception);
   } FC_LOG_AND_RETHROW()
}

/**
 * Subscribers receive committed notifications only, in sequence
 */
BOOST_AUTO_TEST_CASE( applied_operation_signal ) {
   try {
      ACTORS((alice)(bob));

      db.prepare(alice_id, "Qm1");
      LAZYMINT_REQUIRE_THROW(db.prepare(bob_id, "Qm1"), duplicate_metadata);
      const token_id_type id = db.prepare(bob_id, "Qm2");
      LAZYMINT_REQUIRE_THROW(db.transfer(alice_id, bob_id, alice_id, id), transfer_not_authorized);
      db.set_royalty(bob_id, id, bob_id, 100);

      BOOST_REQUIRE_EQUAL(published.size(), 3u);
      for (std::size_t i = 0; i < published.size(); ++i) {
         BOOST_CHECK_EQUAL(published[i].id, i);
      }
      BOOST_CHECK(published[0].op.which() == operation::tag<token_prepared_operation>::value);
      BOOST_CHECK(published[1].op.which() == operation::tag<token_prepared_operation>::value);
      BOOST_CHECK(published[2].op.which() == operation::tag<royalty_updated_operation>::value);

      BOOST_CHECK_EQUAL(db.get_applied_operations().size(), 3u);
      BOOST_CHECK_EQUAL(db.get_applied_operations(2).size(), 1u);
      BOOST_CHECK(db.get_applied_operations(3).empty());
   } FC_LOG_AND_RETHROW()
}

/**
 * A failing subscriber does not turn a committed operation into a failure
 */
BOOST_AUTO_TEST_CASE( subscriber_failures_are_contained ) {
   try {
      ACTOR(alice);

      boost::signals2::scoped_connection std_failure = db.applied_operation.connect(
         [](const operation_history_object&) { throw std::runtime_error("subscriber out of memory"); });
      boost::signals2::scoped_connection fc_failure = db.applied_operation.connect(
         [](const operation_history_object&) { FC_THROW("subscriber unavailable"); });

      const token_id_type id = db.prepare(alice_id, "QmArt");
      BOOST_CHECK_EQUAL(id, 1u);
      BOOST_CHECK_EQUAL(db.creator_of(id).instance, alice_id.instance);
      BOOST_CHECK_EQUAL(published.size(), 1u);
      BOOST_CHECK(!db.is_applying());

      std_failure.disconnect();
      fc_failure.disconnect();
      db.prepare(alice_id, "QmMore");
      BOOST_CHECK_EQUAL(published.size(), 2u);
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( operations_round_trip_through_json ) {
   try {
      const string json = R"([
         [0, {"creator": 1, "descriptor": "QmJson"}],
         [1, {"creator": 1, "token_id": 1, "recipient": 2, "basis_points": 750}],
         [2, {"caller": 1, "from": 1, "to": 2, "token_id": 1, "data": ""}]
      ])";

      const vector<operation> ops = fc::json::from_string(json).as<vector<operation>>(LAZYMINT_MAX_NESTED_OBJECTS);
      BOOST_REQUIRE_EQUAL(ops.size(), 3u);
      BOOST_CHECK(ops[1].which() == operation::tag<royalty_set_operation>::value);

      for (const operation &op : ops) {
         db.apply_operation(op);
      }

      BOOST_CHECK_EQUAL(db.token_descriptor(1), "ipfs://QmJson");
      BOOST_CHECK(*db.owner_of(1) == account_id_type(2));
      BOOST_CHECK_EQUAL(db.royalty_info(1, 1000).amount, 75u);

      const fc::variant royalty_update(db.get_applied_operations(1).front(), LAZYMINT_MAX_NESTED_OBJECTS);
      BOOST_CHECK_EQUAL(fc::json::to_string(royalty_update.get_object()["op"]),
                        "[8,{\"token_id\":1,\"recipient\":2,\"basis_points\":750}]");
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( oversized_royalty_from_json_is_rejected ) {
   try {
      ACTORS((alice)(collector));
      const token_id_type id = db.prepare(alice_id, "QmArt");
      const object_id_type before = next_notification();

      // 75536 is 10000 once narrowed to 16 bits
      const string json = R"([1, {"creator": 1, "token_id": 1, "recipient": 2, "basis_points": 75536}])";
      const operation op = fc::json::from_string(json).as<operation>(LAZYMINT_MAX_NESTED_OBJECTS);
      BOOST_REQUIRE(op.which() == operation::tag<royalty_set_operation>::value);
      BOOST_CHECK_EQUAL(op.get<royalty_set_operation>().basis_points, 75536u);

      LAZYMINT_REQUIRE_THROW(db.apply_operation(op), royalty_too_high);

      BOOST_CHECK(db.royalties().find_royalty(id) == nullptr);
      BOOST_CHECK(db.royalty_info(id, 1000).recipient.is_null());
      BOOST_CHECK_EQUAL(db.royalty_info(id, 1000).amount, 0u);
      BOOST_CHECK_EQUAL(next_notification(), before);
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()
