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

#include <lazymint/token_history/token_history.hpp>

#include "../common/ledger_fixture.hpp"

using namespace lazymint::chain;
using namespace lazymint::chain::test;
using namespace lazymint::token_history;

namespace bpo = boost::program_options;

struct token_history_fixture : ledger_fixture {
   token_history_fixture()
      : ledger_fixture(),
        history(db) {
   }

   ~token_history_fixture() {
      history.plugin_shutdown();
   }

   void start_history(const std::vector<std::string> &args = std::vector<std::string>()) {
      bpo::options_description cli;
      bpo::options_description cfg;
      history.plugin_set_program_options(cli, cfg);

      bpo::variables_map options;
      bpo::store(bpo::command_line_parser(args).options(cli).run(), options);
      bpo::notify(options);

      history.plugin_initialize(options);
      history.plugin_startup();
   }

   token_history history;
};

BOOST_FIXTURE_TEST_SUITE( token_history_tests, token_history_fixture )

BOOST_AUTO_TEST_CASE( history_by_token_and_account ) {
   try {
      start_history();
      BOOST_CHECK_EQUAL(history.plugin_name(), "token_history");
      BOOST_CHECK_EQUAL(history.max_entries_per_token(), 0u);

      ACTORS((alice)(bob)(carol));
      const token_id_type first = db.prepare(alice_id, "Qm1");
      const token_id_type second = db.prepare(bob_id, "Qm2");
      const token_id_type third = db.prepare(alice_id, "Qm3");
      db.set_royalty(alice_id, first, carol_id, 100);
      db.transfer(alice_id, alice_id, bob_id, first);

      BOOST_TEST_MESSAGE("Verifying the history of the first token");
      const vector<token_history_object> first_history = history.get_token_history(first);
      BOOST_REQUIRE_EQUAL(first_history.size(), 5u);
      BOOST_CHECK(first_history[0].op.which() == operation::tag<token_prepared_operation>::value);
      BOOST_CHECK(first_history[1].op.which() == operation::tag<royalty_updated_operation>::value);
      BOOST_CHECK(first_history[2].op.which() == operation::tag<token_minted_operation>::value);
      BOOST_CHECK(first_history[4].op.which() == operation::tag<ownership_transferred_operation>::value);
      for (const token_history_object &entry : first_history) {
         BOOST_CHECK_EQUAL(entry.token_id, first);
      }
      BOOST_CHECK_EQUAL(history.get_token_history(second).size(), 1u);

      BOOST_TEST_MESSAGE("Verifying the tokens prepared by each creator");
      const vector<token_id_type> alice_tokens = history.get_tokens_by_creator(alice_id);
      BOOST_REQUIRE_EQUAL(alice_tokens.size(), 2u);
      BOOST_CHECK_EQUAL(alice_tokens[0], first);
      BOOST_CHECK_EQUAL(alice_tokens[1], third);
      BOOST_CHECK(history.get_tokens_by_creator(carol_id).empty());

      BOOST_TEST_MESSAGE("Verifying account histories");
      const vector<account_history_object> bob_history = history.get_account_history(bob_id);
      BOOST_REQUIRE_EQUAL(bob_history.size(), 2u);
      BOOST_CHECK(bob_history[0].op.which() == operation::tag<token_prepared_operation>::value);
      BOOST_CHECK(bob_history[1].op.which() == operation::tag<ownership_transferred_operation>::value);
      BOOST_CHECK(bob_history[0].sequence < bob_history[1].sequence);
      BOOST_CHECK_EQUAL(history.get_account_history(carol_id).size(), 1u);
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( failed_operations_are_not_recorded ) {
   try {
      start_history();
      ACTORS((alice)(bob));

      const token_id_type id = db.prepare(alice_id, "Qm1");
      LAZYMINT_REQUIRE_THROW(db.prepare(bob_id, "Qm1"), duplicate_metadata);
      LAZYMINT_REQUIRE_THROW(db.transfer(bob_id, alice_id, bob_id, id), transfer_not_authorized);
      LAZYMINT_REQUIRE_THROW(db.set_royalty(alice_id, id, bob_id, 10001), royalty_too_high);

      BOOST_CHECK_EQUAL(history.get_token_history(id).size(), 1u);
      BOOST_CHECK(history.get_account_history(bob_id).empty());
      BOOST_CHECK(history.get_royalty_updates(id).empty());
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( royalty_updates_in_order ) {
   try {
      start_history();
      ACTORS((alice)(first_collector)(second_collector));
      const token_id_type id = db.prepare(alice_id, "Qm1");

      db.set_royalty(alice_id, id, first_collector_id, 100);
      db.set_royalty(alice_id, id, second_collector_id, 250);

      const vector<royalty_updated_operation> updates = history.get_royalty_updates(id);
      BOOST_REQUIRE_EQUAL(updates.size(), 2u);
      BOOST_CHECK(updates[0].recipient == first_collector_id);
      BOOST_CHECK_EQUAL(updates[0].basis_points, 100u);
      BOOST_CHECK(updates[1].recipient == second_collector_id);
      BOOST_CHECK_EQUAL(updates[1].basis_points, 250u);
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( history_is_pruned_per_token ) {
   try {
      start_history({"--token-history-max-entries", "2"});
      BOOST_CHECK_EQUAL(history.max_entries_per_token(), 2u);

      ACTORS((alice)(bob));
      const token_id_type id = db.prepare(alice_id, "Qm1");
      const token_id_type other = db.prepare(alice_id, "Qm2");
      db.transfer(alice_id, alice_id, bob_id, id);

      const vector<token_history_object> entries = history.get_token_history(id);
      BOOST_REQUIRE_EQUAL(entries.size(), 2u);
      BOOST_CHECK(entries[0].op.which() == operation::tag<ownership_transferred_operation>::value);
      BOOST_CHECK(entries[1].op.get<ownership_transferred_operation>().to == bob_id);
      BOOST_CHECK_EQUAL(history.get_token_history(other).size(), 1u);

      // Account histories are not pruned
      BOOST_CHECK_EQUAL(history.get_tokens_by_creator(alice_id).size(), 2u);
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( shutdown_stops_recording ) {
   try {
      start_history();
      ACTOR(alice);

      const token_id_type id = db.prepare(alice_id, "Qm1");
      history.plugin_shutdown();
      db.prepare(alice_id, "Qm2");

      BOOST_CHECK_EQUAL(history.get_token_history(id).size(), 1u);
      BOOST_CHECK(history.get_token_history(id + 1).empty());
      BOOST_CHECK_EQUAL(history.get_tokens_by_creator(alice_id).size(), 1u);
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()
