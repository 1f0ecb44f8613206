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

#include <lazymint/chain/royalty_ledger.hpp>

#include "../common/ledger_fixture.hpp"

#include <limits>

using namespace lazymint::chain;
using namespace lazymint::chain::test;

BOOST_FIXTURE_TEST_SUITE( royalty_tests, ledger_fixture )

BOOST_AUTO_TEST_CASE( no_royalty_before_terms_are_set ) {
   try {
      ACTOR(alice);
      const token_id_type id = db.prepare(alice_id, "QmArt");

      const royalty_info_result info = db.royalty_info(id, 1000);
      BOOST_CHECK(info.recipient.is_null());
      BOOST_CHECK_EQUAL(info.amount, 0u);

      // Unknown tokens report no royalty either
      const royalty_info_result unknown = db.royalty_info(42, 1000);
      BOOST_CHECK(unknown.recipient == LAZYMINT_NULL_ACCOUNT);
      BOOST_CHECK_EQUAL(unknown.amount, 0u);
   } FC_LOG_AND_RETHROW()
}

/**
 * Test a simple and valid setting of royalty terms by the creator
 */
BOOST_AUTO_TEST_CASE( creator_sets_royalty ) {
   try {
      ACTORS((alice)(royalty_collector));
      const token_id_type id = db.prepare(alice_id, "QmArt");

      BOOST_TEST_MESSAGE("Alice is setting a royalty of 5%");
      const object_id_type before = next_notification();
      db.set_royalty(alice_id, id, royalty_collector_id, 500);

      const royalty_info_result info = db.royalty_info(id, 10000);
      BOOST_CHECK(info.recipient == royalty_collector_id);
      BOOST_CHECK_EQUAL(info.amount, 500u);

      BOOST_TEST_MESSAGE("Verifying the RoyaltySet notification");
      const auto updates = notifications_of_type<royalty_updated_operation>(before);
      BOOST_REQUIRE_EQUAL(updates.size(), 1u);
      BOOST_CHECK_EQUAL(updates[0].token_id, id);
      BOOST_CHECK(updates[0].recipient == royalty_collector_id);
      BOOST_CHECK_EQUAL(updates[0].basis_points, 500u);

      // Setting a royalty neither mints nor transfers the token
      BOOST_CHECK(!db.is_minted(id));
      BOOST_CHECK(!db.owner_of(id).valid());
   } FC_LOG_AND_RETHROW()
}

/**
 * Royalty amounts are rounded down
 */
BOOST_AUTO_TEST_CASE( royalty_amount_rounds_down ) {
   try {
      ACTORS((alice)(collector));
      const token_id_type id = db.prepare(alice_id, "QmArt");

      db.set_royalty(alice_id, id, collector_id, 250);
      BOOST_CHECK_EQUAL(db.royalty_info(id, 39).amount, 0u);
      BOOST_CHECK_EQUAL(db.royalty_info(id, 40).amount, 1u);
      BOOST_CHECK_EQUAL(db.royalty_info(id, 79).amount, 1u);
      BOOST_CHECK_EQUAL(db.royalty_info(id, 999).amount, 24u);
      BOOST_CHECK_EQUAL(db.royalty_info(id, 0).amount, 0u);

      BOOST_TEST_MESSAGE("Verifying that the largest sale price does not overflow");
      const uint64_t max_price = std::numeric_limits<uint64_t>::max();
      db.set_royalty(alice_id, id, collector_id, LAZYMINT_100_PERCENT);
      BOOST_CHECK_EQUAL(db.royalty_info(id, max_price).amount, max_price);

      db.set_royalty(alice_id, id, collector_id, 9999);
      BOOST_CHECK_EQUAL(db.royalty_info(id, max_price).amount, 18444899399302180659ULL);

      BOOST_TEST_MESSAGE("Verifying a royalty of zero");
      db.set_royalty(alice_id, id, collector_id, 0);
      const royalty_info_result info = db.royalty_info(id, 1000000);
      BOOST_CHECK(info.recipient == collector_id);
      BOOST_CHECK_EQUAL(info.amount, 0u);
   } FC_LOG_AND_RETHROW()
}

/**
 * Only the creator may set royalties, regardless of who owns the token
 */
BOOST_AUTO_TEST_CASE( non_creator_may_not_set_royalty ) {
   try {
      ACTORS((alice)(bob)(charlie));
      const token_id_type id = db.prepare(alice_id, "QmArt");

      BOOST_TEST_MESSAGE("Bob is attempting to set a royalty on Alice's prepared token");
      REQUIRE_EXCEPTION_WITH_TEXT(db.set_royalty(bob_id, id, bob_id, 100), "only be set by the token creator");
      LAZYMINT_REQUIRE_THROW(db.set_royalty(bob_id, id, bob_id, 100), unauthorized);

      BOOST_TEST_MESSAGE("Alice is transferring the token to Bob");
      db.transfer(alice_id, alice_id, bob_id, id);
      BOOST_CHECK(*db.owner_of(id) == bob_id);

      BOOST_TEST_MESSAGE("Bob, the owner, is attempting to set a royalty");
      LAZYMINT_REQUIRE_THROW(db.set_royalty(bob_id, id, bob_id, 100), unauthorized);
      LAZYMINT_REQUIRE_THROW(db.set_royalty(charlie_id, id, charlie_id, 100), unauthorized);
      BOOST_CHECK(db.royalty_info(id, 1000).recipient.is_null());

      BOOST_TEST_MESSAGE("Alice, no longer the owner, is setting a royalty");
      db.set_royalty(alice_id, id, alice_id, 100);
      BOOST_CHECK(db.royalty_info(id, 1000).recipient == alice_id);
      BOOST_CHECK_EQUAL(db.royalty_info(id, 1000).amount, 10u);
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( royalty_above_100_percent_is_rejected ) {
   try {
      ACTORS((alice)(collector));
      const token_id_type id = db.prepare(alice_id, "QmArt");
      const object_id_type before = next_notification();

      REQUIRE_EXCEPTION_WITH_TEXT(db.set_royalty(alice_id, id, collector_id, 10001), "exceeds LAZYMINT_100_PERCENT");
      LAZYMINT_REQUIRE_THROW(db.set_royalty(alice_id, id, collector_id, 65535), royalty_too_high);

      // Rates that would wrap into range in 16 bits are still rejected
      LAZYMINT_REQUIRE_THROW(db.set_royalty(alice_id, id, collector_id, 75536), royalty_too_high);
      LAZYMINT_REQUIRE_THROW(db.set_royalty(alice_id, id, collector_id, 65636), royalty_too_high);
      LAZYMINT_REQUIRE_THROW(db.set_royalty(alice_id, id, collector_id, 4294977296ull), royalty_too_high);

      BOOST_CHECK(db.royalty_info(id, 10000).recipient.is_null());
      BOOST_CHECK_EQUAL(next_notification(), before);

      // Exactly 100% is permitted
      db.set_royalty(alice_id, id, collector_id, 10000);
      BOOST_CHECK_EQUAL(db.royalty_info(id, 10000).amount, 10000u);
   } FC_LOG_AND_RETHROW()
}

/**
 * Failures are reported in a fixed order: unknown token, then caller, then rate
 */
BOOST_AUTO_TEST_CASE( royalty_failure_order ) {
   try {
      ACTORS((alice)(bob));
      const token_id_type id = db.prepare(alice_id, "QmArt");

      LAZYMINT_REQUIRE_THROW(db.set_royalty(bob_id, 99, bob_id, 20000), unknown_token);
      LAZYMINT_REQUIRE_THROW(db.set_royalty(bob_id, id, bob_id, 20000), unauthorized);
      LAZYMINT_REQUIRE_THROW(db.set_royalty(alice_id, id, bob_id, 20000), royalty_too_high);
   } FC_LOG_AND_RETHROW()
}

/**
 * The most recent terms replace earlier ones, before and after minting
 */
BOOST_AUTO_TEST_CASE( last_write_wins ) {
   try {
      ACTORS((alice)(bob)(first_collector)(second_collector));
      const token_id_type id = db.prepare(alice_id, "QmArt");

      db.set_royalty(alice_id, id, first_collector_id, 1000);
      db.set_royalty(alice_id, id, second_collector_id, 200);
      BOOST_CHECK(db.royalty_info(id, 1000).recipient == second_collector_id);
      BOOST_CHECK_EQUAL(db.royalty_info(id, 1000).amount, 20u);

      db.transfer(alice_id, alice_id, bob_id, id);
      db.set_royalty(alice_id, id, first_collector_id, 300);
      BOOST_CHECK(db.royalty_info(id, 1000).recipient == first_collector_id);
      BOOST_CHECK_EQUAL(db.royalty_info(id, 1000).amount, 30u);

      const auto updates = notifications_of_type<royalty_updated_operation>();
      BOOST_REQUIRE_EQUAL(updates.size(), 3u);
      BOOST_CHECK_EQUAL(updates[1].basis_points, 200u);
      BOOST_CHECK_EQUAL(updates[2].basis_points, 300u);

      // A single term is kept per token
      BOOST_REQUIRE(db.royalties().find_royalty(id) != nullptr);
      BOOST_CHECK_EQUAL(db.royalties().find_royalty(id)->basis_points, 300u);
   } FC_LOG_AND_RETHROW()
}

/**
 * A royalty ledger used on its own applies the same checks
 */
BOOST_AUTO_TEST_CASE( standalone_royalty_ledger ) {
   try {
      undo_database udb;
      notification_log log(udb);
      token_registry registry(udb, log);
      royalty_ledger royalties(udb, registry, log);
      const account_id_type creator(1);
      const account_id_type stranger(2);

      const token_id_type id = registry.prepare(creator, "QmA");
      LAZYMINT_REQUIRE_THROW(royalties.set_royalty(creator, id + 1, creator, 100), unknown_token);
      LAZYMINT_REQUIRE_THROW(royalties.set_royalty(stranger, id, stranger, 100), unauthorized);
      LAZYMINT_REQUIRE_THROW(royalties.set_royalty(creator, id, creator, 10001), royalty_too_high);
      BOOST_CHECK_EQUAL(log.size(), 1u);

      royalties.set_royalty(creator, id, stranger, 100);
      BOOST_CHECK_EQUAL(royalties.royalty_info(id, 500).amount, 5u);
      BOOST_CHECK(royalties.royalty_info(id, 500).recipient == stranger);
      BOOST_CHECK_EQUAL(log.size(), 2u);
      BOOST_CHECK_EQUAL(udb.depth(), 0u);
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()
