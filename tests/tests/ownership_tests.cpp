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

#include "../common/ledger_fixture.hpp"

using namespace lazymint::chain;
using namespace lazymint::chain::test;

struct ownership_fixture : ledger_fixture {
   ownership_fixture()
      : ledger_fixture() {
   }

   /// Prepare a token and deliver it to @p owner with its minting transfer
   token_id_type prepare_and_deliver(const account_id_type &creator, const account_id_type &owner,
                                     const string &descriptor) {
      const token_id_type id = db.prepare(creator, descriptor);
      db.transfer(creator, creator, owner, id);
      return id;
   }
};

BOOST_FIXTURE_TEST_SUITE( ownership_tests, ownership_fixture )

BOOST_AUTO_TEST_CASE( approved_account_may_transfer_once ) {
   try {
      ACTORS((alice)(bob)(carol)(dave));
      const token_id_type id = prepare_and_deliver(alice_id, bob_id, "QmArt");

      BOOST_TEST_MESSAGE("Bob is approving Carol for his token");
      db.approve(bob_id, carol_id, id);
      BOOST_CHECK(db.ownership().get_approved(id) == carol_id);

      const auto approvals = notifications_of_type<token_approval_operation>();
      BOOST_REQUIRE_EQUAL(approvals.size(), 1u);
      BOOST_CHECK(approvals[0].owner == bob_id);
      BOOST_CHECK(approvals[0].approved == carol_id);

      BOOST_TEST_MESSAGE("Carol is transferring Bob's token to Dave");
      db.transfer(carol_id, bob_id, dave_id, id);
      BOOST_CHECK(*db.owner_of(id) == dave_id);

      BOOST_TEST_MESSAGE("Verifying the approval was cleared by the transfer");
      BOOST_CHECK(db.ownership().get_approved(id).is_null());
      LAZYMINT_REQUIRE_THROW(db.transfer(carol_id, dave_id, carol_id, id), transfer_not_authorized);
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( approval_rules ) {
   try {
      ACTORS((alice)(bob)(carol));
      const token_id_type id = prepare_and_deliver(alice_id, bob_id, "QmArt");

      REQUIRE_EXCEPTION_WITH_TEXT(db.approve(bob_id, bob_id, id), "already owns");
      LAZYMINT_REQUIRE_THROW(db.approve(bob_id, bob_id, id), approval_to_current_owner);

      BOOST_TEST_MESSAGE("Carol is attempting to approve herself for Bob's token");
      LAZYMINT_REQUIRE_THROW(db.approve(carol_id, carol_id, id), approval_not_authorized);

      BOOST_TEST_MESSAGE("The creator holds no rights over a delivered token");
      LAZYMINT_REQUIRE_THROW(db.approve(alice_id, carol_id, id), approval_not_authorized);

      BOOST_TEST_MESSAGE("Approvals are only possible for minted tokens");
      const token_id_type unminted = db.prepare(alice_id, "QmUnminted");
      LAZYMINT_REQUIRE_THROW(db.approve(alice_id, carol_id, unminted), nonexistent_token);
      LAZYMINT_REQUIRE_THROW(db.ownership().get_approved(unminted), nonexistent_token);

      BOOST_TEST_MESSAGE("Bob is clearing an approval");
      db.approve(bob_id, carol_id, id);
      db.approve(bob_id, LAZYMINT_NULL_ACCOUNT, id);
      BOOST_CHECK(db.ownership().get_approved(id).is_null());
      LAZYMINT_REQUIRE_THROW(db.transfer(carol_id, bob_id, carol_id, id), transfer_not_authorized);
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( operators_manage_every_token ) {
   try {
      ACTORS((alice)(bob)(broker)(dave));
      const token_id_type first = prepare_and_deliver(alice_id, bob_id, "Qm1");
      const token_id_type second = prepare_and_deliver(alice_id, bob_id, "Qm2");
      BOOST_CHECK_EQUAL(db.balance_of(bob_id), 2u);

      BOOST_TEST_MESSAGE("Bob is appointing a broker");
      db.set_approval_for_all(bob_id, broker_id, true);
      BOOST_CHECK(db.ownership().is_approved_for_all(bob_id, broker_id));
      BOOST_CHECK(!db.ownership().is_approved_for_all(broker_id, bob_id));

      const auto operator_approvals = notifications_of_type<operator_approval_operation>();
      BOOST_REQUIRE_EQUAL(operator_approvals.size(), 1u);
      BOOST_CHECK(operator_approvals[0].approved);

      BOOST_TEST_MESSAGE("The broker is approving Dave for one token and selling the other");
      db.approve(broker_id, dave_id, first);
      db.transfer(broker_id, bob_id, dave_id, second);
      BOOST_CHECK(*db.owner_of(second) == dave_id);
      BOOST_CHECK(db.ownership().get_approved(first) == dave_id);

      BOOST_TEST_MESSAGE("Bob is revoking the broker");
      db.set_approval_for_all(bob_id, broker_id, false);
      BOOST_CHECK(!db.ownership().is_approved_for_all(bob_id, broker_id));
      LAZYMINT_REQUIRE_THROW(db.transfer(broker_id, bob_id, broker_id, first), transfer_not_authorized);

      BOOST_TEST_MESSAGE("Dave's single-token approval survives the revocation");
      db.transfer(dave_id, bob_id, dave_id, first);
      BOOST_CHECK_EQUAL(db.balance_of(dave_id), 2u);
      BOOST_CHECK_EQUAL(db.balance_of(bob_id), 0u);

      REQUIRE_EXCEPTION_WITH_TEXT(db.set_approval_for_all(bob_id, bob_id, true), "its own operator");
      LAZYMINT_REQUIRE_THROW(db.set_approval_for_all(bob_id, bob_id, true), approval_to_caller);
   } FC_LOG_AND_RETHROW()
}

/**
 * An operator of the sender may perform the minting transfer
 */
BOOST_AUTO_TEST_CASE( operator_performs_first_transfer ) {
   try {
      ACTORS((alice)(gallery)(collector));
      const token_id_type id = db.prepare(alice_id, "QmArt");

      db.set_approval_for_all(alice_id, gallery_id, true);
      db.transfer(gallery_id, alice_id, collector_id, id);

      BOOST_CHECK(db.is_minted(id));
      BOOST_CHECK(db.registry().get_token(id).minted_to == alice_id);
      BOOST_CHECK(*db.owner_of(id) == collector_id);
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()
