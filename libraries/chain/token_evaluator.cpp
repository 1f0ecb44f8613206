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
#include <lazymint/chain/database.hpp>
#include <lazymint/chain/token_evaluator.hpp>

namespace lazymint {
   namespace chain {
      void_result token_prepare_evaluator::do_evaluate(const token_prepare_operation &op) {
         try {
            const database &d = db();

            // Reject a descriptor that another token has already claimed
            const fc::sha256 hash = metadata_uniqueness_index::hash_descriptor(op.descriptor);
            const optional<token_id_type> claimant = d.registry().find_claimant(hash);
            LAZYMINT_ASSERT(!claimant.valid(), duplicate_metadata,
                            "The descriptor is already claimed by token ${id}", ("id", *claimant));

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      token_id_type token_prepare_evaluator::do_apply(const token_prepare_operation &op) {
         try {
            return db().registry().prepare(op.creator, op.descriptor);
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result royalty_set_evaluator::do_evaluate(const royalty_set_operation &op) {
         try {
            const database &d = db();

            // Verify the existence of the token
            const token_object *token = d.registry().find_token(op.token_id);
            LAZYMINT_ASSERT(token != nullptr, unknown_token, "Token ${id} was never prepared", ("id", op.token_id));

            // Verify that the creator of the token is requesting the change
            LAZYMINT_ASSERT(op.creator == token->creator, unauthorized,
                            "Royalties may only be set by the token creator. (Creator is ${creator}.  Requester is ${r}.)",
                            ("creator", token->creator)("r", op.creator));

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result royalty_set_evaluator::do_apply(const royalty_set_operation &op) {
         try {
            db().royalties().set_royalty(op.creator, op.token_id, op.recipient, op.basis_points);
            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result token_transfer_evaluator::do_evaluate(const token_transfer_operation &op) {
         try {
            const database &d = db();

            // Only prepared tokens can be minted or transferred
            LAZYMINT_ASSERT(d.registry().exists(op.token_id), unknown_token,
                            "Token ${id} was never prepared", ("id", op.token_id));

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result token_transfer_evaluator::do_apply(const token_transfer_operation &op) {
         try {
            db().mint().transfer(op.caller, op.from, op.to, op.token_id, op.data);
            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result token_approve_evaluator::do_evaluate(const token_approve_operation &op) {
         try {
            const database &d = db();

            // Approvals are only meaningful for minted tokens
            LAZYMINT_ASSERT(d.ownership().owner_of(op.token_id).valid(), nonexistent_token,
                            "Token ${id} has no owner", ("id", op.token_id));

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result token_approve_evaluator::do_apply(const token_approve_operation &op) {
         try {
            db().ownership().approve(op.owner, op.approved, op.token_id);
            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result operator_set_evaluator::do_evaluate(const operator_set_operation &op) {
         return void_result();
      }

      void_result operator_set_evaluator::do_apply(const operator_set_operation &op) {
         try {
            db().ownership().set_approval_for_all(op.owner, op.operator_account, op.approved);
            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result base_path_set_evaluator::do_evaluate(const base_path_set_operation &op) {
         try {
            db().admin().require_admin(op.admin);
            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result base_path_set_evaluator::do_apply(const base_path_set_operation &op) {
         try {
            db().descriptors().set_base_path(op.path);
            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

   }
} // lazymint::chain
