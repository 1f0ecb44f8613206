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
#include <lazymint/chain/royalty_ledger.hpp>

#include <fc/log/logger.hpp>
#include <fc/uint128.hpp>

namespace lazymint {
   namespace chain {
      // Round down the percentage calculation
      //
      // The intermediate product is widened to 128 bits so that any 64-bit sale price may be
      // multiplied by any permissible rate.  The quotient never exceeds the sale price.
      static uint64_t calculate_percent_and_round_down(uint64_t value, basis_points_type percent) {
         if (value == 0 || percent == 0) {
            return 0;
         }
         FC_ASSERT(percent <= LAZYMINT_100_PERCENT);

         const fc::uint128_t A = fc::uint128_t(value) * percent;
         const fc::uint128_t C = A / LAZYMINT_100_PERCENT;

         return static_cast<uint64_t>(C);
      }

      royalty_ledger::royalty_ledger(undo_database &udb, const token_registry &registry, notification_log &log)
         : _udb(udb), _registry(registry), _log(log), _royalties(udb) {
      }

      void royalty_ledger::set_royalty(const account_id_type &caller, token_id_type id,
                                       const account_id_type &recipient, requested_basis_points_type requested) {
         // Verify the existence of the token
         LAZYMINT_ASSERT(_registry.exists(id), unknown_token, "Token ${id} was never prepared", ("id", id));

         // Verify that the caller is the creator regardless of the current owner
         const account_id_type creator = _registry.creator_of(id);
         LAZYMINT_ASSERT(caller == creator, unauthorized,
                         "Royalties may only be set by the token creator. (Creator is ${creator}.  Caller is ${caller}.)",
                         ("creator", creator)("caller", caller));

         // Verify the royalty rate
         LAZYMINT_ASSERT(requested <= LAZYMINT_100_PERCENT, royalty_too_high,
                         "Royalty of ${bps} basis points exceeds LAZYMINT_100_PERCENT",
                         ("bps", requested));
         const basis_points_type basis_points = static_cast<basis_points_type>(requested);

         auto session = _udb.start_undo_session();

         const royalty_object *existing = find_royalty(id);
         if (existing == nullptr) {
            _royalties.create([id, &recipient, basis_points](royalty_object &obj) {
               obj.token_id = id;
               obj.recipient = recipient;
               obj.basis_points = basis_points;
            });
         } else {
            // Last write wins
            _royalties.modify(*existing, [&recipient, basis_points](royalty_object &data) {
               data.recipient = recipient;
               data.basis_points = basis_points;
            });
         }

         _log.push(royalty_updated_operation(id, recipient, basis_points));

         session.commit();

         dlog("Royalty of token ${id} set to ${bps} basis points for ${r}",
              ("id", id)("bps", basis_points)("r", recipient));
      }

      royalty_info_result royalty_ledger::royalty_info(token_id_type id, uint64_t sale_price) const {
         const royalty_object *terms = find_royalty(id);
         if (terms == nullptr) {
            return royalty_info_result(LAZYMINT_NULL_ACCOUNT, 0);
         }

         return royalty_info_result(terms->recipient,
                                    calculate_percent_and_round_down(sale_price, terms->basis_points));
      }

      const royalty_object *royalty_ledger::find_royalty(token_id_type id) const {
         const auto &token_idx = _royalties.indices().get<by_royalty_token>();
         auto itr = token_idx.find(id);
         if (itr == token_idx.end()) {
            return nullptr;
         }
         return &*itr;
      }

   }
} // lazymint::chain
