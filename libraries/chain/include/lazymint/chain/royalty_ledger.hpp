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

#include <lazymint/chain/royalty_object.hpp>
#include <lazymint/chain/token_registry.hpp>

namespace lazymint {
   namespace chain {

      /**
       * @brief Royalty owed on the sale of a token
       */
      struct royalty_info_result {
         royalty_info_result() {}
         royalty_info_result(account_id_type r, uint64_t a) : recipient(r), amount(a) {}

         /// The null account when no royalty is owed
         account_id_type recipient;
         uint64_t amount = 0;
      };

      /**
       * @brief Per-token royalty terms, settable only by the token's creator
       *
       * Terms are reported, never enforced.  They may be replaced at any time, before or after the
       * token is minted.
       */
      class royalty_ledger {
      public:
         royalty_ledger(undo_database &udb, const token_registry &registry, notification_log &log);

         /**
          * @brief Set or replace the royalty terms of a token
          * @param caller Account requesting the change; must be the token's creator
          * @param id Token ID
          * @param recipient Beneficiary of royalty payments
          * @param basis_points Rate in hundredths of a percent
          * @throws unknown_token, unauthorized, royalty_too_high
          */
         void set_royalty(const account_id_type &caller, token_id_type id,
                          const account_id_type &recipient, requested_basis_points_type basis_points);

         /**
          * @brief Royalty owed on a sale
          * @param id Token ID
          * @param sale_price Sale price in any unit
          * @return floor(sale_price * basis_points / 10000) to the recipient, or (null account, 0) when
          *         the token has no royalty terms
          */
         royalty_info_result royalty_info(token_id_type id, uint64_t sale_price) const;

         const royalty_object *find_royalty(token_id_type id) const;

      private:
         undo_database &_udb;
         const token_registry &_registry;
         notification_log &_log;

         royalty_index _royalties;
      };

   }
} // lazymint::chain

FC_REFLECT( lazymint::chain::royalty_info_result, (recipient)(amount) )
