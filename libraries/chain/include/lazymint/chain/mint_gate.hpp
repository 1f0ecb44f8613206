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

#include <lazymint/chain/ownership_ledger.hpp>
#include <lazymint/chain/token_registry.hpp>

namespace lazymint {
   namespace chain {

      /**
       * @brief Mints a prepared token on its first transfer
       *
       * The gate hands its pre-transfer hook to the ownership ledger with every transfer.  When the
       * token has not been minted, the hook flags it as minted and then mints it to the transfer
       * source, so the ledger sees an ordinary owned token by the time it checks the transfer.
       */
      class mint_gate {
      public:
         mint_gate(undo_database &udb, token_registry &registry, ownership_ledger &ledger);

         /**
          * @brief Transfer a token, minting it first if necessary
          *
          * The mint and the transfer are applied together or not at all.
          * @throws unknown_token and any failure of the ownership ledger
          */
         void transfer(const account_id_type &caller, const account_id_type &from,
                       const account_id_type &to, token_id_type id, const string &data);

         /// The pre-transfer hook.  A failed mint leaves the token unminted.
         void before_transfer(token_id_type id, const account_id_type &from, const account_id_type &to);

      private:
         undo_database &_udb;
         token_registry &_registry;
         ownership_ledger &_ledger;
      };

   }
} // lazymint::chain
