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
#include <lazymint/chain/mint_gate.hpp>

#include <fc/log/logger.hpp>

namespace lazymint {
   namespace chain {

      mint_gate::mint_gate(undo_database &udb, token_registry &registry, ownership_ledger &ledger)
         : _udb(udb), _registry(registry), _ledger(ledger) {
      }

      void mint_gate::transfer(const account_id_type &caller, const account_id_type &from,
                               const account_id_type &to, token_id_type id, const string &data) {
         try {
            auto session = _udb.start_undo_session();

            _ledger.transfer(caller, from, to, id, data,
                             [this](token_id_type token, const account_id_type &source, const account_id_type &dest) {
                                before_transfer(token, source, dest);
                             });

            session.commit();
         } FC_CAPTURE_AND_RETHROW((caller)(from)(to)(id))
      }

      void mint_gate::before_transfer(token_id_type id, const account_id_type &from, const account_id_type &to) {
         if (_registry.is_minted(id)) {
            return;
         }

         auto session = _udb.start_undo_session();

         // The flag is raised before the token has an owner so that no callback can observe an
         // owned token that is not minted
         _registry.mark_minted(id, from);
         _ledger.mint(from, id);

         session.commit();

         dlog("Token ${id} minted by its first transfer from ${from} to ${to}",
              ("id", id)("from", from)("to", to));
      }

   }
} // lazymint::chain
