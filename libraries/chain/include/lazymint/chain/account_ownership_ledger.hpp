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

#include <lazymint/chain/operation_history_object.hpp>
#include <lazymint/chain/ownership_ledger.hpp>
#include <lazymint/chain/ownership_object.hpp>

#include <map>
#include <memory>

namespace lazymint {
   namespace chain {

      /**
       * @brief Ownership ledger backed by undoable indexes
       */
      class account_ownership_ledger : public ownership_ledger {
      public:
         account_ownership_ledger(undo_database &udb, notification_log &log);

         void mint(const account_id_type &to, token_id_type id) override;

         void transfer(const account_id_type &caller, const account_id_type &from,
                       const account_id_type &to, token_id_type id, const string &data,
                       const pre_transfer_hook &hook) override;

         void approve(const account_id_type &caller, const account_id_type &approved, token_id_type id) override;

         void set_approval_for_all(const account_id_type &owner, const account_id_type &operator_account,
                                   bool approved) override;

         optional<account_id_type> owner_of(token_id_type id) const override;

         uint64_t balance_of(const account_id_type &owner) const override;

         account_id_type get_approved(token_id_type id) const override;

         bool is_approved_for_all(const account_id_type &owner, const account_id_type &operator_account) const override;

         /// Make an account programmable.  Replaces any receiver previously registered for it.
         void register_receiver(const account_id_type &account, std::shared_ptr<token_receiver> receiver);

         void unregister_receiver(const account_id_type &account);

      private:
         const ownership_object *find_ownership(token_id_type id) const;

         const ownership_object &get_ownership(token_id_type id) const;

         bool is_approved_or_owner(const account_id_type &caller, const ownership_object &obj) const;

         notification_log &_log;

         ownership_index _ownership;
         operator_approval_index _operators;

         std::map<account_id_type, std::shared_ptr<token_receiver>> _receivers;
      };

   }
} // lazymint::chain
