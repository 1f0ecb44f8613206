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
#include <lazymint/chain/account_ownership_ledger.hpp>

#include <fc/log/logger.hpp>

#include <boost/tuple/tuple.hpp>

namespace lazymint {
   namespace chain {

      account_ownership_ledger::account_ownership_ledger(undo_database &udb, notification_log &log)
         : _log(log), _ownership(udb), _operators(udb) {
      }

      void account_ownership_ledger::mint(const account_id_type &to, token_id_type id) {
         LAZYMINT_ASSERT(!to.is_null(), transfer_to_null_account,
                         "Token ${id} may not be minted to the null account", ("id", id));
         LAZYMINT_ASSERT(find_ownership(id) == nullptr, token_already_owned,
                         "Token ${id} already has an owner", ("id", id));

         _ownership.create([&to, id](ownership_object &obj) {
            obj.token_id = id;
            obj.owner = to;
         });

         _log.push(ownership_transferred_operation(LAZYMINT_NULL_ACCOUNT, to, id));
      }

      void account_ownership_ledger::transfer(const account_id_type &caller, const account_id_type &from,
                                              const account_id_type &to, token_id_type id, const string &data,
                                              const pre_transfer_hook &hook) {
         if (hook) {
            hook(id, from, to);
         }

         const ownership_object &obj = get_ownership(id);
         LAZYMINT_ASSERT(obj.owner == from, transfer_from_incorrect_owner,
                         "Token ${id} is owned by ${owner} rather than ${from}",
                         ("id", id)("owner", obj.owner)("from", from));
         LAZYMINT_ASSERT(!to.is_null(), transfer_to_null_account,
                         "Token ${id} may not be transferred to the null account", ("id", id));
         LAZYMINT_ASSERT(is_approved_or_owner(caller, obj), transfer_not_authorized,
                         "${caller} is neither the owner of token ${id} nor approved to transfer it",
                         ("caller", caller)("id", id));

         // Apply every effect before the recipient gets control
         _ownership.modify(obj, [&to](ownership_object &o) {
            o.owner = to;
            o.approved = LAZYMINT_NULL_ACCOUNT;
         });

         _log.push(ownership_transferred_operation(from, to, id));

         auto itr = _receivers.find(to);
         if (itr != _receivers.end()) {
            // Hold a reference in case the callback unregisters the receiver
            std::shared_ptr<token_receiver> receiver = itr->second;
            const bool accepted = receiver->on_token_received(caller, from, id, data);
            LAZYMINT_ASSERT(accepted, receiver_rejected,
                            "${to} rejected token ${id}", ("to", to)("id", id));
         }
      }

      void account_ownership_ledger::approve(const account_id_type &caller, const account_id_type &approved,
                                             token_id_type id) {
         const ownership_object &obj = get_ownership(id);
         const account_id_type owner = obj.owner;

         LAZYMINT_ASSERT(approved != owner, approval_to_current_owner,
                         "${approved} already owns token ${id}", ("approved", approved)("id", id));
         LAZYMINT_ASSERT(caller == owner || is_approved_for_all(owner, caller), approval_not_authorized,
                         "${caller} is neither the owner of token ${id} nor an operator of its owner",
                         ("caller", caller)("id", id));

         _ownership.modify(obj, [&approved](ownership_object &data) {
            data.approved = approved;
         });

         _log.push(token_approval_operation(owner, approved, id));
      }

      void account_ownership_ledger::set_approval_for_all(const account_id_type &owner,
                                                          const account_id_type &operator_account, bool approved) {
         LAZYMINT_ASSERT(owner != operator_account, approval_to_caller,
                         "Account ${a} may not be its own operator", ("a", owner));

         const auto &operator_idx = _operators.indices().get<by_owner_operator>();
         auto itr = operator_idx.find(boost::make_tuple(owner, operator_account));
         if (itr == operator_idx.end()) {
            _operators.create([&owner, &operator_account, approved](operator_approval_object &obj) {
               obj.owner = owner;
               obj.operator_account = operator_account;
               obj.approved = approved;
            });
         } else {
            _operators.modify(*itr, [approved](operator_approval_object &data) {
               data.approved = approved;
            });
         }

         _log.push(operator_approval_operation(owner, operator_account, approved));
      }

      optional<account_id_type> account_ownership_ledger::owner_of(token_id_type id) const {
         const ownership_object *obj = find_ownership(id);
         if (obj == nullptr) {
            return optional<account_id_type>();
         }
         return obj->owner;
      }

      uint64_t account_ownership_ledger::balance_of(const account_id_type &owner) const {
         return _ownership.indices().get<by_owner>().count(owner);
      }

      account_id_type account_ownership_ledger::get_approved(token_id_type id) const {
         return get_ownership(id).approved;
      }

      bool account_ownership_ledger::is_approved_for_all(const account_id_type &owner,
                                                         const account_id_type &operator_account) const {
         const auto &operator_idx = _operators.indices().get<by_owner_operator>();
         auto itr = operator_idx.find(boost::make_tuple(owner, operator_account));
         return itr != operator_idx.end() && itr->approved;
      }

      void account_ownership_ledger::register_receiver(const account_id_type &account,
                                                       std::shared_ptr<token_receiver> receiver) {
         FC_ASSERT(receiver != nullptr, "A receiver is required");
         _receivers[account] = std::move(receiver);
         ilog("Account ${a} is now programmable", ("a", account));
      }

      void account_ownership_ledger::unregister_receiver(const account_id_type &account) {
         _receivers.erase(account);
      }

      const ownership_object *account_ownership_ledger::find_ownership(token_id_type id) const {
         const auto &token_idx = _ownership.indices().get<by_owned_token>();
         auto itr = token_idx.find(id);
         if (itr == token_idx.end()) {
            return nullptr;
         }
         return &*itr;
      }

      const ownership_object &account_ownership_ledger::get_ownership(token_id_type id) const {
         const ownership_object *obj = find_ownership(id);
         LAZYMINT_ASSERT(obj != nullptr, nonexistent_token, "Token ${id} has no owner", ("id", id));
         return *obj;
      }

      bool account_ownership_ledger::is_approved_or_owner(const account_id_type &caller,
                                                          const ownership_object &obj) const {
         return caller == obj.owner
                || (!obj.approved.is_null() && caller == obj.approved)
                || is_approved_for_all(obj.owner, caller);
      }

   }
} // lazymint::chain
