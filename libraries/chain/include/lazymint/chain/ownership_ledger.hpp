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

#include <lazymint/chain/types.hpp>

#include <functional>

namespace lazymint {
   namespace chain {

      /**
       * @brief Code executed by a programmable account when it receives a token
       *
       * The callback runs after the ownership change has been applied.  It may submit further
       * operations, including transfers of the token it has just received.
       */
      class token_receiver {
      public:
         virtual ~token_receiver() {}

         /**
          * @param operator_id Account that requested the transfer
          * @param from Previous owner
          * @param id Token received
          * @param data Data supplied with the transfer
          * @return false to reject the token, which fails the transfer
          */
         virtual bool on_token_received(const account_id_type &operator_id, const account_id_type &from,
                                        token_id_type id, const string &data) = 0;
      };

      /**
       * @brief Capability for standard token ownership bookkeeping
       *
       * Tracks who owns each minted token and who may transfer it.  The ledger knows nothing about
       * preparation or deferred minting; those concerns reach it through mint() and the pre-transfer
       * hook.
       */
      class ownership_ledger {
      public:
         /// Invoked with (token, from, to) before any check or change of ownership
         typedef std::function<void(token_id_type, const account_id_type &, const account_id_type &)> pre_transfer_hook;

         virtual ~ownership_ledger() {}

         /// @throws transfer_to_null_account, token_already_owned
         virtual void mint(const account_id_type &to, token_id_type id) = 0;

         /**
          * @brief Move a token, notifying a programmable recipient afterwards
          * @throws nonexistent_token, transfer_from_incorrect_owner, transfer_to_null_account,
          *         transfer_not_authorized, receiver_rejected
          */
         virtual void transfer(const account_id_type &caller, const account_id_type &from,
                               const account_id_type &to, token_id_type id, const string &data,
                               const pre_transfer_hook &hook) = 0;

         /// @throws nonexistent_token, approval_to_current_owner, approval_not_authorized
         virtual void approve(const account_id_type &caller, const account_id_type &approved, token_id_type id) = 0;

         /// @throws approval_to_caller
         virtual void set_approval_for_all(const account_id_type &owner, const account_id_type &operator_account,
                                           bool approved) = 0;

         /// Owner of a token, empty if the token has no owner
         virtual optional<account_id_type> owner_of(token_id_type id) const = 0;

         virtual uint64_t balance_of(const account_id_type &owner) const = 0;

         /// @throws nonexistent_token
         virtual account_id_type get_approved(token_id_type id) const = 0;

         virtual bool is_approved_for_all(const account_id_type &owner, const account_id_type &operator_account) const = 0;
      };

   }
} // lazymint::chain
