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

#include <lazymint/protocol/types.hpp>

#include <fc/exception/exception.hpp>

#include <utility>

namespace lazymint {
   namespace protocol {

      /**
       * @brief Register a token descriptor without creating any ownership
       *
       * The token is minted implicitly by its first transfer.
       */
      struct token_prepare_operation {
         /// This account becomes the permanent creator of the token
         account_id_type creator;

         /// Opaque metadata pointer.  Must be non-empty and unique across all prepared tokens.
         string descriptor;

         /***
          * @brief Perform simple validation of this object
          */
         void validate() const;

         account_id_type invoker() const { return creator; }
      };

      struct royalty_set_operation {
         /// This account must be the creator of the token
         account_id_type creator;

         token_id_type token_id = 0;

         /// Beneficiary of royalty payments
         account_id_type recipient;

         /// Royalty rate in hundredths of a percent, i.e. a value of 100 in this field
         /// means 1% of the sale price is owed to the recipient
         requested_basis_points_type basis_points = 0;

         void validate() const;

         account_id_type invoker() const { return creator; }
      };

      /**
       * @brief Move a token from one account to another
       *
       * The first transfer of a prepared token mints it to @ref from immediately before the ownership
       * moves to @ref to.
       */
      struct token_transfer_operation {
         /// Account requesting the transfer: the owner, an approved account, or an operator of the owner
         account_id_type caller;

         account_id_type from;
         account_id_type to;
         token_id_type token_id = 0;

         /// Passed verbatim to a programmable recipient
         string data;

         void validate() const;

         account_id_type invoker() const { return caller; }
      };

      struct token_approve_operation {
         /// The owner of the token, or an operator of the owner
         account_id_type owner;

         /// Account permitted to transfer the token; the null account clears the approval
         account_id_type approved;

         token_id_type token_id = 0;

         void validate() const;

         account_id_type invoker() const { return owner; }
      };

      struct operator_set_operation {
         account_id_type owner;

         /// Account permitted to manage every token of the owner
         account_id_type operator_account;

         bool approved = false;

         void validate() const;

         account_id_type invoker() const { return owner; }
      };

      struct base_path_set_operation {
         /// This account must be the ledger administrator
         account_id_type admin;

         /// Prefix prepended to every token descriptor during resolution
         string path;

         void validate() const;

         account_id_type invoker() const { return admin; }
      };

      /// @name Virtual operations
      /// Recorded by the ledger for every state change.  They are never submitted.
      /// @{

      struct token_prepared_operation {
         token_prepared_operation() {}
         token_prepared_operation(token_id_type id, account_id_type c, string d)
            : token_id(id), creator(c), descriptor(std::move(d)) {}

         account_id_type invoker() const { return creator; }
         void validate() const { FC_ASSERT( !"virtual operation" ); }

         token_id_type token_id = 0;
         account_id_type creator;
         string descriptor;
      };

      struct token_minted_operation {
         token_minted_operation() {}
         token_minted_operation(token_id_type id, account_id_type o) : token_id(id), owner(o) {}

         account_id_type invoker() const { return owner; }
         void validate() const { FC_ASSERT( !"virtual operation" ); }

         token_id_type token_id = 0;
         account_id_type owner;
      };

      struct royalty_updated_operation {
         royalty_updated_operation() {}
         royalty_updated_operation(token_id_type id, account_id_type r, basis_points_type bps)
            : token_id(id), recipient(r), basis_points(bps) {}

         account_id_type invoker() const { return recipient; }
         void validate() const { FC_ASSERT( !"virtual operation" ); }

         token_id_type token_id = 0;
         account_id_type recipient;
         basis_points_type basis_points = 0;
      };

      struct ownership_transferred_operation {
         ownership_transferred_operation() {}
         ownership_transferred_operation(account_id_type f, account_id_type t, token_id_type id)
            : from(f), to(t), token_id(id) {}

         account_id_type invoker() const { return from; }
         void validate() const { FC_ASSERT( !"virtual operation" ); }

         /// The null account when the token was minted
         account_id_type from;
         account_id_type to;
         token_id_type token_id = 0;
      };

      struct token_approval_operation {
         token_approval_operation() {}
         token_approval_operation(account_id_type o, account_id_type a, token_id_type id)
            : owner(o), approved(a), token_id(id) {}

         account_id_type invoker() const { return owner; }
         void validate() const { FC_ASSERT( !"virtual operation" ); }

         account_id_type owner;
         account_id_type approved;
         token_id_type token_id = 0;
      };

      struct operator_approval_operation {
         operator_approval_operation() {}
         operator_approval_operation(account_id_type o, account_id_type op, bool a)
            : owner(o), operator_account(op), approved(a) {}

         account_id_type invoker() const { return owner; }
         void validate() const { FC_ASSERT( !"virtual operation" ); }

         account_id_type owner;
         account_id_type operator_account;
         bool approved = false;
      };

      /// @}

   }
}

FC_REFLECT( lazymint::protocol::token_prepare_operation, (creator)(descriptor) )
FC_REFLECT( lazymint::protocol::royalty_set_operation, (creator)(token_id)(recipient)(basis_points) )
FC_REFLECT( lazymint::protocol::token_transfer_operation, (caller)(from)(to)(token_id)(data) )
FC_REFLECT( lazymint::protocol::token_approve_operation, (owner)(approved)(token_id) )
FC_REFLECT( lazymint::protocol::operator_set_operation, (owner)(operator_account)(approved) )
FC_REFLECT( lazymint::protocol::base_path_set_operation, (admin)(path) )

FC_REFLECT( lazymint::protocol::token_prepared_operation, (token_id)(creator)(descriptor) ) // VIRTUAL
FC_REFLECT( lazymint::protocol::token_minted_operation, (token_id)(owner) ) // VIRTUAL
FC_REFLECT( lazymint::protocol::royalty_updated_operation, (token_id)(recipient)(basis_points) ) // VIRTUAL
FC_REFLECT( lazymint::protocol::ownership_transferred_operation, (from)(to)(token_id) ) // VIRTUAL
FC_REFLECT( lazymint::protocol::token_approval_operation, (owner)(approved)(token_id) ) // VIRTUAL
FC_REFLECT( lazymint::protocol::operator_approval_operation, (owner)(operator_account)(approved) ) // VIRTUAL
