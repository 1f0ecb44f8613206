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

#include <lazymint/protocol/token_ops.hpp>

#include <fc/static_variant.hpp>

namespace lazymint {
   namespace protocol {

      /**
       * @ingroup operations
       *
       * Defines the set of valid operations as a discriminated union type.
       * New operations are appended; the position of an operation is its wire tag.
       */
      typedef fc::static_variant<
            token_prepare_operation,
            royalty_set_operation,
            token_transfer_operation,
            token_approve_operation,
            operator_set_operation,
            base_path_set_operation,
            token_prepared_operation,          // VIRTUAL
            token_minted_operation,            // VIRTUAL
            royalty_updated_operation,         // VIRTUAL
            ownership_transferred_operation,   // VIRTUAL
            token_approval_operation,          // VIRTUAL
            operator_approval_operation        // VIRTUAL
         > operation;

      typedef fc::static_variant<
            void_result,
            token_id_type
         > operation_result;

      /// Stateless validation of a submitted operation
      void operation_validate(const operation &op);

      bool is_virtual_operation(const operation &op);

      /// The account on whose behalf the operation was submitted or recorded
      account_id_type operation_invoker(const operation &op);

   }
} // lazymint::protocol

FC_REFLECT_TYPENAME( lazymint::protocol::operation )
FC_REFLECT_TYPENAME( lazymint::protocol::operation_result )
