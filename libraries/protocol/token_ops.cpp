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
#include <lazymint/protocol/token_ops.hpp>
#include <lazymint/protocol/exceptions.hpp>

namespace lazymint {
   namespace protocol {
      void token_prepare_operation::validate() const {
         FC_ASSERT(!creator.is_null(), "The null account may not prepare a token");
         LAZYMINT_ASSERT(!descriptor.empty(), empty_descriptor,
                         "A token may not be prepared without a descriptor (creator ${c})", ("c", creator));
      }

      void royalty_set_operation::validate() const {
         // The rate limit is checked by the royalty ledger after the creator check
         FC_ASSERT(!creator.is_null(), "The null account may not set a royalty");
      }

      void token_transfer_operation::validate() const {
         FC_ASSERT(!caller.is_null(), "The null account may not request a transfer");
      }

      void token_approve_operation::validate() const {
         FC_ASSERT(!owner.is_null(), "The null account may not approve a transfer");
      }

      void operator_set_operation::validate() const {
         LAZYMINT_ASSERT(owner != operator_account, approval_to_caller,
                         "Account ${a} may not be its own operator", ("a", owner));
      }

      void base_path_set_operation::validate() const {
         FC_ASSERT(!admin.is_null(), "The null account may not administer the ledger");
      }
   }
}
