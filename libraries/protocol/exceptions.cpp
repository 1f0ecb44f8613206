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
#include <lazymint/protocol/exceptions.hpp>

namespace lazymint {
   namespace protocol {

      FC_IMPLEMENT_EXCEPTION( ledger_exception, 4000000, "token ledger exception" )

      FC_IMPLEMENT_DERIVED_EXCEPTION( empty_descriptor, ledger_exception, 4010001,
                                      "token descriptor is empty" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( duplicate_metadata, ledger_exception, 4010002,
                                      "token descriptor is already claimed" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( unknown_token, ledger_exception, 4010003,
                                      "token was never prepared" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( already_minted, ledger_exception, 4010004,
                                      "token is already minted" )

      FC_IMPLEMENT_DERIVED_EXCEPTION( unauthorized, ledger_exception, 4020001,
                                      "account is not authorized" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( royalty_too_high, ledger_exception, 4020002,
                                      "royalty exceeds 100 percent" )

      FC_IMPLEMENT_DERIVED_EXCEPTION( ownership_exception, ledger_exception, 4030000,
                                      "ownership ledger exception" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( nonexistent_token, ownership_exception, 4030001,
                                      "token has no owner" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( token_already_owned, ownership_exception, 4030002,
                                      "token already has an owner" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( transfer_from_incorrect_owner, ownership_exception, 4030003,
                                      "transfer source is not the owner" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( transfer_to_null_account, ownership_exception, 4030004,
                                      "transfer to the null account" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( transfer_not_authorized, ownership_exception, 4030005,
                                      "caller is neither owner nor approved" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( receiver_rejected, ownership_exception, 4030006,
                                      "recipient rejected the token" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( approval_not_authorized, ownership_exception, 4030007,
                                      "caller may not approve for this token" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( approval_to_current_owner, ownership_exception, 4030008,
                                      "approval to the current owner" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( approval_to_caller, ownership_exception, 4030009,
                                      "operator approval to the caller" )

   }
} // lazymint::protocol
