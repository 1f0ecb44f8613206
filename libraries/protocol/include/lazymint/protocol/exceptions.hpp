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

#include <fc/exception/exception.hpp>

#define LAZYMINT_ASSERT( expr, exc_type, FORMAT, ... )                \
   FC_MULTILINE_MACRO_BEGIN                                           \
   if( !(expr) )                                                      \
      FC_THROW_EXCEPTION( exc_type, FORMAT, __VA_ARGS__ );            \
   FC_MULTILINE_MACRO_END

namespace lazymint {
   namespace protocol {

      FC_DECLARE_EXCEPTION( ledger_exception, 4000000 )

      // Token lifecycle
      FC_DECLARE_DERIVED_EXCEPTION( empty_descriptor,               ledger_exception, 4010001 )
      FC_DECLARE_DERIVED_EXCEPTION( duplicate_metadata,             ledger_exception, 4010002 )
      FC_DECLARE_DERIVED_EXCEPTION( unknown_token,                  ledger_exception, 4010003 )
      FC_DECLARE_DERIVED_EXCEPTION( already_minted,                 ledger_exception, 4010004 )

      // Royalties and administration
      FC_DECLARE_DERIVED_EXCEPTION( unauthorized,                   ledger_exception, 4020001 )
      FC_DECLARE_DERIVED_EXCEPTION( royalty_too_high,               ledger_exception, 4020002 )

      // Ownership ledger
      FC_DECLARE_DERIVED_EXCEPTION( ownership_exception,            ledger_exception, 4030000 )
      FC_DECLARE_DERIVED_EXCEPTION( nonexistent_token,              ownership_exception, 4030001 )
      FC_DECLARE_DERIVED_EXCEPTION( token_already_owned,            ownership_exception, 4030002 )
      FC_DECLARE_DERIVED_EXCEPTION( transfer_from_incorrect_owner,  ownership_exception, 4030003 )
      FC_DECLARE_DERIVED_EXCEPTION( transfer_to_null_account,       ownership_exception, 4030004 )
      FC_DECLARE_DERIVED_EXCEPTION( transfer_not_authorized,        ownership_exception, 4030005 )
      FC_DECLARE_DERIVED_EXCEPTION( receiver_rejected,              ownership_exception, 4030006 )
      FC_DECLARE_DERIVED_EXCEPTION( approval_not_authorized,        ownership_exception, 4030007 )
      FC_DECLARE_DERIVED_EXCEPTION( approval_to_current_owner,      ownership_exception, 4030008 )
      FC_DECLARE_DERIVED_EXCEPTION( approval_to_caller,             ownership_exception, 4030009 )

   }
} // lazymint::protocol
