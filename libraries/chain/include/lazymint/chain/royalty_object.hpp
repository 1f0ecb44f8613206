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

namespace lazymint {
   namespace chain {

      /**
       *  @brief Royalty terms of a token
       *  @ingroup token
       *
       *  At most one object exists per token.  Its absence means that no royalty is owed.
       */
      class royalty_object : public object {
      public:
         token_id_type token_id = 0;

         /// Beneficiary of royalty payments
         account_id_type recipient;

         /// Royalty rate in hundredths of a percent.  Never exceeds LAZYMINT_100_PERCENT.
         basis_points_type basis_points = 0;
      };

      struct by_royalty_token;
      typedef multi_index_container<
         royalty_object,
         indexed_by<
            ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
            ordered_unique< tag<by_royalty_token>, member<royalty_object, token_id_type, &royalty_object::token_id> >
         >
      > royalty_multi_index_type;
      typedef generic_index<royalty_object, royalty_multi_index_type> royalty_index;
   }
} // lazymint::chain

FC_REFLECT_DERIVED( lazymint::chain::royalty_object, (lazymint::db::object),
                    (token_id)
                    (recipient)
                    (basis_points)
                  )
