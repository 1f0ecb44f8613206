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

#include <boost/multi_index/composite_key.hpp>

namespace lazymint {
   namespace chain {

      /**
       *  @brief Current owner of a minted token
       *  @ingroup token
       */
      class ownership_object : public object {
      public:
         token_id_type token_id = 0;

         account_id_type owner;

         /// Account approved to transfer this token only.  Null when none.
         account_id_type approved;
      };

      struct by_owned_token;
      struct by_owner;
      typedef multi_index_container<
         ownership_object,
         indexed_by<
            ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
            ordered_unique< tag<by_owned_token>, member<ownership_object, token_id_type, &ownership_object::token_id> >,
            ordered_non_unique< tag<by_owner>, member<ownership_object, account_id_type, &ownership_object::owner> >
         >
      > ownership_multi_index_type;
      typedef generic_index<ownership_object, ownership_multi_index_type> ownership_index;


      /**
       *  @brief Approval of an operator for every token of an owner
       *  @ingroup token
       */
      class operator_approval_object : public object {
      public:
         account_id_type owner;
         account_id_type operator_account;
         bool approved = false;
      };

      struct by_owner_operator;
      typedef multi_index_container<
         operator_approval_object,
         indexed_by<
            ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
            ordered_unique< tag<by_owner_operator>,
               composite_key<operator_approval_object,
                  member<operator_approval_object, account_id_type, &operator_approval_object::owner>,
                  member<operator_approval_object, account_id_type, &operator_approval_object::operator_account>
               >
            >
         >
      > operator_approval_multi_index_type;
      typedef generic_index<operator_approval_object, operator_approval_multi_index_type> operator_approval_index;
   }
} // lazymint::chain

FC_REFLECT_DERIVED( lazymint::chain::ownership_object, (lazymint::db::object),
                    (token_id)
                    (owner)
                    (approved)
                  )

FC_REFLECT_DERIVED( lazymint::chain::operator_approval_object, (lazymint::db::object),
                    (owner)
                    (operator_account)
                    (approved)
                  )
