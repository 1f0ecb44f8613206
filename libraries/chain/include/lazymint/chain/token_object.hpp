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

/**
 * @defgroup token Prepared token objects
 */

namespace lazymint {
   namespace chain {

      /**
       *  @brief Tracks a prepared token
       *  @ingroup token
       *
       *  The creator, descriptor and descriptor hash are written once when the token is prepared.
       *  The minted flag is only ever raised by the token registry on behalf of the mint gate.
       */
      class token_object : public object {
      public:
         /// Sequential token ID issued at preparation
         token_id_type token_id = 0;

         /// Account that prepared the token
         account_id_type creator;

         /// Opaque metadata pointer
         string descriptor;

         /// SHA-256 of the descriptor bytes
         fc::sha256 descriptor_hash;

         /// Whether the first transfer has minted the token
         bool minted = false;

         /// Owner of record at the instant of minting.  Null until minted.
         account_id_type minted_to;
      };

      struct by_token_id;
      struct by_token_creator;
      typedef multi_index_container<
         token_object,
         indexed_by<
            ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
            ordered_unique< tag<by_token_id>, member<token_object, token_id_type, &token_object::token_id> >,
            ordered_non_unique< tag<by_token_creator>, member<token_object, account_id_type, &token_object::creator> >
         >
      > token_multi_index_type;
      typedef generic_index<token_object, token_multi_index_type> token_index;


      /**
       *  @brief Claim of a descriptor hash by a token
       *  @ingroup token
       */
      class descriptor_claim_object : public object {
      public:
         fc::sha256 descriptor_hash;

         /// Token that claimed the descriptor
         token_id_type token_id = 0;
      };

      struct by_descriptor_hash;
      typedef multi_index_container<
         descriptor_claim_object,
         indexed_by<
            ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
            ordered_unique< tag<by_descriptor_hash>,
               member<descriptor_claim_object, fc::sha256, &descriptor_claim_object::descriptor_hash> >
         >
      > descriptor_claim_multi_index_type;
      typedef generic_index<descriptor_claim_object, descriptor_claim_multi_index_type> descriptor_claim_index;
   }
} // lazymint::chain

FC_REFLECT_DERIVED( lazymint::chain::token_object, (lazymint::db::object),
                    (token_id)
                    (creator)
                    (descriptor)
                    (descriptor_hash)
                    (minted)
                    (minted_to)
                  )

FC_REFLECT_DERIVED( lazymint::chain::descriptor_claim_object, (lazymint::db::object),
                    (descriptor_hash)
                    (token_id)
                  )
