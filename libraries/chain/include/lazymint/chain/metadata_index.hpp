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

#include <lazymint/chain/token_object.hpp>

namespace lazymint {
   namespace chain {

      /**
       * @brief Maps the hash of a token descriptor to the token that claimed it
       */
      class metadata_uniqueness_index {
      public:
         explicit metadata_uniqueness_index(undo_database &udb) : _claims(udb) {}

         /**
          * @brief Claim a descriptor hash for a token
          * @param hash SHA-256 of the descriptor
          * @param id Token claiming the descriptor
          * @throws duplicate_metadata if the hash is already claimed.  Nothing is recorded in that case.
          */
         void register_descriptor(const fc::sha256 &hash, token_id_type id);

         /// Token that claimed the hash, if any
         optional<token_id_type> find(const fc::sha256 &hash) const;

         static fc::sha256 hash_descriptor(const string &descriptor);

      private:
         descriptor_claim_index _claims;
      };

   }
} // lazymint::chain
