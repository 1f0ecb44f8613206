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
#include <lazymint/chain/metadata_index.hpp>

namespace lazymint {
   namespace chain {

      void metadata_uniqueness_index::register_descriptor(const fc::sha256 &hash, token_id_type id) {
         const auto &hash_idx = _claims.indices().get<by_descriptor_hash>();
         auto itr = hash_idx.find(hash);
         LAZYMINT_ASSERT(itr == hash_idx.end(), duplicate_metadata,
                         "The descriptor is already claimed by token ${claimant}",
                         ("claimant", itr->token_id)("hash", hash));

         _claims.create([&hash, id](descriptor_claim_object &obj) {
            obj.descriptor_hash = hash;
            obj.token_id = id;
         });
      }

      optional<token_id_type> metadata_uniqueness_index::find(const fc::sha256 &hash) const {
         const auto &hash_idx = _claims.indices().get<by_descriptor_hash>();
         auto itr = hash_idx.find(hash);
         if (itr == hash_idx.end()) {
            return optional<token_id_type>();
         }
         return itr->token_id;
      }

      fc::sha256 metadata_uniqueness_index::hash_descriptor(const string &descriptor) {
         return fc::sha256::hash(descriptor);
      }

   }
} // lazymint::chain
