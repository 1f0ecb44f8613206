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
#include <lazymint/chain/token_registry.hpp>

#include <fc/log/logger.hpp>

namespace lazymint {
   namespace chain {

      token_registry::token_registry(undo_database &udb, notification_log &log)
         : _udb(udb), _log(log), _ids(udb), _metadata(udb), _tokens(udb) {
      }

      token_id_type token_registry::prepare(const account_id_type &creator, const string &descriptor) {
         try {
            LAZYMINT_ASSERT(!descriptor.empty(), empty_descriptor,
                            "A token may not be prepared without a descriptor (creator ${c})", ("c", creator));

            const fc::sha256 hash = metadata_uniqueness_index::hash_descriptor(descriptor);

            // ID issuance and the descriptor claim are committed together or not at all
            auto session = _udb.start_undo_session();

            const token_id_type id = _ids.next();
            _metadata.register_descriptor(hash, id);

            _tokens.create([&](token_object &obj) {
               obj.token_id = id;
               obj.creator = creator;
               obj.descriptor = descriptor;
               obj.descriptor_hash = hash;
               obj.minted = false;
            });

            _log.push(token_prepared_operation(id, creator, descriptor));

            session.commit();

            dlog("Prepared token ${id} for creator ${c}", ("id", id)("c", creator));
            return id;
         } FC_CAPTURE_AND_RETHROW((creator)(descriptor))
      }

      bool token_registry::exists(token_id_type id) const {
         return id >= 1 && id <= _ids.last_issued();
      }

      const token_object *token_registry::find_token(token_id_type id) const {
         const auto &token_idx = _tokens.indices().get<by_token_id>();
         auto itr = token_idx.find(id);
         if (itr == token_idx.end()) {
            return nullptr;
         }
         return &*itr;
      }

      const token_object &token_registry::get_token(token_id_type id) const {
         const token_object *obj = exists(id) ? find_token(id) : nullptr;
         LAZYMINT_ASSERT(obj != nullptr, unknown_token, "Token ${id} was never prepared", ("id", id));
         return *obj;
      }

      account_id_type token_registry::creator_of(token_id_type id) const {
         return get_token(id).creator;
      }

      const string &token_registry::descriptor_of(token_id_type id) const {
         return get_token(id).descriptor;
      }

      bool token_registry::is_minted(token_id_type id) const {
         const token_object *obj = find_token(id);
         return obj != nullptr && obj->minted;
      }

      void token_registry::mark_minted(token_id_type id, const account_id_type &owner) {
         const token_object &obj = get_token(id);
         LAZYMINT_ASSERT(!obj.minted, already_minted,
                         "Token ${id} was already minted to ${owner}",
                         ("id", id)("owner", obj.minted_to));

         _tokens.modify(obj, [&owner](token_object &data) {
            data.minted = true;
            data.minted_to = owner;
         });

         _log.push(token_minted_operation(id, owner));

         dlog("Minted token ${id} to ${owner}", ("id", id)("owner", owner));
      }

   }
} // lazymint::chain
