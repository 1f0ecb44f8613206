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

#include <lazymint/chain/id_allocator.hpp>
#include <lazymint/chain/metadata_index.hpp>
#include <lazymint/chain/operation_history_object.hpp>
#include <lazymint/chain/token_object.hpp>

namespace lazymint {
   namespace chain {
      class mint_gate;

      namespace test { struct token_registry_access; }

      /**
       * @brief Authoritative record of prepared tokens
       *
       * Each registry owns its ID allocator and descriptor index, so independent registries never
       * share state.
       */
      class token_registry {
      public:
         token_registry(undo_database &udb, notification_log &log);

         /**
          * @brief Register a token without creating any ownership
          * @param creator Account that becomes the permanent creator
          * @param descriptor Non-empty metadata pointer
          * @return The newly issued token ID
          * @throws empty_descriptor, duplicate_metadata.  No ID is consumed on failure.
          */
         token_id_type prepare(const account_id_type &creator, const string &descriptor);

         /// True iff 1 <= id <= current_token_id()
         bool exists(token_id_type id) const;

         /// @throws unknown_token
         account_id_type creator_of(token_id_type id) const;

         /// @throws unknown_token
         const string &descriptor_of(token_id_type id) const;

         /// False for tokens that were never prepared
         bool is_minted(token_id_type id) const;

         /// Highest token ID issued so far
         token_id_type current_token_id() const { return _ids.last_issued(); }

         /// @throws unknown_token
         const token_object &get_token(token_id_type id) const;

         const token_object *find_token(token_id_type id) const;

         const token_index &tokens() const { return _tokens; }

         /// Token that claimed a descriptor hash, if any
         optional<token_id_type> find_claimant(const fc::sha256 &hash) const { return _metadata.find(hash); }

      private:
         friend class mint_gate;
         friend struct test::token_registry_access;

         /// The only writer of the minted flag
         void mark_minted(token_id_type id, const account_id_type &owner);

         undo_database &_udb;
         notification_log &_log;

         sequential_id_allocator _ids;
         metadata_uniqueness_index _metadata;
         token_index _tokens;
      };

   }
} // lazymint::chain
