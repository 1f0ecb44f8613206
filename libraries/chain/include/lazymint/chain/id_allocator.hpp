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
#include <lazymint/db/undoable_value.hpp>

namespace lazymint {
   namespace chain {

      /**
       * @brief Issues strictly increasing token IDs starting at 1
       *
       * The last issued ID follows undo sessions: an ID issued by an operation that fails is issued
       * again by the next operation, so the sequence has no gaps.
       */
      class sequential_id_allocator {
      public:
         explicit sequential_id_allocator(undo_database &udb) : _last_issued(udb, 0) {}

         token_id_type next();

         /// Highest ID issued so far, 0 before the first issuance
         token_id_type last_issued() const { return _last_issued.get(); }

      private:
         undoable_value<token_id_type> _last_issued;
      };

   }
} // lazymint::chain
