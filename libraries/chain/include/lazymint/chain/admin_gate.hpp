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
       * @brief Capability that decides who may administer the ledger
       */
      class admin_gate {
      public:
         virtual ~admin_gate() {}

         virtual bool is_admin(const account_id_type &account) const = 0;

         /// @throws unauthorized
         void require_admin(const account_id_type &caller) const;
      };

      /// A single fixed administrator.  With the null account configured nobody is an administrator.
      class single_admin_gate : public admin_gate {
      public:
         explicit single_admin_gate(const account_id_type &admin) : _admin(admin) {}

         bool is_admin(const account_id_type &account) const override {
            return !_admin.is_null() && account == _admin;
         }

         const account_id_type &admin() const { return _admin; }

      private:
         account_id_type _admin;
      };

   }
} // lazymint::chain
