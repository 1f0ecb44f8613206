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

#include <lazymint/protocol/config.hpp>

#include <fc/optional.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/variant.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace lazymint {
   namespace protocol {

      using std::string;
      using std::vector;
      using fc::optional;

      /// Sequential identifier of a prepared token
      typedef uint64_t token_id_type;

      /// Royalty rate in hundredths of a percent, as stored once accepted
      typedef uint16_t basis_points_type;

      /// Royalty rate as requested.  Wide enough that no out-of-range request is narrowed into range.
      typedef uint64_t requested_basis_points_type;

      /**
       * @brief Identity of an account
       *
       * Accounts are opaque to the ledger.  The instance 0 is the null account, used wherever the
       * ledger reports the absence of an account.
       */
      struct account_id_type {
         account_id_type() {}
         explicit account_id_type(uint64_t i) : instance(i) {}

         bool is_null() const { return instance == 0; }

         friend bool operator==(const account_id_type &a, const account_id_type &b) {
            return a.instance == b.instance;
         }
         friend bool operator!=(const account_id_type &a, const account_id_type &b) {
            return a.instance != b.instance;
         }
         friend bool operator<(const account_id_type &a, const account_id_type &b) {
            return a.instance < b.instance;
         }

         uint64_t instance = 0;
      };

      struct void_result {};

   }
} // lazymint::protocol

#define LAZYMINT_NULL_ACCOUNT (lazymint::protocol::account_id_type(0))

namespace fc {
   void to_variant(const lazymint::protocol::account_id_type &var, fc::variant &vo, uint32_t max_depth = 1);
   void from_variant(const fc::variant &var, lazymint::protocol::account_id_type &vo, uint32_t max_depth = 1);
}

FC_REFLECT_TYPENAME( lazymint::protocol::account_id_type )
FC_REFLECT( lazymint::protocol::void_result, )
