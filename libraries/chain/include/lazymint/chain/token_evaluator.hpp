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

#include <lazymint/chain/evaluator.hpp>
#include <lazymint/chain/token_object.hpp>

namespace lazymint {
   namespace chain {

      class token_prepare_evaluator : public evaluator<token_prepare_evaluator> {
      public:
         typedef token_prepare_operation operation_type;

         void_result do_evaluate(const token_prepare_operation &o);

         token_id_type do_apply(const token_prepare_operation &o);
      };

      class royalty_set_evaluator : public evaluator<royalty_set_evaluator> {
      public:
         typedef royalty_set_operation operation_type;

         void_result do_evaluate(const royalty_set_operation &o);

         void_result do_apply(const royalty_set_operation &o);
      };

      class token_transfer_evaluator : public evaluator<token_transfer_evaluator> {
      public:
         typedef token_transfer_operation operation_type;

         void_result do_evaluate(const token_transfer_operation &o);

         void_result do_apply(const token_transfer_operation &o);
      };

      class token_approve_evaluator : public evaluator<token_approve_evaluator> {
      public:
         typedef token_approve_operation operation_type;

         void_result do_evaluate(const token_approve_operation &o);

         void_result do_apply(const token_approve_operation &o);
      };

      class operator_set_evaluator : public evaluator<operator_set_evaluator> {
      public:
         typedef operator_set_operation operation_type;

         void_result do_evaluate(const operator_set_operation &o);

         void_result do_apply(const operator_set_operation &o);
      };

      class base_path_set_evaluator : public evaluator<base_path_set_evaluator> {
      public:
         typedef base_path_set_operation operation_type;

         void_result do_evaluate(const base_path_set_operation &o);

         void_result do_apply(const base_path_set_operation &o);
      };

   } // namespace chain
} // namespace lazymint
