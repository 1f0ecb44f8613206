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
#include <lazymint/chain/operation_history_object.hpp>

#include <fc/log/logger.hpp>

namespace lazymint {
   namespace chain {

      const operation_history_object &notification_log::push(const operation &op) {
         FC_ASSERT(is_virtual_operation(op), "Only virtual operations are recorded as notifications");
         const operation_history_object &entry = _history.create([&op](operation_history_object &obj) {
            obj.op = op;
         });
         dlog("Recorded notification ${seq}: ${op}", ("seq", entry.id)("op", op));
         return entry;
      }

      vector<operation_history_object> notification_log::since(object_id_type start) const {
         vector<operation_history_object> result;
         const auto &id_idx = _history.indices().get<by_id>();
         for (auto itr = id_idx.lower_bound(start); itr != id_idx.end(); ++itr) {
            result.push_back(*itr);
         }
         return result;
      }

   }
} // lazymint::chain
