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
       *  @brief A notification recorded by the ledger
       *  @ingroup object
       *
       *  The object ID is the position of the notification in the append-only log.  Notifications
       *  recorded by an operation that fails are reverted together with the operation.
       */
      class operation_history_object : public object {
      public:
         operation_history_object() {}
         explicit operation_history_object(const operation &o) : op(o) {}

         operation op;
      };

      typedef multi_index_container<
         operation_history_object,
         indexed_by<
            ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >
         >
      > operation_history_multi_index_type;
      typedef generic_index<operation_history_object, operation_history_multi_index_type> operation_history_index;

      /**
       * @brief Append-only log of notifications
       */
      class notification_log {
      public:
         explicit notification_log(undo_database &udb) : _history(udb) {}

         const operation_history_object &push(const operation &op);

         /// Number of notifications recorded, which is also the sequence of the next notification
         std::size_t size() const { return _history.size(); }

         /// Notifications with a sequence at or beyond @p start, in order
         vector<operation_history_object> since(object_id_type start) const;

         const operation_history_index &index() const { return _history; }

      private:
         operation_history_index _history;
      };
   }
} // lazymint::chain

FC_REFLECT_DERIVED( lazymint::chain::operation_history_object, (lazymint::db::object), (op) )
