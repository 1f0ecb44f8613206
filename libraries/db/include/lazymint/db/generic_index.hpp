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

#include <lazymint/db/object.hpp>
#include <lazymint/db/undo_database.hpp>

#include <fc/exception/exception.hpp>

#include <boost/multi_index_container.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>

#include <deque>
#include <map>
#include <set>
#include <utility>

namespace lazymint {
   namespace db {

      using boost::multi_index_container;
      using namespace boost::multi_index;

      /**
       *  @brief A boost::multi_index container whose mutations follow undo sessions
       *
       *  The first index of MultiIndexType must be ordered_unique on object::id and tagged by_id.
       *  Objects may only be mutated through create() and modify() so that the index can record the
       *  prior state while a session is open.
       */
      template<typename ObjectType, typename MultiIndexType>
      class generic_index : public undoable {
      public:
         typedef ObjectType object_type;
         typedef MultiIndexType index_type;

         explicit generic_index(undo_database &udb) {
            udb.add(*this);
         }

         template<typename Constructor>
         const object_type &create(Constructor &&constructor) {
            object_type obj;
            obj.id = _next_id;
            constructor(obj);
            FC_ASSERT(obj.id == _next_id, "The object id is assigned by the index");

            auto insert_result = _indices.insert(std::move(obj));
            FC_ASSERT(insert_result.second,
                      "Could not create object, most likely a uniqueness constraint was violated");
            ++_next_id;

            on_create(*insert_result.first);
            return *insert_result.first;
         }

         template<typename Modifier>
         void modify(const object_type &obj, Modifier &&modifier) {
            on_modify(obj);

            const object_id_type id = obj.id;
            const bool ok = _indices.modify(_indices.iterator_to(obj), [&modifier, id](object_type &o) {
               modifier(o);
               o.id = id;
            });
            FC_ASSERT(ok, "Could not modify object, most likely a uniqueness constraint was violated");
         }

         const object_type *find(object_id_type id) const {
            const auto &id_idx = _indices.template get<by_id>();
            auto itr = id_idx.find(id);
            if (itr == id_idx.end()) {
               return nullptr;
            }
            return &*itr;
         }

         const object_type &get(object_id_type id) const {
            const object_type *ptr = find(id);
            FC_ASSERT(ptr != nullptr, "Unknown object ${id}", ("id", id));
            return *ptr;
         }

         const index_type &indices() const { return _indices; }

         std::size_t size() const { return _indices.size(); }

         void push_undo_state() override {
            undo_state state;
            state.old_next_id = _next_id;
            _stack.emplace_back(std::move(state));
         }

         void undo() override {
            FC_ASSERT(!_stack.empty(), "No undo state to revert");
            undo_state &state = _stack.back();
            auto &id_idx = _indices.template get<by_id>();

            for (const object_id_type id : state.new_ids) {
               id_idx.erase(id);
            }

            for (const auto &item : state.old_values) {
               auto itr = id_idx.find(item.first);
               if (itr != id_idx.end()) {
                  FC_ASSERT(id_idx.replace(itr, item.second), "Could not restore object ${id}", ("id", item.first));
               } else {
                  // A failed modify() erases the element
                  FC_ASSERT(id_idx.insert(item.second).second, "Could not restore object ${id}", ("id", item.first));
               }
            }

            _next_id = state.old_next_id;
            _stack.pop_back();
         }

         void merge() override {
            FC_ASSERT(!_stack.empty(), "No undo state to merge");
            if (_stack.size() == 1) {
               _stack.pop_back();
               return;
            }

            undo_state &state = _stack.back();
            undo_state &prev = _stack[_stack.size() - 2];

            for (auto &item : state.old_values) {
               // The enclosing frame already knows how to restore these
               if (prev.new_ids.count(item.first) || prev.old_values.count(item.first)) {
                  continue;
               }
               prev.old_values.emplace(item.first, std::move(item.second));
            }
            prev.new_ids.insert(state.new_ids.begin(), state.new_ids.end());

            _stack.pop_back();
         }

      private:
         struct undo_state {
            std::map<object_id_type, object_type> old_values;
            std::set<object_id_type> new_ids;
            object_id_type old_next_id = 0;
         };

         void on_create(const object_type &obj) {
            if (_stack.empty()) {
               return;
            }
            _stack.back().new_ids.insert(obj.id);
         }

         void on_modify(const object_type &obj) {
            if (_stack.empty()) {
               return;
            }
            undo_state &state = _stack.back();
            if (state.new_ids.count(obj.id) || state.old_values.count(obj.id)) {
               return;
            }
            state.old_values.emplace(obj.id, obj);
         }

         index_type _indices;
         object_id_type _next_id = 0;
         std::deque<undo_state> _stack;
      };

   }
} // lazymint::db
