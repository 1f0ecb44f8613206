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

#include <lazymint/db/undo_database.hpp>

#include <fc/exception/exception.hpp>

#include <utility>
#include <vector>

namespace lazymint {
   namespace db {

      /**
       * @brief A single value whose assignments follow undo sessions
       */
      template<typename T>
      class undoable_value : public undoable {
      public:
         explicit undoable_value(undo_database &udb, T initial = T()) : _value(std::move(initial)) {
            udb.add(*this);
         }

         const T &get() const { return _value; }

         void set(T value) { _value = std::move(value); }

         void push_undo_state() override {
            _saved.push_back(_value);
         }

         void undo() override {
            FC_ASSERT(!_saved.empty(), "No undo state to revert");
            _value = std::move(_saved.back());
            _saved.pop_back();
         }

         void merge() override {
            FC_ASSERT(!_saved.empty(), "No undo state to merge");
            // The value saved by the enclosing frame remains the restore point
            _saved.pop_back();
         }

      private:
         T _value;
         std::vector<T> _saved;
      };

   }
} // lazymint::db
