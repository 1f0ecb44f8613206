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

#include <cstddef>
#include <vector>

namespace lazymint {
   namespace db {

      /**
       * @brief State that can be rolled back by an undo session
       *
       * Every call to push_undo_state() is matched by exactly one call to either
       * undo() or merge().
       */
      class undoable {
      public:
         virtual ~undoable() {}

         /// Begin recording changes in a new frame
         virtual void push_undo_state() = 0;

         /// Revert all changes recorded in the top frame and discard it
         virtual void undo() = 0;

         /// Fold the top frame into the frame below it, or discard it when it is the only frame
         virtual void merge() = 0;
      };

      /**
       * @brief Coordinates undo frames across every registered undoable
       *
       * Sessions nest.  Committing an inner session merges its changes into the enclosing session so
       * they are still reverted if the enclosing session is undone.  Committing the outermost session
       * makes the changes permanent.
       */
      class undo_database {
      public:
         class session {
         public:
            session(session &&mv);
            ~session();

            /// Keep the changes made during this session
            void commit();

            /// Revert the changes made during this session
            void undo();

         private:
            friend class undo_database;

            explicit session(undo_database &db);

            session(const session &) = delete;
            session &operator=(const session &) = delete;

            undo_database &_db;
            bool _apply = true;
         };

         undo_database() {}

         /// Register state that must follow undo sessions
         void add(undoable &member);

         session start_undo_session();

         /// Number of open sessions
         std::size_t depth() const { return _depth; }

      private:
         void push();
         void undo();
         void merge();

         std::vector<undoable*> _members;
         std::size_t _depth = 0;
      };

   }
} // lazymint::db
