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
#include <lazymint/db/undo_database.hpp>

#include <fc/exception/exception.hpp>
#include <fc/log/logger.hpp>

#include <exception>

namespace lazymint {
   namespace db {

      undo_database::session::session(undo_database &db) : _db(db) {
         _db.push();
      }

      undo_database::session::session(session &&mv) : _db(mv._db), _apply(mv._apply) {
         mv._apply = false;
      }

      undo_database::session::~session() {
         try {
            if (_apply) {
               _db.undo();
            }
         } catch (const fc::exception &e) {
            // An inconsistent state cannot be recovered from
            elog("Unable to revert undo session: ${e}", ("e", e.to_detail_string()));
            std::terminate();
         }
      }

      void undo_database::session::commit() {
         FC_ASSERT(_apply, "The undo session has already been closed");
         _db.merge();
         _apply = false;
      }

      void undo_database::session::undo() {
         FC_ASSERT(_apply, "The undo session has already been closed");
         _db.undo();
         _apply = false;
      }

      void undo_database::add(undoable &member) {
         FC_ASSERT(_depth == 0, "State may not be registered while an undo session is open");
         _members.push_back(&member);
      }

      undo_database::session undo_database::start_undo_session() {
         return session(*this);
      }

      void undo_database::push() {
         for (undoable *member : _members) {
            member->push_undo_state();
         }
         ++_depth;
      }

      void undo_database::undo() {
         FC_ASSERT(_depth > 0, "There is no undo session to revert");
         // Revert in the reverse order of registration
         for (auto itr = _members.rbegin(); itr != _members.rend(); ++itr) {
            (*itr)->undo();
         }
         --_depth;
      }

      void undo_database::merge() {
         FC_ASSERT(_depth > 0, "There is no undo session to commit");
         for (undoable *member : _members) {
            member->merge();
         }
         --_depth;
      }

   }
} // lazymint::db
