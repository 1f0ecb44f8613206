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
#include <lazymint/chain/descriptor_store.hpp>

#include <fc/log/logger.hpp>

namespace lazymint {
   namespace chain {

      base_path_descriptor_store::base_path_descriptor_store(undo_database &udb, const string &initial_path)
         : _base_path(udb, initial_path) {
      }

      void base_path_descriptor_store::set_base_path(const string &path) {
         dlog("Descriptor base path changed from '${old}' to '${new}'", ("old", _base_path.get())("new", path));
         _base_path.set(path);
      }

      string base_path_descriptor_store::resolve(const string &descriptor) const {
         return _base_path.get() + descriptor;
      }

   }
} // lazymint::chain
