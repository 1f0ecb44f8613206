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
#include <lazymint/db/undoable_value.hpp>

namespace lazymint {
   namespace chain {

      /**
       * @brief Capability that turns token descriptors into retrievable locations
       */
      class descriptor_store {
      public:
         virtual ~descriptor_store() {}

         virtual void set_base_path(const string &path) = 0;

         virtual const string &base_path() const = 0;

         /// Full location of a descriptor
         virtual string resolve(const string &descriptor) const = 0;
      };

      /**
       * @brief Prefixes every descriptor with a single base path
       *
       * The base path follows undo sessions.
       */
      class base_path_descriptor_store : public descriptor_store {
      public:
         base_path_descriptor_store(undo_database &udb, const string &initial_path);

         void set_base_path(const string &path) override;

         const string &base_path() const override { return _base_path.get(); }

         string resolve(const string &descriptor) const override;

      private:
         undoable_value<string> _base_path;
      };

   }
} // lazymint::chain
