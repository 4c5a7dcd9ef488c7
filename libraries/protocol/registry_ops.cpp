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
#include <tessera/protocol/registry_ops.hpp>

#include <fc/exception/exception.hpp>

#include <set>

namespace tessera {
   namespace protocol {
      void extension_create_operation::validate() const {
         std::set<token_id_type> unique_ids(token_ids.begin(), token_ids.end());
         FC_ASSERT(unique_ids.size() == token_ids.size(),
                   "A token may be assigned to an extension only once");
      }

      void safe_transfer_operation::validate() const {
         FC_ASSERT(data.size() <= TESSERA_MAX_RECEIVER_DATA_SIZE,
                   "The receiver payload (${size} bytes) exceeds the maximum of ${max} bytes",
                   ("size", data.size())("max", TESSERA_MAX_RECEIVER_DATA_SIZE));
      }

      void set_token_uri_operation::validate() const {
         FC_ASSERT(uri_suffix.size() <= TESSERA_MAX_URI_SUFFIX_LENGTH,
                   "The URI suffix should not exceed ${max} characters",
                   ("max", TESSERA_MAX_URI_SUFFIX_LENGTH));
      }
   }
}
