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

#include <tessera/protocol/registry_ops.hpp>

#include <fc/static_variant.hpp>

namespace tessera {
   namespace protocol {

      /**
       * Every write accepted by the registry.
       *
       * The tag of each member is part of the JSON encoding used by
       * tessera_replay; append new operations at the end only.
       */
      typedef fc::static_variant<
         extension_create_operation,         // 0
         mint_operation,                     // 1
         burn_operation,                     // 2
         transfer_operation,                 // 3
         safe_transfer_operation,            // 4
         approve_operation,                  // 5
         set_approval_for_all_operation,     // 6
         finalize_distribution_operation,    // 7
         set_token_uri_operation             // 8
      > operation;

      /// Structural checks of an operation, independent of registry state
      void operation_validate(const operation &op);

   }
} // tessera::protocol
