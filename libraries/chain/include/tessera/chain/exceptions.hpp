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

#include <fc/exception/exception.hpp>

#define TESSERA_ASSERT( expr, exc_type, FORMAT, ... )                \
   FC_MULTILINE_MACRO_BEGIN                                           \
   if( !(expr) )                                                      \
      FC_THROW_EXCEPTION( exc_type, FORMAT, __VA_ARGS__ );            \
   FC_MULTILINE_MACRO_END

namespace tessera {
   namespace chain {

      FC_DECLARE_EXCEPTION( registry_exception, 4000000 )

      /// Token, extension or entry is absent
      FC_DECLARE_DERIVED_EXCEPTION( not_found_exception,         registry_exception, 4010000 )
      /// Positional access at or beyond the length of a collection
      FC_DECLARE_DERIVED_EXCEPTION( out_of_range_exception,      registry_exception, 4020000 )
      /// Mint collision, or a token assigned to a second extension
      FC_DECLARE_DERIVED_EXCEPTION( already_exists_exception,    registry_exception, 4030000 )
      /// The stated sender of a transfer is not the recorded owner
      FC_DECLARE_DERIVED_EXCEPTION( owner_mismatch_exception,    registry_exception, 4040000 )
      FC_DECLARE_DERIVED_EXCEPTION( invalid_recipient_exception, registry_exception, 4050000 )
      /// A programmable recipient declined a safe transfer
      FC_DECLARE_DERIVED_EXCEPTION( transfer_rejected_exception, registry_exception, 4060000 )
      FC_DECLARE_DERIVED_EXCEPTION( not_authorized_exception,    registry_exception, 4070000 )
      FC_DECLARE_DERIVED_EXCEPTION( invalid_owner_exception,     registry_exception, 4080000 )
      /// A write was attempted while a token receiver was being notified
      FC_DECLARE_DERIVED_EXCEPTION( reentrant_call_exception,    registry_exception, 4090000 )

   }
} // tessera::chain
