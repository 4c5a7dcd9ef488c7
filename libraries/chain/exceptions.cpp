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
#include <tessera/chain/exceptions.hpp>

namespace tessera {
   namespace chain {

      FC_IMPLEMENT_EXCEPTION( registry_exception, 4000000, "registry exception" )

      FC_IMPLEMENT_DERIVED_EXCEPTION( not_found_exception,         registry_exception, 4010000,
                                      "not found" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( out_of_range_exception,      registry_exception, 4020000,
                                      "index out of range" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( already_exists_exception,    registry_exception, 4030000,
                                      "already exists" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( owner_mismatch_exception,    registry_exception, 4040000,
                                      "owner mismatch" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_recipient_exception, registry_exception, 4050000,
                                      "invalid recipient" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( transfer_rejected_exception, registry_exception, 4060000,
                                      "transfer rejected by recipient" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( not_authorized_exception,    registry_exception, 4070000,
                                      "caller is not owner nor approved" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_owner_exception,     registry_exception, 4080000,
                                      "null account is not a valid owner" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( reentrant_call_exception,    registry_exception, 4090000,
                                      "reentrant call" )

   }
} // tessera::chain
