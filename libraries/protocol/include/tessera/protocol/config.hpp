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

#include <tessera/protocol/types.hpp>

/// The null identity: source of minted tokens and destination of burned ones
#define TESSERA_NULL_ACCOUNT (tessera::protocol::account_id_type(0))

/// Value a token_receiver must return to accept a safe transfer
#define TESSERA_TOKEN_RECEIVED_ACK (uint32_t(0x150b7a02))

/// Extension a token falls into when it was never explicitly assigned
#define TESSERA_DEFAULT_EXTENSION (tessera::protocol::extension_id_type(0))

#define TESSERA_MAX_NESTED_OBJECTS (200)

/// Upper bound on the payload handed to a token_receiver
#define TESSERA_MAX_RECEIVER_DATA_SIZE (64 * 1024)

#define TESSERA_MAX_URI_SUFFIX_LENGTH (2048)
