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

namespace tessera {
   namespace chain {
      using protocol::account_id_type;
      using protocol::extension_id_type;
      using protocol::token_id_type;

      /**
       *  @brief Policy consulted before the registry changes
       *
       *  Invoked after an operation has passed every check and before any
       *  state is modified. Throwing from a callback aborts the operation.
       *  The default implementation permits everything.
       */
      class transfer_hook {
      public:
         virtual ~transfer_hook() = default;

         /**
          * @param from Current owner, or the null account for a mint
          * @param to New owner, or the null account for a burn
          * @param token_id Token about to change hands
          */
         virtual void before_token_transfer(const account_id_type &from,
                                            const account_id_type &to,
                                            token_id_type token_id) {}

         virtual void before_distribution_finalized(extension_id_type extension_id) {}
      };

      /**
       *  @brief Programmable recipient of safe transfers
       *
       *  An account becomes programmable once a receiver is registered for it.
       */
      class token_receiver {
      public:
         virtual ~token_receiver() = default;

         /**
          * @param operator_account Account that initiated the transfer
          * @param from Previous owner
          * @param token_id Token received
          * @param data Payload attached to the transfer
          * @return TESSERA_TOKEN_RECEIVED_ACK to accept the token
          */
         virtual uint32_t on_token_received(const account_id_type &operator_account,
                                            const account_id_type &from,
                                            token_id_type token_id,
                                            const std::vector<char> &data) = 0;
      };

   }
} // tessera::chain
