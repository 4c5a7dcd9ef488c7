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

#include <fc/static_variant.hpp>

namespace tessera {
   namespace protocol {

      /// Emitted on mint (from is null), burn (to is null) and transfer
      struct transfer_event {
         transfer_event() {}
         transfer_event(account_id_type f, account_id_type t, token_id_type id)
            : from(f), to(t), token_id(id) {}

         account_id_type from;
         account_id_type to;
         token_id_type token_id = 0;
      };

      struct approval_event {
         approval_event() {}
         approval_event(account_id_type o, account_id_type a, token_id_type id)
            : owner(o), approved(a), token_id(id) {}

         account_id_type owner;
         account_id_type approved;
         token_id_type token_id = 0;
      };

      struct approval_for_all_event {
         approval_for_all_event() {}
         approval_for_all_event(account_id_type o, account_id_type op, bool a)
            : owner(o), operator_account(op), approved(a) {}

         account_id_type owner;
         account_id_type operator_account;
         bool approved = false;
      };

      typedef fc::static_variant<
         transfer_event,
         approval_event,
         approval_for_all_event
      > event_type;

   }
} // tessera::protocol

FC_REFLECT( tessera::protocol::transfer_event, (from)(to)(token_id) )
FC_REFLECT( tessera::protocol::approval_event, (owner)(approved)(token_id) )
FC_REFLECT( tessera::protocol::approval_for_all_event, (owner)(operator_account)(approved) )
