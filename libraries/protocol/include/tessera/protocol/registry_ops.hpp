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

#include <tessera/protocol/config.hpp>
#include <tessera/protocol/types.hpp>

namespace tessera {
   namespace protocol {

      /**
       * @brief Provision a new extension and assign tokens to it
       *
       * The extension receives the next ordinal in the extension sequence.
       */
      struct extension_create_operation {
         /// Upper bound on the number of tokens pledged for the extension
         uint64_t target_supply = 0;

         /// Token identifiers permanently assigned to the new extension
         vector<token_id_type> token_ids;

         void validate() const;
      };

      struct mint_operation {
         /// Recipient of the new token
         account_id_type to;

         token_id_type token_id = 0;

         void validate() const {}
      };

      struct burn_operation {
         token_id_type token_id = 0;

         void validate() const {}
      };

      /**
       * @brief Move a token between holders
       *
       * The sender must be the owner, the account approved for the token,
       * or an operator approved for all of the owner's tokens.
       */
      struct transfer_operation {
         /// Account initiating the transfer
         account_id_type sender;

         /// Expected current owner
         account_id_type from;

         account_id_type to;

         token_id_type token_id = 0;

         void validate() const {}
      };

      /**
       * @brief Transfer that notifies a programmable recipient
       *
       * When the recipient has a registered receiver, it is notified once
       * the transfer has been applied and must acknowledge it with
       * TESSERA_TOKEN_RECEIVED_ACK, otherwise the transfer is undone.
       */
      struct safe_transfer_operation {
         account_id_type sender;
         account_id_type from;
         account_id_type to;
         token_id_type token_id = 0;

         /// Opaque payload forwarded to the recipient
         vector<char> data;

         void validate() const;
      };

      struct approve_operation {
         /// Owner of the token or one of the owner's operators
         account_id_type sender;

         /// Account to approve; the null account clears the approval
         account_id_type to;

         token_id_type token_id = 0;

         void validate() const {}
      };

      struct set_approval_for_all_operation {
         account_id_type owner;
         account_id_type operator_account;
         bool approved = false;

         void validate() const {}
      };

      /**
       * @brief Seal an extension at its realized supply
       *
       * Overwrites the extension's target supply with the number of its live
       * tokens and adds that number to the finalized supply.
       */
      struct finalize_distribution_operation {
         extension_id_type extension_id = 0;

         void validate() const {}
      };

      struct set_token_uri_operation {
         token_id_type token_id = 0;

         /// Appended to the registry's base URI; empty clears the suffix
         string uri_suffix;

         void validate() const;
      };

   }
} // tessera::protocol

FC_REFLECT( tessera::protocol::extension_create_operation, (target_supply)(token_ids) )
FC_REFLECT( tessera::protocol::mint_operation, (to)(token_id) )
FC_REFLECT( tessera::protocol::burn_operation, (token_id) )
FC_REFLECT( tessera::protocol::transfer_operation, (sender)(from)(to)(token_id) )
FC_REFLECT( tessera::protocol::safe_transfer_operation, (sender)(from)(to)(token_id)(data) )
FC_REFLECT( tessera::protocol::approve_operation, (sender)(to)(token_id) )
FC_REFLECT( tessera::protocol::set_approval_for_all_operation, (owner)(operator_account)(approved) )
FC_REFLECT( tessera::protocol::finalize_distribution_operation, (extension_id) )
FC_REFLECT( tessera::protocol::set_token_uri_operation, (token_id)(uri_suffix) )
