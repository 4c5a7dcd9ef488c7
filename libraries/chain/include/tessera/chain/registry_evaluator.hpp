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

#include <tessera/chain/evaluator.hpp>
#include <tessera/protocol/registry_ops.hpp>

namespace tessera {
   namespace chain {
      using namespace protocol;

      class extension_create_evaluator : public evaluator<extension_create_evaluator> {
      public:
         typedef extension_create_operation operation_type;
         using evaluator::evaluator;

         void_result do_evaluate(const extension_create_operation &o);

         extension_id_type do_apply(const extension_create_operation &o);
      };

      class mint_evaluator : public evaluator<mint_evaluator> {
      public:
         typedef mint_operation operation_type;
         using evaluator::evaluator;

         void_result do_evaluate(const mint_operation &o);

         void_result do_apply(const mint_operation &o);
      };

      class burn_evaluator : public evaluator<burn_evaluator> {
      public:
         typedef burn_operation operation_type;
         using evaluator::evaluator;

         void_result do_evaluate(const burn_operation &o);

         void_result do_apply(const burn_operation &o);

         account_id_type _owner;
      };

      class transfer_evaluator : public evaluator<transfer_evaluator> {
      public:
         typedef transfer_operation operation_type;
         using evaluator::evaluator;

         void_result do_evaluate(const transfer_operation &o);

         void_result do_apply(const transfer_operation &o);
      };

      class safe_transfer_evaluator : public evaluator<safe_transfer_evaluator> {
      public:
         typedef safe_transfer_operation operation_type;
         using evaluator::evaluator;

         void_result do_evaluate(const safe_transfer_operation &o);

         void_result do_apply(const safe_transfer_operation &o);
      };

      class approve_evaluator : public evaluator<approve_evaluator> {
      public:
         typedef approve_operation operation_type;
         using evaluator::evaluator;

         void_result do_evaluate(const approve_operation &o);

         void_result do_apply(const approve_operation &o);

         account_id_type _owner;
      };

      class set_approval_for_all_evaluator : public evaluator<set_approval_for_all_evaluator> {
      public:
         typedef set_approval_for_all_operation operation_type;
         using evaluator::evaluator;

         void_result do_evaluate(const set_approval_for_all_operation &o);

         void_result do_apply(const set_approval_for_all_operation &o);
      };

      class finalize_distribution_evaluator : public evaluator<finalize_distribution_evaluator> {
      public:
         typedef finalize_distribution_operation operation_type;
         using evaluator::evaluator;

         void_result do_evaluate(const finalize_distribution_operation &o);

         void_result do_apply(const finalize_distribution_operation &o);
      };

      class set_token_uri_evaluator : public evaluator<set_token_uri_evaluator> {
      public:
         typedef set_token_uri_operation operation_type;
         using evaluator::evaluator;

         void_result do_evaluate(const set_token_uri_operation &o);

         void_result do_apply(const set_token_uri_operation &o);
      };

      /**
       * Checks shared by transfer and safe transfer, in the order the
       * failures are reported: existence, authorization, ownership,
       * recipient.
       */
      void evaluate_transfer(const database &d, const account_id_type &sender,
                             const account_id_type &from, const account_id_type &to,
                             token_id_type token_id);

   } // namespace chain
} // namespace tessera
