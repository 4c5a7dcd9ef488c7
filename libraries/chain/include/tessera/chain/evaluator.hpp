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

#include <tessera/chain/database.hpp>

namespace tessera {
   namespace chain {

      /**
       *  @brief Two phase application of one operation type
       *
       *  do_evaluate() performs every check and must not modify the
       *  database; do_apply() performs the changes and must not fail on
       *  any condition do_evaluate() could have detected.
       */
      template<typename DerivedEvaluator>
      class evaluator {
      public:
         explicit evaluator(database &d) : _db(d) {}

         operation_result start_evaluate(const typename DerivedEvaluator::operation_type &op) {
            auto *eval = static_cast<DerivedEvaluator *>(this);
            eval->do_evaluate(op);
            return eval->do_apply(op);
         }

         database &db() const { return _db; }

      private:
         database &_db;
      };

   }
} // tessera::chain
