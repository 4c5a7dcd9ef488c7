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

#include <boost/program_options.hpp>

#include <string>

namespace tessera { namespace app {

/**
 * Lifecycle of an optional component attached to a registry:
 * options are declared, then plugin_initialize() receives the parsed values,
 * then plugin_startup() runs; plugin_shutdown() runs before destruction.
 */
class abstract_plugin
{
   public:
      virtual ~abstract_plugin() = default;

      virtual std::string plugin_name()const = 0;
      virtual std::string plugin_description()const = 0;

      /**
       * @param cli Options accepted on the command line only
       * @param cfg Options accepted on the command line and in configuration files
       */
      virtual void plugin_set_program_options(
         boost::program_options::options_description& cli,
         boost::program_options::options_description& cfg) = 0;

      virtual void plugin_initialize( const boost::program_options::variables_map& options ) = 0;
      virtual void plugin_startup() = 0;
      virtual void plugin_shutdown() = 0;
};

/// Base for plugins bound to one registry database
class plugin : public abstract_plugin
{
   public:
      explicit plugin( chain::database& db );
      ~plugin() override = default;

      std::string plugin_name()const override;
      std::string plugin_description()const override;
      void plugin_set_program_options(
         boost::program_options::options_description& cli,
         boost::program_options::options_description& cfg) override;
      void plugin_initialize( const boost::program_options::variables_map& options ) override;
      void plugin_startup() override;
      void plugin_shutdown() override;

      chain::database& database()const { return _db; }

   private:
      chain::database& _db;
};

} } // tessera::app
