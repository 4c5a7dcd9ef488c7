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
#include <tessera/chain/database.hpp>
#include <tessera/chain/exceptions.hpp>
#include <tessera/protocol/config.hpp>
#include <tessera/transfer_history/transfer_history.hpp>

#include <fc/exception/exception.hpp>
#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>
#include <fc/variant_object.hpp>

#include <boost/program_options.hpp>

#include <iostream>
#include <memory>

namespace bpo = boost::program_options;

using namespace tessera;

namespace {

   void set_log_level(const std::string &level) {
      const fc::log_level lvl = fc::variant(level, 1).as<fc::log_level>(1);
      fc::logger::get(DEFAULT_LOGGER).set_log_level(lvl);
   }

   chain::registry_config make_config(const bpo::variables_map &options) {
      chain::registry_config config;
      if (options.count("config-file") > 0) {
         config = chain::load_registry_config(options["config-file"].as<std::string>());
      }
      if (options.count("base-uri") > 0) {
         config.base_uri = options["base-uri"].as<std::string>();
      }
      return config;
   }

}

int main(int argc, char **argv) {
   try {
      bpo::options_description app_options("tessera_replay options");
      app_options.add_options()
         ("help,h", "Print this help message and exit")
         ("ops-file,o", bpo::value<std::string>(), "JSON array of operations to apply, in order")
         ("config-file,c", bpo::value<std::string>(), "JSON registry configuration")
         ("base-uri", bpo::value<std::string>(), "Base URI of token metadata, overrides the configuration file")
         ("log-level", bpo::value<std::string>()->default_value("info"), "One of debug, info, warn, error, off")
         ("stop-on-error", bpo::bool_switch(), "Stop at the first operation that fails")
         ("dump-state", bpo::bool_switch(), "Print the registry state as JSON once every operation ran")
         ("enable-transfer-history", bpo::bool_switch(), "Record transfers and print them with the state");

      // The registry configuration is needed before the plugin can be created,
      // so the plugin options are only known to the second pass
      bpo::variables_map options;
      bpo::store(bpo::command_line_parser(argc, argv).options(app_options).allow_unregistered().run(), options);
      bpo::notify(options);

      set_log_level(options["log-level"].as<std::string>());

      chain::database db(make_config(options));
      transfer_history::transfer_history history(db);

      bpo::options_description cli("transfer_history options");
      bpo::options_description cfg;
      history.plugin_set_program_options(cli, cfg);
      app_options.add(cli);

      if (options.count("help") > 0) {
         std::cout << app_options << "\n";
         return 0;
      }

      options.clear();
      bpo::store(bpo::parse_command_line(argc, argv, app_options), options);
      bpo::notify(options);

      if (options.count("ops-file") == 0) {
         std::cerr << "Missing --ops-file\n" << app_options << "\n";
         return 1;
      }

      const bool with_history = options["enable-transfer-history"].as<bool>();
      if (with_history) {
         history.plugin_initialize(options);
         history.plugin_startup();
      }

      const auto ops = fc::json::from_file(options["ops-file"].as<std::string>())
                          .as<vector<protocol::operation>>(TESSERA_MAX_NESTED_OBJECTS);
      ilog("Applying ${n} operations", ("n", ops.size()));

      const bool stop_on_error = options["stop-on-error"].as<bool>();
      uint64_t applied = 0;
      uint64_t failed = 0;
      for (size_t i = 0; i < ops.size(); ++i) {
         try {
            const chain::operation_result result = db.apply_operation(ops[i]);
            ++applied;
            dlog("Operation ${i} applied: ${r}", ("i", i)("r", result));
         } catch (const fc::exception &e) {
            ++failed;
            elog("Operation ${i} failed: ${e}", ("i", i)("e", e.to_detail_string()));
            if (stop_on_error) {
               break;
            }
         }
      }

      ilog("Done: ${ok} applied, ${f} failed, ${k} skipped, total supply ${s}",
           ("ok", applied)("f", failed)("k", ops.size() - applied - failed)("s", db.total_supply()));

      if (options["dump-state"].as<bool>()) {
         fc::mutable_variant_object state;
         state("registry", fc::variant(db.get_snapshot(), TESSERA_MAX_NESTED_OBJECTS));
         if (with_history) {
            state("transfers", fc::variant(history.get_transfers(), TESSERA_MAX_NESTED_OBJECTS));
         }
         std::cout << fc::json::to_pretty_string(state) << "\n";
      }

      if (with_history) {
         history.plugin_shutdown();
      }

      return failed == 0 ? 0 : 1;
   } catch (const fc::exception &e) {
      elog("Exiting with error:\n${e}", ("e", e.to_detail_string()));
   } catch (const boost::program_options::error &e) {
      std::cerr << "Invalid command line: " << e.what() << "\n";
   } catch (const std::exception &e) {
      elog("Exiting with error:\n${e}", ("e", e.what()));
   }
   return 1;
}
