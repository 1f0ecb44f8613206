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
#include <lazymint/chain/database.hpp>
#include <lazymint/token_history/token_history.hpp>

#include <fc/exception/exception.hpp>
#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

#include <fstream>
#include <iostream>

using namespace lazymint;
namespace bpo = boost::program_options;

static void print_notification(const chain::operation_history_object &entry) {
   std::cout << fc::json::to_string(entry, fc::json::stringify_large_ints_and_doubles,
                                    LAZYMINT_MAX_NESTED_OBJECTS) << std::endl;
}

int main(int argc, char** argv) {
   try {
      bpo::options_description app_options("lazymint command line options");
      bpo::options_description cfg_options("lazymint configuration file options");
      app_options.add_options()
            ("help,h", "Print this help message and exit.")
            ("config-file,c", bpo::value<boost::filesystem::path>(), "Path to a configuration file")
            ("admin-account", bpo::value<uint64_t>()->default_value(0),
             "Account permitted to change the descriptor base path (0 disables administration)")
            ("base-descriptor-path", bpo::value<std::string>()->default_value(""),
             "Base path prepended to every token descriptor")
            ("operations,o", bpo::value<boost::filesystem::path>(),
             "JSON file holding an array of operations to apply in order")
            ("keep-going", "Continue with the next operation when an operation is rejected");

      bpo::options_description plugin_cli_options("token_history plugin options");
      bpo::options_description plugin_cfg_options("token_history plugin options");

      chain::database db;
      token_history::token_history history(db);
      history.plugin_set_program_options(plugin_cli_options, plugin_cfg_options);
      app_options.add(plugin_cli_options);
      cfg_options.add(app_options);

      bpo::variables_map options;
      bpo::store(bpo::parse_command_line(argc, argv, app_options), options);

      if (options.count("help") > 0) {
         std::cout << app_options << std::endl;
         return 0;
      }

      if (options.count("config-file") > 0) {
         const boost::filesystem::path config_path = options["config-file"].as<boost::filesystem::path>();
         FC_ASSERT(boost::filesystem::exists(config_path), "Configuration file ${p} does not exist",
                   ("p", config_path.string()));
         std::ifstream config_stream(config_path.string());
         bpo::store(bpo::parse_config_file(config_stream, cfg_options, true), options);
      }
      bpo::notify(options);

      chain::ledger_config config;
      config.admin_account = protocol::account_id_type(options["admin-account"].as<uint64_t>());
      config.base_descriptor_path = options["base-descriptor-path"].as<std::string>();

      db.open(config);
      history.plugin_initialize(options);
      history.plugin_startup();

      db.applied_operation.connect(&print_notification);

      if (options.count("operations") == 0) {
         ilog("No operations file given, nothing to apply");
         history.plugin_shutdown();
         return 0;
      }

      const boost::filesystem::path ops_path = options["operations"].as<boost::filesystem::path>();
      const std::vector<protocol::operation> ops =
            fc::json::from_file(ops_path.string()).as<std::vector<protocol::operation>>(LAZYMINT_MAX_NESTED_OBJECTS);
      ilog("Applying ${n} operations from ${p}", ("n", ops.size())("p", ops_path.string()));

      const bool keep_going = options.count("keep-going") > 0;
      std::size_t rejected = 0;
      for (const protocol::operation &op : ops) {
         try {
            db.apply_operation(op);
         } catch (const fc::exception &e) {
            ++rejected;
            elog("Operation rejected: ${e}", ("e", e.to_string()));
            if (!keep_going) {
               break;
            }
         }
      }

      ilog("Applied ${a} of ${n} operations; ${t} tokens prepared",
           ("a", ops.size() - rejected)("n", ops.size())("t", db.current_token_id()));

      history.plugin_shutdown();
      return rejected == 0 ? 0 : 1;
   } catch (const fc::exception &e) {
      elog("Exiting with error:\n${e}", ("e", e.to_detail_string()));
      return 1;
   } catch (const std::exception &e) {
      elog("Exiting with error: ${e}", ("e", e.what()));
      return 1;
   }
}
