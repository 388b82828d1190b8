/* cmd-line.cpp

Copyright 2015 - 2017 Tideworks Technology
Author: Roger D. Voss

Licensed under the Apache License, Version 2.0 (the "License");
you may not use this file except in compliance with the License.
You may obtain a copy of the License at

    http://www.apache.org/licenses/LICENSE-2.0

Unless required by applicable law or agreed to in writing, software
distributed under the License is distributed on an "AS IS" BASIS,
WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
See the License for the specific language governing permissions and
limitations under the License.

*/
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>
#include <popt.h>
#include "format2str.h"
#include "cfgparse.h"
#include "cmd-line.h"

namespace cmd_line {

  enum OPTN : int {
    SCLANG_PATH = 1,
    SEND_PORT,
    RECEIVE_PORT,
    IDE_NAME,
    VERBOSE,
    LOG_FILE,
    CONFIG_FILE
  };

  static const char usage_epilog[] =
      "[OPTIONS...] [-- EXTRA_SCLANG_ARGS...]\n\n"
      "Runs the SuperCollider LSP server and provides stdin/stdout access to it.\n\n"
      "example with extra sclang args (custom langPort and libraryConfig):\n"
      "  sc-lsp-bridge --sclang-path /path/to/sclang -v --log-file /path/to/logfile -- "
      "-u 57300 -l custom_sclang_conf.yaml";

  // command line values override config file values, so each one is recorded as given or not
  struct cmd_line_values_t {
    std::unique_ptr<std::string> sp_sclang_path{};
    std::unique_ptr<std::string> sp_send_port{};
    std::unique_ptr<std::string> sp_receive_port{};
    std::unique_ptr<std::string> sp_ide_name{};
    std::unique_ptr<std::string> sp_log_file{};
    std::unique_ptr<std::string> sp_config_file{};
    bool verbose{false};
    std::vector<std::string> extra_args{};
  };

  static void free_popt_context(poptContext ctx) {
    if (ctx != nullptr) {
      poptFreeContext(ctx);
    }
  }

  using popt_ctx_sp_t = std::unique_ptr<std::remove_pointer<poptContext>::type, decltype(&free_popt_context)>;

  static std::unique_ptr<std::string> take_opt_arg(poptContext ctx) {
    std::unique_ptr<char, decltype(&free)> sp_arg{ poptGetOptArg(ctx), &free };
    if (!sp_arg) {
      return std::unique_ptr<std::string>{ new std::string() };
    }
    return std::unique_ptr<std::string>{ new std::string(sp_arg.get()) };
  }

  static cmd_line_values_t scan_command_line(int argc, const char **argv) {
    const struct poptOption options_table[] = {
        { "sclang-path",  '\0', POPT_ARG_STRING, nullptr, OPTN::SCLANG_PATH,
          "path of the sclang executable", "PATH" },
        { "send-port",    '\0', POPT_ARG_STRING, nullptr, OPTN::SEND_PORT,
          "UDP port the language server sends on (both ports or neither)", "PORT" },
        { "receive-port", '\0', POPT_ARG_STRING, nullptr, OPTN::RECEIVE_PORT,
          "UDP port the language server receives on (both ports or neither)", "PORT" },
        { "ide-name",     '\0', POPT_ARG_STRING, nullptr, OPTN::IDE_NAME,
          "IDE name passed to sclang via -i (default: vscode)", "NAME" },
        { "verbose",      'v',  POPT_ARG_NONE,   nullptr, OPTN::VERBOSE,
          "debug level logging for this program and the language server", nullptr },
        { "log-file",     'l',  POPT_ARG_STRING, nullptr, OPTN::LOG_FILE,
          "write log output to this file", "PATH" },
        { "config",       'c',  POPT_ARG_STRING, nullptr, OPTN::CONFIG_FILE,
          "INI configuration file (command line options take precedence)", "INI_FILE" },
        POPT_AUTOHELP
        POPT_TABLEEND
    };

    popt_ctx_sp_t sp_ctx{ poptGetContext("sc-lsp-bridge", argc, argv, options_table, 0), &free_popt_context };
    if (!sp_ctx) {
      throw cmd_line_exception("failed allocating command line parsing context");
    }
    poptSetOtherOptionHelp(sp_ctx.get(), usage_epilog);

    cmd_line_values_t values{};
    int rc;
    while ((rc = poptGetNextOpt(sp_ctx.get())) > 0) {
      switch (rc) {
        case OPTN::SCLANG_PATH:  values.sp_sclang_path  = take_opt_arg(sp_ctx.get()); break;
        case OPTN::SEND_PORT:    values.sp_send_port    = take_opt_arg(sp_ctx.get()); break;
        case OPTN::RECEIVE_PORT: values.sp_receive_port = take_opt_arg(sp_ctx.get()); break;
        case OPTN::IDE_NAME:     values.sp_ide_name     = take_opt_arg(sp_ctx.get()); break;
        case OPTN::LOG_FILE:     values.sp_log_file     = take_opt_arg(sp_ctx.get()); break;
        case OPTN::CONFIG_FILE:  values.sp_config_file  = take_opt_arg(sp_ctx.get()); break;
        case OPTN::VERBOSE:      values.verbose = true; break;
        default: break;
      }
    }
    if (rc < -1) {
      const char err_msg_fmt[] = "%s: %s";
      throw cmd_line_exception(format2str(err_msg_fmt, poptBadOption(sp_ctx.get(), POPT_BADOPTION_NOALIAS),
                                          poptStrerror(rc)));
    }

    const char **leftovers = poptGetArgs(sp_ctx.get());
    for (; leftovers != nullptr && *leftovers != nullptr; leftovers++) {
      values.extra_args.emplace_back(*leftovers);
    }

    return values;
  }

  relay_config::config_t parse_command_line(int argc, const char **argv) {
    auto values = scan_command_line(argc, argv);

    relay_config::config_t cfg{};
    if (values.sp_config_file) {
      relay_config::load_config_file(values.sp_config_file->c_str(), cfg);
    }

    if (values.sp_sclang_path)  cfg.sclang_path = *values.sp_sclang_path;
    if (values.sp_ide_name)     cfg.ide_name = *values.sp_ide_name;
    if (values.sp_log_file)     cfg.log_file = *values.sp_log_file;
    if (values.sp_send_port)    cfg.send_port = relay_config::parse_port("send", values.sp_send_port->c_str());
    if (values.sp_receive_port) cfg.receive_port = relay_config::parse_port("receive", values.sp_receive_port->c_str());
    if (values.verbose)         cfg.verbose = true;
    cfg.extra_args = std::move(values.extra_args);

    if (cfg.sclang_path.empty()) {
      throw cmd_line_exception("the following argument is required: --sclang-path");
    }

    return cfg;
  }

} // cmd_line
