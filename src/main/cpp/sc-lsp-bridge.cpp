/* sc-lsp-bridge.cpp

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
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <typeinfo>
#include <cxxabi.h>
#include "cmd-line.h"
#include "relay-config.h"
#include "sc-runner.h"
#include "signal-handling.h"
#include "log.h"

using namespace logger;

static const char* const PROGNAME = "sc-lsp-bridge";

int main(int argc, const char **argv) {
  log_context log{PROGNAME};
  int exit_code = EXIT_FAILURE;

  try {
    signal_handling::set_signals_handler();

    auto const cfg = cmd_line::parse_command_line(argc, argv);
    relay_config::configure_logging(cfg, log);

    auto const runner_log = log.child("lsp_runner");
    auto const ports = relay_config::negotiate_ports(cfg, runner_log);
    runner_log.log(LL::INFO, "UDP ports: receive %d, send %d", ports.receive_port, ports.send_port);

    sclang::runner_settings_t settings;
    settings.sclang_path = cfg.sclang_path;
    settings.ide_name = cfg.ide_name;
    settings.server_log_level = relay_config::server_log_level(cfg);
    settings.send_port = ports.send_port;
    settings.receive_port = ports.receive_port;

    sclang::sc_runner runner{runner_log, std::move(settings)};
    exit_code = runner.start(cfg.extra_args);
  } catch (const bridge_exception &e) {
    log.log(LL::FATAL, "%s: %s", e.name(), e.what());
    fprintf(stderr, "%s: %s\n", PROGNAME, e.what());
    exit_code = EXIT_FAILURE;
  } catch (const std::exception &e) {
    const auto ex_nm = get_unmangled_name(typeid(e).name());
    log.log(LL::FATAL, "terminating due to:\n\t%s: %s", ex_nm.c_str(), e.what());
    exit_code = EXIT_FAILURE;
  } catch (...) {
    const auto ex_nm = get_unmangled_name(abi::__cxa_current_exception_type()->name());
    log.log(LL::FATAL, "terminating due to unhandled exception of type %s", ex_nm.c_str());
    exit_code = EXIT_FAILURE;
  }

  return exit_code;
}
