/* relay-config.h

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
#ifndef SC_LSP_BRIDGE_RELAY_CONFIG_H
#define SC_LSP_BRIDGE_RELAY_CONFIG_H

#include <string>
#include <vector>
#include "bridge-exception.h"
#include "log.h"

DECL_EXCEPTION(port_config)

namespace relay_config {

  extern const char* const DEFAULT_IDE_NAME;

  // platform default for the sclang executable (empty where there is none)
  const char* default_sclang_path();

  struct config_t {
    std::string sclang_path{default_sclang_path()};
    std::string ide_name{DEFAULT_IDE_NAME};
    int send_port{0};     // 0 when not given
    int receive_port{0};  // 0 when not given
    bool verbose{false};
    bool syslog{false};
    std::string log_file{};
    std::string config_file{};
    std::vector<std::string> extra_args{};
  };

  // the two localhost UDP ports of one session, from this process's point of view
  struct port_pair_t {
    int receive_port; // this process listens here (child sends to it)
    int send_port;    // this process sends here (child listens on it)
  };

  // Loads [sclang], [ports] and [log] settings from an INI file into cfg.
  // Throws process_cfg_exception on a missing file or any invalid entry.
  void load_config_file(const char *const cfg_file_path, config_t &cfg);

  // Parses a port number; throws port_config_exception unless it is in 1..65535.
  int parse_port(const char *const option_name, const char *const value);

  // Rejects a configuration where only one of the two ports is given.
  void validate_ports(int send_port, int receive_port);

  // Binds two ephemeral localhost sockets and reports their port numbers.
  port_pair_t find_free_ports();

  // Validates the configured ports and settles the pair for the session. When both
  // are given, the --send-port value is the port the child sends on (so this process
  // receives there) and --receive-port is the port this process sends to. When
  // neither is given, two free ports are probed.
  port_pair_t negotiate_ports(const config_t &cfg, const logger::log_context &log);

  // log verbosity handed to the child's embedded server
  const char* server_log_level(const config_t &cfg);

  // Applies the logging policy: with a log file, DEBUG when verbose else WARN;
  // without one, only errors are written to stderr.
  void configure_logging(const config_t &cfg, logger::log_context &log);

} // relay_config

#endif //SC_LSP_BRIDGE_RELAY_CONFIG_H
