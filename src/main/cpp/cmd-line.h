/* cmd-line.h

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
#ifndef SC_LSP_BRIDGE_CMD_LINE_H
#define SC_LSP_BRIDGE_CMD_LINE_H

#include "bridge-exception.h"
#include "relay-config.h"

DECL_EXCEPTION(cmd_line)

namespace cmd_line {

  /**
   * Parses the program command line (popt based).
   *
   *   --sclang-path PATH   --send-port N   --receive-port N   --ide-name NAME
   *   -v/--verbose   -l/--log-file PATH   -c/--config INI_FILE
   *   [--] extra arguments passed verbatim to sclang
   *
   * When -c is given the INI file is loaded first and options given on the command
   * line then override its values. Throws cmd_line_exception on an unknown option
   * or missing argument; port_config_exception on an invalid port number;
   * process_cfg_exception on a bad config file.
   */
  relay_config::config_t parse_command_line(int argc, const char **argv);

} // cmd_line

#endif //SC_LSP_BRIDGE_CMD_LINE_H
