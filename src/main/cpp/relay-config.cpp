/* relay-config.cpp

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
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <strings.h>
#include <unistd.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include "format2str.h"
#include "cfgparse.h"
#include "launch-program.h"
#include "relay-config.h"

using logger::LL;
using launch_program::fd_wrapper_sp_t;
using launch_program::make_fd_wrapper;

namespace relay_config {

  const char* const DEFAULT_IDE_NAME = "vscode";

  const char* default_sclang_path() {
#if defined(__APPLE__)
    return "/Applications/SuperCollider.app/Contents/MacOS/sclang";
#elif defined(__linux__)
    return "sclang";
#else
    return "";
#endif
  }

  static bool str_to_bool(const char *const value, bool &rslt) {
    if (strcasecmp(value, "true") == 0 || strcasecmp(value, "yes") == 0 ||
        strcasecmp(value, "on") == 0 || strcmp(value, "1") == 0) {
      rslt = true;
      return true;
    }
    if (strcasecmp(value, "false") == 0 || strcasecmp(value, "no") == 0 ||
        strcasecmp(value, "off") == 0 || strcmp(value, "0") == 0) {
      rslt = false;
      return true;
    }
    return false;
  }

  void load_config_file(const char *const cfg_file_path, config_t &cfg) {
    auto const handler = [&cfg](const char *section, const char *name, const char *value) -> int {
      try {
        if (strcmp(section, "sclang") == 0) {
          if (strcmp(name, "path") == 0)     { cfg.sclang_path = value; return 1; }
          if (strcmp(name, "ide_name") == 0) { cfg.ide_name = value; return 1; }
        } else if (strcmp(section, "ports") == 0) {
          if (strcmp(name, "send") == 0)     { cfg.send_port = parse_port("send", value); return 1; }
          if (strcmp(name, "receive") == 0)  { cfg.receive_port = parse_port("receive", value); return 1; }
        } else if (strcmp(section, "log") == 0) {
          if (strcmp(name, "file") == 0)     { cfg.log_file = value; return 1; }
          if (strcmp(name, "verbose") == 0)  { return str_to_bool(value, cfg.verbose) ? 1 : 0; }
          if (strcmp(name, "syslog") == 0)   { return str_to_bool(value, cfg.syslog) ? 1 : 0; }
        }
      } catch (const port_config_exception&) {
        return 0;
      }
      return 0; // unknown section or key
    };

    if (!process_config(cfg_file_path, handler)) {
      throw process_cfg_exception(format2str("config file \"%s\" does not exist", cfg_file_path));
    }
    cfg.config_file = cfg_file_path;
  }

  int parse_port(const char *const option_name, const char *const value) {
    char *endp = nullptr;
    errno = 0;
    const long port = strtol(value, &endp, 10);
    if (errno != 0 || endp == value || *endp != '\0' || port < 1 || port > 65535) {
      throw port_config_exception(format2str("invalid %s port '%s' (expected 1..65535)", option_name, value));
    }
    return (int) port;
  }

  void validate_ports(int send_port, int receive_port) {
    if ((send_port == 0) != (receive_port == 0)) {
      throw port_config_exception("Both server and client port must specified (or neither)");
    }
  }

  static int bind_ephemeral_port(fd_wrapper_sp_t &sp_sock) {
    int line_nbr = __LINE__ + 1;
    const int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd == -1) {
      throw port_config_exception(format2str("%d: %s() -> socket(): %s", line_nbr, __FUNCTION__, strerror(errno)));
    }
    sp_sock = make_fd_wrapper(fd);

    const int opt = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = 0;
    line_nbr = __LINE__ + 1;
    if (bind(fd, (const sockaddr*) &addr, sizeof(addr)) == -1) {
      throw port_config_exception(format2str("%d: %s() -> bind(): %s", line_nbr, __FUNCTION__, strerror(errno)));
    }

    socklen_t addr_len = sizeof(addr);
    line_nbr = __LINE__ + 1;
    if (getsockname(fd, (sockaddr*) &addr, &addr_len) == -1) {
      throw port_config_exception(format2str("%d: %s() -> getsockname(): %s", line_nbr, __FUNCTION__, strerror(errno)));
    }
    return ntohs(addr.sin_port);
  }

  port_pair_t find_free_ports() {
    // both sockets stay bound until both ports are known so the two numbers differ
    fd_wrapper_sp_t sp_first{ nullptr, &launch_program::fd_cleanup_with_delete };
    fd_wrapper_sp_t sp_second{ nullptr, &launch_program::fd_cleanup_with_delete };
    const int first = bind_ephemeral_port(sp_first);
    const int second = bind_ephemeral_port(sp_second);
    return port_pair_t{ first, second };
  }

  port_pair_t negotiate_ports(const config_t &cfg, const logger::log_context &log) {
    validate_ports(cfg.send_port, cfg.receive_port);

    if (cfg.send_port != 0 && cfg.receive_port != 0) {
      return port_pair_t{ cfg.send_port, cfg.receive_port };
    }

    const auto ports = find_free_ports();
    log.log(LL::INFO, "Found free ports (receive: %d), (send: %d)", ports.receive_port, ports.send_port);
    return ports;
  }

  const char* server_log_level(const config_t &cfg) {
    return cfg.verbose ? "debug" : "warning";
  }

  void configure_logging(const config_t &cfg, logger::log_context &log) {
    if (!cfg.log_file.empty()) {
      log.set_log_file(cfg.log_file.c_str());
      log.set_level(cfg.verbose ? LL::DEBUG : LL::WARN);
    } else {
      log.set_level(LL::ERR);
    }
    log.set_syslogging(cfg.syslog);
  }

} // relay_config
