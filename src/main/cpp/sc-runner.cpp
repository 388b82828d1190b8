/* sc-runner.cpp

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
#include <cstring>
#include <algorithm>
#include <poll.h>
#include "format2str.h"
#include "signal-handling.h"
#include "sc-runner.h"

using namespace logger;
using namespace launch_program;

namespace sclang {

  const char* const READY_MESSAGE = "***LSP READY***";

  static const char* const SC_STDOUT = "SC:STDOUT";
  static const char* const SC_STDERR = "SC:STDERR";
  static const int POLL_TIMEOUT_MS = 100;
  static const std::chrono::milliseconds INPUT_RELAY_JOIN_TIMEOUT{5000};

  const char* runner_state_str(RUNNER_STATE state) {
    switch (state) {
      case RS::IDLE:     return "IDLE";
      case RS::STARTING: return "STARTING";
      case RS::RUNNING:  return "RUNNING";
      case RS::STOPPED:  return "STOPPED";
    }
    return "UNKNOWN";
  }

  // accumulates a child output stream and splits it into lines
  struct line_reader_t {
    int fd;
    const char *const prefix;
    std::string partial{};
    bool is_open{true};

    line_reader_t(int fd, const char *const prefix) : fd{fd}, prefix{prefix} {}

    template<typename F>
    void on_readable(const log_context &log, F &&on_line) {
      char rd_buf[4096];
      for(;;) {
        const ssize_t n = read(fd, rd_buf, sizeof(rd_buf));
        if (n > 0) {
          partial.append(rd_buf, static_cast<size_t>(n));
          std::string::size_type pos;
          while ((pos = partial.find('\n')) != std::string::npos) {
            const std::string line{partial, 0, pos};
            partial.erase(0, pos + 1);
            on_line(line, prefix);
          }
          continue;
        }
        if (n == 0) {
          // end of stream - the remainder counts as a final line
          if (!partial.empty()) {
            const std::string line{std::move(partial)};
            partial.clear();
            on_line(line, prefix);
          }
          is_open = false;
          return;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return;
        log.log(LL::ERR, "read() of %s failed: %s", prefix, strerror(errno));
        is_open = false;
        return;
      }
    }
  };

  static std::string rstrip(const std::string &s) {
    auto const end = s.find_last_not_of(" \t\r\n\v\f");
    return end == std::string::npos ? std::string{} : s.substr(0, end + 1);
  }

  sc_runner::sc_runner(log_context log, runner_settings_t settings)
      : log{std::move(log)}, settings{std::move(settings)}, sp_channel{std::make_shared<msg_channel>()}
  {}

  sc_runner::~sc_runner() {
    try {
      stop();
    } catch (const bridge_exception &ex) {
      log.log(LL::ERR, "%s: %s", ex.name(), ex.what());
    }
  }

  env_vars_t sc_runner::make_sc_env_vars() const {
    return env_vars_t{
        { "SCLANG_LSP_ENABLE",      "1" },
        { "SCLANG_LSP_LOGLEVEL",    settings.server_log_level },
        { "SCLANG_LSP_CLIENTPORT",  std::to_string(settings.send_port) },
        { "SCLANG_LSP_SERVERPORT",  std::to_string(settings.receive_port) },
    };
  }

  int sc_runner::start(const std::vector<std::string> &extra_args) {
    if (state != RS::IDLE) {
      reset_session();
    }
    state = RS::STARTING;
    is_terminate_sent = false;

    const auto prog_path = find_program_path(settings.sclang_path.c_str(), "PATH");

    std::vector<std::string> argv{ settings.sclang_path, "-i", settings.ide_name };
    argv.insert(argv.end(), extra_args.begin(), extra_args.end());

    const auto env_vars = make_sc_env_vars();
    if (log.is_enabled(LL::INFO)) {
      std::string env_str, cmd_str;
      for(const auto &var : env_vars) {
        if (!env_str.empty()) env_str += ", ";
        env_str += var.first + '=' + var.second;
      }
      for(const auto &arg : argv) {
        if (!cmd_str.empty()) cmd_str += ' ';
        cmd_str += arg;
      }
      log.log(LL::INFO, "SC env vars: {%s}", env_str.c_str());
      log.log(LL::INFO, "Launching SC with cmd: '%s'", cmd_str.c_str());
    }

    try {
      child = spawn_child(prog_path, argv, make_child_environment(env_vars));
    } catch (const spawn_child_exception &) {
      state = RS::STOPPED;
      throw;
    }
    child_state = CS::RUNNING;
    log.log(LL::DEBUG, "sclang started with pid %d", child.pid);

    run_event_loop();

    bool is_signal_handled = false;
    const int exit_code = wait_child(child.pid, [this, &is_signal_handled]() { on_quit_signal(is_signal_handled); });
    child_state = CS::TERMINATED;
    log.log(LL::INFO, "sclang exited with code %d", exit_code);

    log.logm(LL::DEBUG, "calling stop from the runner start sequence");
    stop();
    return exit_code;
  }

  // tears down whatever a previous session left behind so the next one starts clean
  void sc_runner::reset_session() {
    if (child_state == CS::RUNNING) {
      log.logm(LL::WARN, "sclang is already running - stopping it before relaunch");
      stop();
      wait_child(child.pid);
      child_state = CS::TERMINATED;
    } else {
      stop();
    }
    sp_input_relay.reset();
    sp_sender.reset();
    sp_receiver.reset();
    const auto stale = sp_channel->drain();
    if (!stale.empty()) {
      log.log(LL::DEBUG, "discarding %lu unsent input chunks of previous session", (unsigned long) stale.size());
    }
    is_relay_latched = false;
    signal_handling::reset_quit_flag();
  }

  void sc_runner::on_quit_signal(bool &is_signal_handled) {
    if (is_signal_handled || !signal_handling::interrupted()) return;
    is_signal_handled = true;
    log.log(LL::INFO, "Received termination signal %d", signal_handling::received_signal());
    stop();
  }

  void sc_runner::run_event_loop() {
    line_reader_t out_rdr{child.sp_stdout_fd->fd, SC_STDOUT};
    line_reader_t err_rdr{child.sp_stderr_fd->fd, SC_STDERR};
    auto const on_line = [this](const std::string &line, const char *const prefix) {
      handle_output_line(line, prefix);
    };
    bool is_signal_handled = false;

    while (out_rdr.is_open || err_rdr.is_open) {
      on_quit_signal(is_signal_handled);

      struct pollfd fds[4];
      line_reader_t *rdrs[2]{nullptr, nullptr};
      nfds_t nfds = 0;
      for(auto rdr : { &out_rdr, &err_rdr }) {
        if (!rdr->is_open) continue;
        rdrs[nfds] = rdr;
        fds[nfds++] = { rdr->fd, POLLIN, 0 };
      }
      const nfds_t rdrs_count = nfds;
      const nfds_t chan_ndx = nfds;
      fds[nfds++] = { sp_channel->get_wake_fd(), POLLIN, 0 };
      const bool is_receiving = sp_receiver != nullptr && !sp_receiver->is_closed();
      const nfds_t recv_ndx = nfds;
      if (is_receiving) {
        fds[nfds++] = { sp_receiver->get_fd(), POLLIN, 0 };
      }

      const int rc = poll(fds, nfds, POLL_TIMEOUT_MS);
      if (rc == -1) {
        if (errno == EINTR) continue;
        log.log(LL::ERR, "poll() failed in event loop: %s", strerror(errno));
        stop();
        break;
      }
      if (rc == 0) continue;

      for(nfds_t i = 0; i < rdrs_count; i++) {
        if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
          rdrs[i]->on_readable(log, on_line);
        }
      }
      if ((fds[chan_ndx].revents & POLLIN) != 0) {
        pump_input_channel();
      }
      if (is_receiving && (fds[recv_ndx].revents & POLLIN) != 0 && sp_receiver && !sp_receiver->is_closed()) {
        sp_receiver->on_readable();
      }
    }
  }

  void sc_runner::handle_output_line(const std::string &line, const char *const prefix) {
    const auto output = rstrip(line);
    if (output.empty()) return;
    log.log(LL::INFO, "%s: %s", prefix, output.c_str());
    if (output.find(READY_MESSAGE) != std::string::npos) {
      bring_up_relay();
    }
  }

  void sc_runner::bring_up_relay() {
    if (is_relay_latched) {
      log.logm(LL::DEBUG, "ready message repeated - relay already started");
      return;
    }
    is_relay_latched = true;
    if (state == RS::STOPPED) {
      log.logm(LL::WARN, "ready message received after stop - relay not started");
      return;
    }
    log.logm(LL::INFO, "sclang reported ready - starting UDP relay");

    try {
      start_communication_from_sc();
    } catch (const bridge_exception &ex) {
      log.log(LL::ERR, "Failed to start UDP receiver: %s: %s", ex.name(), ex.what());
    }
    try {
      start_communication_to_sc();
    } catch (const bridge_exception &ex) {
      log.log(LL::ERR, "Failed to start UDP sender: %s: %s", ex.name(), ex.what());
    }
    relay_startup_count++;
    state = RS::RUNNING;
  }

  void sc_runner::start_communication_from_sc() {
    sp_receiver = udp_relay::make_udp_receiver(log, settings.receive_port, settings.output_fd);
    log.log(LL::INFO, "UDP receiver running on %s:%d", udp_relay::LOCALHOST, settings.receive_port);
  }

  void sc_runner::start_communication_to_sc() {
    sp_sender = udp_relay::make_udp_sender(log.child("udp_send"), settings.send_port);
    log.log(LL::INFO, "UDP sender running on %s:%d", sp_sender->get_remote_addr().c_str(), sp_sender->get_remote_port());

    auto const sp_chan = sp_channel;
    sp_input_relay.reset(new stdin_relay::input_relay(log.child("stdin"), settings.input_fd,
        [sp_chan](std::string &&data) { sp_chan->push(std::move(data)); }));
    sp_input_relay->start();
  }

  void sc_runner::pump_input_channel() {
    auto chunks = sp_channel->drain();
    for(const auto &chunk : chunks) {
      if (sp_sender) {
        sp_sender->send(chunk);
      } else {
        log.log(LL::WARN, "dropping %lu bytes of input - UDP sender not running", (unsigned long) chunk.size());
      }
    }
  }

  void sc_runner::stop() {
    if (state == RS::IDLE) return;
    log.log(LL::INFO, "Stopping sclang runner (state: %s)", runner_state_str(state));

    if (sp_sender) {
      sp_sender->close();
    }
    if (sp_receiver) {
      sp_receiver->close();
    }
    if (sp_input_relay) {
      sp_input_relay->stop();
      if (!sp_input_relay->join(INPUT_RELAY_JOIN_TIMEOUT)) {
        log.logm(LL::WARN, "stdin watcher did not finish within timeout");
      }
    }
    stop_subprocess();
    state = RS::STOPPED;
  }

  void sc_runner::stop_subprocess() {
    if (child_state != CS::RUNNING || is_terminate_sent) return;
    is_terminate_sent = true;
    log.log(LL::DEBUG, "terminating sclang pid %d", child.pid);
    if (!terminate_child(child.pid)) {
      log.log(LL::WARN, "kill(pid:%d, SIGTERM) failed: %s", child.pid, strerror(errno));
    }
  }

} // sclang
