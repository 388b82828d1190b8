/* sc-runner.h

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
#ifndef SC_LSP_BRIDGE_SC_RUNNER_H
#define SC_LSP_BRIDGE_SC_RUNNER_H

#include <memory>
#include <string>
#include <vector>
#include <unistd.h>
#include "launch-program.h"
#include "log.h"
#include "msg-channel.h"
#include "stdin-relay.h"
#include "udp-receiver.h"
#include "udp-sender.h"

namespace sclang {

  extern const char* const READY_MESSAGE;

  using RS = enum class RUNNER_STATE : char { IDLE = 0, STARTING, RUNNING, STOPPED };
  using CS = enum class CHILD_STATE : char { NOT_STARTED = 0, RUNNING, TERMINATED };

  const char* runner_state_str(RUNNER_STATE state);

  struct runner_settings_t {
    std::string sclang_path{};
    std::string ide_name{};
    std::string server_log_level{"warning"};
    int send_port{0};     // child listens here, this process sends here
    int receive_port{0};  // this process listens here, child sends here
    int input_fd{STDIN_FILENO};
    int output_fd{STDOUT_FILENO};
  };

  /**
   * Manages a sclang subprocess and connects the input/output streams to it via UDP.
   *
   * start() launches the child and runs the event loop until the child's output
   * streams close, then reaps it and returns its exit code. The UDP receiver, the
   * UDP sender and the stdin watcher are brought up together, once, when the child
   * prints the readiness marker. stop() tears them down in a fixed order and asks
   * the child to terminate; it may be called any number of times.
   *
   * start() may be called again once a session ends (or while one is running, in
   * which case that child is stopped and reaped first); each session gets a fresh
   * relay. get_relay_startup_count() counts bring-ups across all sessions.
   */
  class sc_runner final {
  private:
    logger::log_context log;
    runner_settings_t const settings;
    RUNNER_STATE state{RS::IDLE};
    CHILD_STATE child_state{CS::NOT_STARTED};
    launch_program::child_process_t child{};
    std::shared_ptr<msg_channel> sp_channel;
    std::unique_ptr<udp_relay::udp_receiver> sp_receiver{};
    std::unique_ptr<udp_relay::udp_sender> sp_sender{};
    std::unique_ptr<stdin_relay::input_relay> sp_input_relay{};
    bool is_relay_latched{false};
    bool is_terminate_sent{false};
    unsigned int relay_startup_count{0};

    void reset_session();
    void run_event_loop();
    void on_quit_signal(bool &is_signal_handled);
    void bring_up_relay();
    void start_communication_from_sc();
    void start_communication_to_sc();
    void stop_subprocess();
  public:
    sc_runner(logger::log_context log, runner_settings_t settings);
    sc_runner(const sc_runner &) = delete;
    sc_runner& operator=(const sc_runner &) = delete;
    ~sc_runner();

    int start(const std::vector<std::string> &extra_args = {});
    void stop();

    // one line of the child's stdout/stderr (prefix identifies which)
    void handle_output_line(const std::string &line, const char *const prefix);
    // forwards whatever the stdin watcher queued so far to the UDP sender
    void pump_input_channel();

    RUNNER_STATE get_state() const { return state; }
    CHILD_STATE get_child_state() const { return child_state; }
    bool is_relay_up() const { return is_relay_latched; }
    unsigned int get_relay_startup_count() const { return relay_startup_count; }
    bool has_receiver() const { return sp_receiver != nullptr; }
    bool has_sender() const { return sp_sender != nullptr; }
    bool has_input_relay() const { return sp_input_relay != nullptr; }
    const udp_relay::udp_receiver* get_receiver() const { return sp_receiver.get(); }
    const udp_relay::udp_sender* get_sender() const { return sp_sender.get(); }
    const runner_settings_t& get_settings() const { return settings; }
    launch_program::env_vars_t make_sc_env_vars() const;
  };

} // sclang

#endif //SC_LSP_BRIDGE_SC_RUNNER_H
