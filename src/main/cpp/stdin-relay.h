/* stdin-relay.h

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
#ifndef SC_LSP_BRIDGE_STDIN_RELAY_H
#define SC_LSP_BRIDGE_STDIN_RELAY_H

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include "log.h"

namespace stdin_relay {

  using on_input_received_t = std::function<void(std::string &&data)>;

  const int DEFAULT_POLL_TIMEOUT_MS = 250;
  const int DEFAULT_BACKOFF_MS = 100;

  struct relay_state;

  /**
   * Background watcher over a blocking input stream (normally stdin).
   *
   * The watcher thread polls the descriptor with a bounded timeout so a stop request
   * is noticed promptly. Each ready read is handed to the callback as-is; a read that
   * yields nothing (end of stream, or spurious readiness) backs off before the next
   * poll so the thread never spins.
   *
   * The input descriptor is switched to O_NONBLOCK by start().
   */
  class input_relay final {
  private:
    std::shared_ptr<relay_state> sp_state;
    std::thread thrd{};
    std::future<void> done{};
  public:
    input_relay(logger::log_context log, int input_fd, on_input_received_t on_received,
                int poll_timeout_ms = DEFAULT_POLL_TIMEOUT_MS, int backoff_ms = DEFAULT_BACKOFF_MS);
    input_relay(const input_relay &) = delete;
    input_relay& operator=(const input_relay &) = delete;
    ~input_relay();
    void start();
    // asks the watcher to exit its loop at its next check; does not wait
    void stop();
    // waits up to timeout for the watcher thread to finish; false if it is still running
    bool join(std::chrono::milliseconds timeout);
    bool is_running() const;
  };

} // stdin_relay

#endif //SC_LSP_BRIDGE_STDIN_RELAY_H
