/* stdin-relay.cpp

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
#include <atomic>
#include <cerrno>
#include <cstring>
#include <vector>
#include <poll.h>
#include <fcntl.h>
#include <unistd.h>
#include "stdin-relay.h"

using logger::LL;

namespace stdin_relay {

  static const size_t READ_BUF_SIZE = 64 * 1024;

  struct relay_state {
    logger::log_context log;
    int const input_fd;
    on_input_received_t on_received;
    int const poll_timeout_ms;
    int const backoff_ms;
    std::atomic_bool stop_flag{false};
    std::atomic_bool running{false};
    relay_state(logger::log_context &&log, int input_fd, on_input_received_t &&on_received,
                int poll_timeout_ms, int backoff_ms)
        : log{std::move(log)}, input_fd{input_fd}, on_received{std::move(on_received)},
          poll_timeout_ms{poll_timeout_ms}, backoff_ms{backoff_ms} {}
  };

  static void back_off(const relay_state &state) {
    std::this_thread::sleep_for(std::chrono::milliseconds(state.backoff_ms));
  }

  // returns false when the descriptor can no longer be watched
  static bool read_on_ready(relay_state &state, std::vector<char> &buf) {
    const auto n = read(state.input_fd, buf.data(), buf.size());
    if (n > 0) {
      state.on_received(std::string(buf.data(), (size_t) n));
      return true;
    }
    if (n == -1) {
      const auto err_no = errno;
      if (err_no != EAGAIN && err_no != EWOULDBLOCK && err_no != EINTR) {
        state.log.log(LL::ERR, "failure reading input fd{%d}: %s", state.input_fd, strerror(err_no));
        if (err_no == EBADF) return false;
      }
    }
    back_off(state); // nothing pending (or end of stream) so avoid pegging a core
    return true;
  }

  static void watch_input(std::shared_ptr<relay_state> sp_state, std::promise<void> done) {
    auto &state = *sp_state;
    std::vector<char> buf(READ_BUF_SIZE);
    state.log.log(LL::DEBUG, "input relay watching fd{%d}", state.input_fd);

    while (!state.stop_flag.load()) {
      pollfd pfd{};
      pfd.fd = state.input_fd;
      pfd.events = POLLIN;
      const auto rc = poll(&pfd, 1, state.poll_timeout_ms);
      if (rc == -1) {
        if (errno == EINTR) continue;
        state.log.log(LL::ERR, "poll() on input fd{%d} failed: %s", state.input_fd, strerror(errno));
        break;
      }
      if (rc == 0 || state.stop_flag.load()) continue;
      if ((pfd.revents & POLLNVAL) != 0) {
        state.log.log(LL::ERR, "input fd{%d} is not open", state.input_fd);
        break;
      }
      if ((pfd.revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
        try {
          if (!read_on_ready(state, buf)) break;
        } catch (const std::exception &ex) {
          state.log.log(LL::ERR, "input relay callback failed: %s", ex.what());
        }
      }
    }

    state.log.logm(LL::DEBUG, "input relay stopped");
    state.running = false;
    done.set_value();
  }

  input_relay::input_relay(logger::log_context log, int input_fd, on_input_received_t on_received,
                           int poll_timeout_ms, int backoff_ms)
      : sp_state{std::make_shared<relay_state>(std::move(log), input_fd, std::move(on_received),
                                               poll_timeout_ms, backoff_ms)}
  {}

  input_relay::~input_relay() {
    stop();
    if (!join(std::chrono::milliseconds(sp_state->poll_timeout_ms + sp_state->backoff_ms + 1000))) {
      // the watcher only touches its own shared state, so letting it finish on its own is safe
      if (thrd.joinable()) thrd.detach();
    }
  }

  void input_relay::start() {
    if (thrd.joinable()) return;
    const int fd = sp_state->input_fd;
    const auto flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
      sp_state->log.log(LL::WARN, "could not set O_NONBLOCK on input fd{%d}: %s", fd, strerror(errno));
    }
    std::promise<void> done_promise;
    done = done_promise.get_future();
    sp_state->stop_flag = false;
    sp_state->running = true;
    thrd = std::thread(&watch_input, sp_state, std::move(done_promise));
  }

  void input_relay::stop() {
    sp_state->stop_flag = true;
  }

  bool input_relay::join(std::chrono::milliseconds timeout) {
    if (!thrd.joinable()) return true;
    if (done.valid() && done.wait_for(timeout) != std::future_status::ready) {
      sp_state->log.log(LL::WARN, "input relay did not finish within %lld ms", (long long) timeout.count());
      return false;
    }
    thrd.join();
    return true;
  }

  bool input_relay::is_running() const {
    return sp_state->running.load();
  }

} // stdin_relay
