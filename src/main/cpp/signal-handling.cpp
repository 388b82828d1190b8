/* signal-handling.cpp

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
#include <csignal>
#include <cstring>
#include <mutex>
#include "signal-handling.h"

namespace signal_handling {

  volatile sig_atomic_t quit_flag{0};
  volatile sig_atomic_t quit_signal{0};

  static void signal_callback_handler(int sig) { // can be called asynchronously
    quit_signal = sig;
    quit_flag = 1;
  }

  void set_signals_handler() {
    static std::mutex guard;
    std::unique_lock<std::mutex> lk(guard);
    quit_flag = 0;
    quit_signal = 0;

    struct sigaction sa{};
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = signal_callback_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0; // no SA_RESTART so a blocking poll()/waitpid() returns EINTR
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    // a reader closing stdout must not kill the relay; write() reports EPIPE instead
    signal(SIGPIPE, SIG_IGN);
  }

  void reset_quit_flag() {
    quit_flag = 0;
    quit_signal = 0;
  }

}
