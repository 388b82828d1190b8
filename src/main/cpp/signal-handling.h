/* signal-handling.h

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
#ifndef SIGNAL_HANDLING_H
#define SIGNAL_HANDLING_H

#include <cstdlib>
#include <csignal>

namespace signal_handling {
  // installs SIGINT/SIGTERM handlers that raise quit_flag, and ignores SIGPIPE
  void set_signals_handler();
  void reset_quit_flag();
  extern volatile sig_atomic_t quit_flag;
  extern volatile sig_atomic_t quit_signal;
  inline bool interrupted() { return quit_flag != 0; }
  inline int received_signal() { return quit_signal; }
}

#endif //SIGNAL_HANDLING_H
