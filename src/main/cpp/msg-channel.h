/* msg-channel.h

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
#ifndef SC_LSP_BRIDGE_MSG_CHANNEL_H
#define SC_LSP_BRIDGE_MSG_CHANNEL_H

#include <deque>
#include <mutex>
#include <string>
#include "bridge-exception.h"

DECL_EXCEPTION(msg_channel)

/**
 * One-way hand-off of byte chunks from a producer thread to the poll(2) event loop.
 *
 * push() queues a chunk and writes a wake-up byte to a pipe; the event loop polls
 * get_wake_fd() and calls drain() to take everything queued so far, in push order.
 * The queue is the only state touched by both sides.
 */
class msg_channel final {
private:
  std::mutex guard{};
  std::deque<std::string> queue{};
  int wake_fds[2]{-1, -1};
public:
  msg_channel();
  msg_channel(const msg_channel &) = delete;
  msg_channel& operator=(const msg_channel &) = delete;
  ~msg_channel();
  void push(std::string &&chunk);
  std::deque<std::string> drain();
  int get_wake_fd() const { return wake_fds[0]; }
};

#endif //SC_LSP_BRIDGE_MSG_CHANNEL_H
