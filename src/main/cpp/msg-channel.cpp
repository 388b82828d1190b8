/* msg-channel.cpp

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
#include <unistd.h>
#include <fcntl.h>
#include "format2str.h"
#include "msg-channel.h"

enum PIPES : short { READ = 0, WRITE = 1 };

msg_channel::msg_channel() {
  int line_nbr = __LINE__ + 1;
  if (pipe2(wake_fds, O_NONBLOCK | O_CLOEXEC) == -1) {
    throw msg_channel_exception(format2str("%d: %s() -> pipe2(): %s", line_nbr, __FUNCTION__, strerror(errno)));
  }
}

msg_channel::~msg_channel() {
  for (auto &fd : wake_fds) {
    if (fd != -1) {
      close(fd);
      fd = -1;
    }
  }
}

void msg_channel::push(std::string &&chunk) {
  {
    std::unique_lock<std::mutex> lk(guard);
    queue.emplace_back(std::move(chunk));
  }
  const char b = 1;
  // a full pipe already guarantees a pending wake-up so EAGAIN is fine here
  while (write(wake_fds[PIPES::WRITE], &b, 1) == -1 && errno == EINTR) ;
}

std::deque<std::string> msg_channel::drain() {
  char buf[256];
  while (true) {
    const auto n = read(wake_fds[PIPES::READ], buf, sizeof(buf));
    if (n > 0) continue;
    if (n == -1 && errno == EINTR) continue;
    break;
  }
  std::deque<std::string> items{};
  std::unique_lock<std::mutex> lk(guard);
  items.swap(queue);
  return items;
}
