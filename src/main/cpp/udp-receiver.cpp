/* udp-receiver.cpp

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
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <vector>
#include "format2str.h"
#include "udp-receiver.h"

using logger::LL;

namespace udp_relay {

  message_sink_t make_fd_message_sink(const logger::log_context &log, int fd) {
    return [log, fd](const std::string &framed_msg) {
      const char *p = framed_msg.data();
      size_t remaining = framed_msg.size();
      while (remaining > 0) {
        const auto nw = write(fd, p, remaining);
        if (nw == -1) {
          if (errno == EINTR) continue;
          if (errno == EAGAIN || errno == EWOULDBLOCK) {
            // output side is non-blocking and full; wait until it drains
            usleep(1000);
            continue;
          }
          log.log(LL::ERR, "failed writing message to output fd{%d}: %s", fd, strerror(errno));
          return;
        }
        p += nw;
        remaining -= (size_t) nw;
      }
    };
  }

  udp_receiver::udp_receiver(logger::log_context log, const char *const local_addr, int local_port,
                             message_sink_t sink)
      : log{log}, reassembler{log, std::move(sink)}, local_port{local_port}
  {
    int line_nbr = __LINE__ + 1;
    fd = socket(AF_INET, SOCK_DGRAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd == -1) {
      throw udp_socket_exception(format2str("%d: %s() -> socket(): %s", line_nbr, __FUNCTION__, strerror(errno)));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(local_port));
    if (inet_pton(AF_INET, local_addr, &addr.sin_addr) != 1) {
      ::close(fd);
      fd = -1;
      throw udp_socket_exception(format2str("invalid local address '%s'", local_addr));
    }

    line_nbr = __LINE__ + 1;
    if (bind(fd, (const sockaddr*) &addr, sizeof(addr)) == -1) {
      const auto err_no = errno;
      ::close(fd);
      fd = -1;
      throw udp_socket_exception(format2str("%d: %s() -> bind(%s:%d): %s",
                                            line_nbr, __FUNCTION__, local_addr, local_port, strerror(err_no)));
    }

    this->log.logm(LL::INFO, "UDP connection made");
  }

  udp_receiver::~udp_receiver() {
    if (fd != -1) {
      ::close(fd);
      fd = -1;
    }
  }

  size_t udp_receiver::on_readable() {
    std::vector<char> buf(MAX_DGRAM_RECV_SIZE);
    size_t count = 0;

    while (fd != -1) {
      sockaddr_in sender{};
      socklen_t slen = sizeof(sender);
      const auto n = recvfrom(fd, buf.data(), buf.size(), 0, (sockaddr*) &sender, &slen);
      if (n == -1) {
        const auto err_no = errno;
        if (err_no == EINTR) continue;
        if (err_no != EAGAIN && err_no != EWOULDBLOCK) {
          log.log(LL::WARN, "UDP error: %s", strerror(err_no));
        }
        break;
      }
      count++;
      if (log.is_trace_level()) {
        char addr_str[INET_ADDRSTRLEN]{};
        inet_ntop(AF_INET, &sender.sin_addr, addr_str, sizeof(addr_str));
        log.log(LL::TRACE, "datagram of %zd bytes from %s:%d", n, addr_str, ntohs(sender.sin_port));
      }
      reassembler.on_datagram(buf.data(), (size_t) n);
    }

    return count;
  }

  void udp_receiver::close() {
    if (fd != -1) {
      ::close(fd);
      fd = -1;
      log.logm(LL::INFO, "UDP receiver closed");
    }
  }

  std::unique_ptr<udp_receiver> make_udp_receiver(const logger::log_context &log, int receive_port, int output_fd) {
    auto const receive_log = log.child("udp_receive");
    return std::unique_ptr<udp_receiver>{
        new udp_receiver(receive_log, LOCALHOST, receive_port, make_fd_message_sink(receive_log, output_fd)) };
  }

} // udp_relay
