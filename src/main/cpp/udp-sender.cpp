/* udp-sender.cpp

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
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include "format2str.h"
#include "udp-sender.h"

using logger::LL;

namespace udp_relay {

  const char* const LOCALHOST = "127.0.0.1";

  udp_socket_transport::udp_socket_transport(const char *const remote_addr, int remote_port)
      : remote_port{remote_port}
  {
    int line_nbr = __LINE__ + 1;
    fd = socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (fd == -1) {
      throw udp_socket_exception(format2str("%d: %s() -> socket(): %s", line_nbr, __FUNCTION__, strerror(errno)));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(remote_port));
    if (inet_pton(AF_INET, remote_addr, &addr.sin_addr) != 1) {
      ::close(fd);
      fd = -1;
      throw udp_socket_exception(format2str("invalid remote address '%s'", remote_addr));
    }

    // connecting a datagram socket just fixes the default destination
    line_nbr = __LINE__ + 1;
    if (connect(fd, (const sockaddr*) &addr, sizeof(addr)) == -1) {
      const auto err_no = errno;
      ::close(fd);
      fd = -1;
      throw udp_socket_exception(format2str("%d: %s() -> connect(%s:%d): %s",
                                            line_nbr, __FUNCTION__, remote_addr, remote_port, strerror(err_no)));
    }
  }

  udp_socket_transport::~udp_socket_transport() {
    close();
  }

  void udp_socket_transport::send_to(const void *buf, size_t len) {
    if (fd == -1) {
      throw send_datagram_exception("socket is closed");
    }
    ssize_t n;
    do {
      n = ::send(fd, buf, len, 0);
    } while (n == -1 && errno == EINTR);
    if (n == -1) {
      throw send_datagram_exception(format2str("send() to port %d failed: %s", remote_port, strerror(errno)));
    }
    if ((size_t) n != len) {
      throw send_datagram_exception(format2str("short send to port %d: %zd of %zu bytes", remote_port, n, len));
    }
  }

  void udp_socket_transport::close() {
    if (fd != -1) {
      ::close(fd);
      fd = -1;
    }
  }

  udp_sender::udp_sender(std::unique_ptr<datagram_transport> transport, logger::log_context log,
                         const char *const remote_addr, int remote_port, size_t max_chunk)
      : sp_transport{std::move(transport)}, log{std::move(log)}, remote_addr{remote_addr},
        remote_port{remote_port}, max_chunk{max_chunk > 0 ? max_chunk : MAX_UDP_PACKET_SIZE}
  {}

  udp_sender::~udp_sender() {
    if (!closed && sp_transport) {
      sp_transport->close();
    }
  }

  void udp_sender::send(const char *data, size_t len) {
    if (closed) {
      log.logm(LL::WARN, "Attempted to send data on a closed UDPSender");
      return;
    }

    for (size_t offset = 0; offset < len; offset += max_chunk) {
      const size_t chunk_len = std::min(max_chunk, len - offset);
      try {
        sp_transport->send_to(data + offset, chunk_len);
      } catch (const bridge_exception &ex) {
        log.log(LL::ERR, "Error sending chunk: %s", ex.what());
      } catch (const std::exception &ex) {
        log.log(LL::ERR, "Error sending chunk: %s", ex.what());
      }
    }
  }

  void udp_sender::close() {
    if (!closed) {
      closed = true;
      sp_transport->close();
      log.logm(LL::INFO, "UDPSender closed");
    }
  }

  std::unique_ptr<udp_sender> make_udp_sender(const logger::log_context &log, int send_port) {
    std::unique_ptr<datagram_transport> sp_transport{ new udp_socket_transport(LOCALHOST, send_port) };
    return std::unique_ptr<udp_sender>{ new udp_sender(std::move(sp_transport), log, LOCALHOST, send_port) };
  }

} // udp_relay
