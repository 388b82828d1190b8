/* udp-sender.h

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
#ifndef SC_LSP_BRIDGE_UDP_SENDER_H
#define SC_LSP_BRIDGE_UDP_SENDER_H

#include <cstddef>
#include <memory>
#include <string>
#include "bridge-exception.h"
#include "log.h"

DECL_EXCEPTION(udp_socket)
DECL_EXCEPTION(send_datagram)

namespace udp_relay {

  extern const char* const LOCALHOST;

  // largest datagram payload guaranteed not to be fragmented on any IPv4 path
  constexpr size_t MAX_UDP_PACKET_SIZE = 508;

  // Outbound datagram endpoint. send_to() throws send_datagram_exception on failure.
  class datagram_transport {
  public:
    virtual ~datagram_transport() = default;
    virtual void send_to(const void *buf, size_t len) = 0;
    virtual void close() = 0;
  };

  // UDP socket connected to a fixed localhost port
  class udp_socket_transport final : public datagram_transport {
  private:
    int fd{-1};
    int const remote_port;
  public:
    udp_socket_transport(const char *const remote_addr, int remote_port);
    udp_socket_transport(const udp_socket_transport &) = delete;
    udp_socket_transport& operator=(const udp_socket_transport &) = delete;
    ~udp_socket_transport() override;
    void send_to(const void *buf, size_t len) override;
    void close() override;
  };

  /**
   * Splits outbound data into chunks of at most max_chunk bytes and emits each
   * as an independent datagram, in order. No framing is added between chunks.
   *
   * A failed chunk is logged and the remaining chunks are still attempted.
   * After close() any send() is rejected with a warning and does no I/O.
   */
  class udp_sender final {
  private:
    std::unique_ptr<datagram_transport> sp_transport;
    logger::log_context log;
    std::string const remote_addr;
    int const remote_port;
    size_t const max_chunk;
    bool closed{false};
  public:
    udp_sender(std::unique_ptr<datagram_transport> transport, logger::log_context log,
               const char *const remote_addr, int remote_port, size_t max_chunk = MAX_UDP_PACKET_SIZE);
    udp_sender(const udp_sender &) = delete;
    udp_sender& operator=(const udp_sender &) = delete;
    ~udp_sender();
    void send(const char *data, size_t len);
    void send(const std::string &msg) { send(msg.data(), msg.size()); }
    void close();
    bool is_closed() const { return closed; }
    const std::string& get_remote_addr() const { return remote_addr; }
    int get_remote_port() const { return remote_port; }
  };

  std::unique_ptr<udp_sender> make_udp_sender(const logger::log_context &log, int send_port);

} // udp_relay

#endif //SC_LSP_BRIDGE_UDP_SENDER_H
