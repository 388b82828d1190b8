/* udp-receiver.h

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
#ifndef SC_LSP_BRIDGE_UDP_RECEIVER_H
#define SC_LSP_BRIDGE_UDP_RECEIVER_H

#include <cstddef>
#include <memory>
#include "msg-reassembler.h"
#include "udp-sender.h"

namespace udp_relay {

  constexpr size_t MAX_DGRAM_RECV_SIZE = 64 * 1024;

  // A message sink that writes each framed message to fd as one write sequence and
  // syncs it. A failed write is logged; the message is lost but the relay keeps going.
  message_sink_t make_fd_message_sink(const logger::log_context &log, int fd);

  /**
   * Owns the inbound UDP socket bound to a localhost port. The event loop polls fd()
   * and calls on_readable() - every pending datagram is drained into the reassembler.
   */
  class udp_receiver final {
  private:
    logger::log_context log;
    msg_reassembler reassembler;
    int fd{-1};
    int const local_port;
  public:
    udp_receiver(logger::log_context log, const char *const local_addr, int local_port, message_sink_t sink);
    udp_receiver(const udp_receiver &) = delete;
    udp_receiver& operator=(const udp_receiver &) = delete;
    ~udp_receiver();
    int get_fd() const { return fd; }
    int get_local_port() const { return local_port; }
    bool is_closed() const { return fd == -1; }
    // returns number of datagrams consumed
    size_t on_readable();
    void close();
    const msg_reassembler& get_reassembler() const { return reassembler; }
  };

  std::unique_ptr<udp_receiver> make_udp_receiver(const logger::log_context &log, int receive_port, int output_fd);

} // udp_relay

#endif //SC_LSP_BRIDGE_UDP_RECEIVER_H
