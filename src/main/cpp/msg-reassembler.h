/* msg-reassembler.h

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
#ifndef SC_LSP_BRIDGE_MSG_REASSEMBLER_H
#define SC_LSP_BRIDGE_MSG_REASSEMBLER_H

#include <cstddef>
#include <functional>
#include <string>
#include "log.h"

namespace udp_relay {

  extern const char* const HEADER_DELIMITER;      // "\r\n\r\n"
  extern const char* const CONTENT_LENGTH_FIELD;  // "Content-Length:"

  // a header block (everything before the blank line) longer than this is garbage
  constexpr size_t MAX_HEADER_SIZE = 8 * 1024;
  // largest body accepted; a bigger declared Content-Length is rejected like a malformed header
  constexpr size_t MAX_CONTENT_LENGTH = 64 * 1024 * 1024;

  // receives each fully reconstructed "Content-Length: N\r\n\r\n<body>" message
  using message_sink_t = std::function<void(const std::string &framed_msg)>;

  // Extracts the declared body length from a header block; false when absent or unparseable.
  bool parse_content_length(const char *header, size_t header_len, size_t &content_length);

  bool is_valid_utf8(const char *data, size_t len);

  std::string frame_message(const char *body, size_t body_len);

  /**
   * Accumulates datagram payloads and emits complete length-delimited messages.
   *
   * The buffer is either awaiting a header (no declared length yet) or awaiting
   * the declared number of body bytes. A single datagram may complete zero, one
   * or several messages; each completed message is passed to the sink exactly
   * once, in completion order, as one string.
   *
   * Datagrams are processed in arrival order - no reordering is attempted.
   *
   * Memory is bounded: when no header delimiter shows up within max_header_size
   * bytes the buffer is discarded, and a declared length above max_content_length
   * is refused without buffering the body.
   */
  class msg_reassembler final {
  private:
    logger::log_context log;
    message_sink_t sink;
    size_t const max_header_size;
    size_t const max_content_length;
    std::string buffer{};
    size_t content_length{0};
    bool has_content_length{false};
    void process_buffer();
  public:
    msg_reassembler(logger::log_context log, message_sink_t sink,
                    size_t max_header_size = MAX_HEADER_SIZE, size_t max_content_length = MAX_CONTENT_LENGTH);
    msg_reassembler(const msg_reassembler &) = delete;
    msg_reassembler& operator=(const msg_reassembler &) = delete;
    ~msg_reassembler() = default;
    void on_datagram(const char *data, size_t len);
    size_t buffered_size() const { return buffer.size(); }
    bool is_awaiting_body() const { return has_content_length; }
  };

} // udp_relay

#endif //SC_LSP_BRIDGE_MSG_REASSEMBLER_H
