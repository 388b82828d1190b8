/* msg-reassembler.cpp

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
#include <cstring>
#include <exception>
#include "msg-reassembler.h"

using logger::LL;

namespace udp_relay {

  const char* const HEADER_DELIMITER = "\r\n\r\n";
  const char* const CONTENT_LENGTH_FIELD = "Content-Length:";

  static const size_t DELIMITER_LEN = 4;
  static const size_t MAX_LENGTH_DIGITS = 15;

  bool parse_content_length(const char *header, size_t header_len, size_t &content_length) {
    const std::string hdr(header, header_len);
    const auto field_pos = hdr.find(CONTENT_LENGTH_FIELD);
    if (field_pos == std::string::npos) return false;

    auto pos = field_pos + strlen(CONTENT_LENGTH_FIELD);
    while (pos < hdr.size() && (hdr[pos] == ' ' || hdr[pos] == '\t')) pos++;

    const auto digits_start = pos;
    size_t value = 0;
    while (pos < hdr.size() && hdr[pos] >= '0' && hdr[pos] <= '9') {
      if (pos - digits_start >= MAX_LENGTH_DIGITS) return false;
      value = value * 10 + (size_t) (hdr[pos] - '0');
      pos++;
    }
    if (pos == digits_start) return false;

    content_length = value;
    return true;
  }

  bool is_valid_utf8(const char *data, size_t len) {
    auto const s = reinterpret_cast<const unsigned char*>(data);
    size_t i = 0;
    while (i < len) {
      const unsigned char c = s[i];
      if (c < 0x80) {
        i++;
        continue;
      }
      size_t n;
      unsigned int cp;
      if ((c & 0xE0) == 0xC0) { n = 1; cp = c & 0x1Fu; }
      else if ((c & 0xF0) == 0xE0) { n = 2; cp = c & 0x0Fu; }
      else if ((c & 0xF8) == 0xF0) { n = 3; cp = c & 0x07u; }
      else return false;
      if (i + n >= len) return false; // truncated sequence
      for (size_t k = 1; k <= n; k++) {
        if ((s[i + k] & 0xC0) != 0x80) return false;
        cp = (cp << 6) | (s[i + k] & 0x3Fu);
      }
      // reject overlong encodings, surrogates and out of range code points
      if ((n == 1 && cp < 0x80) || (n == 2 && cp < 0x800) || (n == 3 && cp < 0x10000)) return false;
      if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
      i += n + 1;
    }
    return true;
  }

  std::string frame_message(const char *body, size_t body_len) {
    std::string framed(CONTENT_LENGTH_FIELD);
    framed += ' ';
    framed += std::to_string(body_len);
    framed += HEADER_DELIMITER;
    framed.append(body, body_len);
    return framed;
  }

  msg_reassembler::msg_reassembler(logger::log_context log, message_sink_t sink,
                                   size_t max_header_size, size_t max_content_length)
      : log{std::move(log)}, sink{std::move(sink)}, max_header_size{max_header_size},
        max_content_length{max_content_length}
  {}

  void msg_reassembler::on_datagram(const char *data, size_t len) {
    try {
      buffer.append(data, len);
      process_buffer();
    } catch (const std::exception &ex) {
      log.log(LL::ERR, "Error processing datagram: %s", ex.what());
    }
  }

  void msg_reassembler::process_buffer() {
    while (true) {
      if (!has_content_length) {
        const auto delim_pos = buffer.find(HEADER_DELIMITER);
        if (delim_pos == std::string::npos) {
          if (buffer.size() > max_header_size) {
            log.log(LL::ERR, "No header delimiter within %zu bytes - discarding %zu buffered bytes",
                    max_header_size, buffer.size());
            buffer.clear();
          }
          return; // not enough data to read the header
        }

        size_t declared_len = 0;
        const bool is_valid_header = parse_content_length(buffer.data(), delim_pos, declared_len);
        buffer.erase(0, delim_pos + DELIMITER_LEN);
        if (!is_valid_header) {
          log.logm(LL::ERR, "Invalid header received");
          return;
        }
        if (declared_len > max_content_length) {
          log.log(LL::ERR, "Declared Content-Length %zu exceeds limit of %zu - discarding %zu buffered bytes",
                  declared_len, max_content_length, buffer.size());
          buffer.clear();
          return;
        }
        content_length = declared_len;
        has_content_length = true;
      }

      if (buffer.size() < content_length) {
        return; // wait for another datagram to complete the body
      }

      const std::string body(buffer, 0, content_length);
      buffer.erase(0, content_length);
      has_content_length = false;
      content_length = 0;

      if (!is_valid_utf8(body.data(), body.size())) {
        log.log(LL::ERR, "Invalid UTF-8 message body received (%zu bytes) - dropped", body.size());
      } else {
        sink(frame_message(body.data(), body.size()));
      }

      if (buffer.empty()) {
        return;
      }
    }
  }

} // udp_relay
