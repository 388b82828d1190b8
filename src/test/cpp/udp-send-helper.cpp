/* udp-send-helper.cpp

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
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include "log.h"
#include "msg-reassembler.h"
#include "relay-config.h"
#include "udp-sender.h"

// Stands in for the language server's outbound side in end-to-end tests:
//   udp-send-helper PORT BODY
// frames BODY with a Content-Length header and sends it to 127.0.0.1:PORT.
int main(int argc, const char **argv) {
  logger::log_context log{"udp-send-helper", logger::LL::WARN};
  if (argc != 3) {
    fprintf(stderr, "usage: udp-send-helper PORT BODY\n");
    return EXIT_FAILURE;
  }
  try {
    const int port = relay_config::parse_port("send", argv[1]);
    auto sp_sender = udp_relay::make_udp_sender(log, port);
    sp_sender->send(udp_relay::frame_message(argv[2], strlen(argv[2])));
    sp_sender->close();
  } catch (const bridge_exception &e) {
    log.log(logger::LL::ERR, "%s: %s", e.name(), e.what());
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
