/* udp-loopback-test.cpp

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
#include <functional>
#include <string>
#include <vector>
#include <poll.h>
#include <unistd.h>
#include <gtest/gtest.h>
#include "relay-config.h"
#include "udp-receiver.h"
#include "udp-sender.h"
#include "test-helpers.h"

using namespace udp_relay;
using test_helpers::captured_log;

namespace {

  // drives the receiver the way the event loop does until done() or timeout
  bool pump_receiver(udp_receiver &receiver, const std::function<bool()> &done) {
    for (int i = 0; i < 100 && !done(); i++) {
      pollfd pfd{ receiver.get_fd(), POLLIN, 0 };
      if (poll(&pfd, 1, 20) > 0 && (pfd.revents & POLLIN) != 0) {
        receiver.on_readable();
      }
    }
    return done();
  }

  std::string framed(const std::string &body) {
    return "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
  }

}

TEST(UdpLoopback, SenderToReceiverRoundTripAcrossManyDatagrams) {
  captured_log cap{};
  const auto ports = relay_config::find_free_ports();
  std::vector<std::string> messages;
  udp_receiver receiver{cap.log, LOCALHOST, ports.receive_port,
                        [&messages](const std::string &msg) { messages.push_back(msg); }};
  auto sp_sender = make_udp_sender(cap.log, ports.receive_port);

  std::string body{"{\"jsonrpc\":\"2.0\",\"method\":\"textDocument/didOpen\",\"params\":{\"text\":\""};
  body += std::string(1500, 'z');
  body += "\"}}";
  sp_sender->send(framed(body));

  ASSERT_TRUE(pump_receiver(receiver, [&messages]() { return messages.size() == 1; }));
  EXPECT_EQ(framed(body), messages[0]);
}

TEST(UdpLoopback, ReceiverWritesFramedMessagesToOutputDescriptor) {
  captured_log cap{};
  const auto ports = relay_config::find_free_ports();
  int out_pipe[2];
  ASSERT_EQ(0, pipe(out_pipe));
  ASSERT_TRUE(test_helpers::set_non_blocking(out_pipe[0]));

  auto sp_receiver = make_udp_receiver(cap.log, ports.receive_port, out_pipe[1]);
  auto sp_sender = make_udp_sender(cap.log, ports.receive_port);
  sp_sender->send(framed("{\"id\":1}") + framed("{\"id\":2}"));

  std::string output;
  ASSERT_TRUE(pump_receiver(*sp_receiver, [&output, &out_pipe]() {
    output += test_helpers::read_available(out_pipe[0]);
    return output.size() >= framed("{\"id\":1}").size() * 2;
  }));
  EXPECT_EQ(framed("{\"id\":1}") + framed("{\"id\":2}"), output);
  EXPECT_TRUE(cap.contains("[udp_receive] UDP connection made"));

  close(out_pipe[0]);
  close(out_pipe[1]);
}

TEST(UdpLoopback, ReceiverCloseIsIdempotent) {
  captured_log cap{};
  const auto ports = relay_config::find_free_ports();
  udp_receiver receiver{cap.log, LOCALHOST, ports.receive_port, [](const std::string &) {}};
  EXPECT_FALSE(receiver.is_closed());
  receiver.close();
  receiver.close();
  EXPECT_TRUE(receiver.is_closed());
  EXPECT_EQ(0u, receiver.on_readable());
  EXPECT_EQ(1u, cap.count("UDP receiver closed"));
}

TEST(UdpLoopback, BindingAPortInUseThrows) {
  captured_log cap{};
  const auto ports = relay_config::find_free_ports();
  udp_receiver first{cap.log, LOCALHOST, ports.receive_port, [](const std::string &) {}};
  EXPECT_THROW(udp_receiver(cap.log, LOCALHOST, ports.receive_port, [](const std::string &) {}),
               udp_socket_exception);
}
