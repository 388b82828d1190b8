/* stdin-relay-test.cpp

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
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <poll.h>
#include <unistd.h>
#include <gtest/gtest.h>
#include "msg-channel.h"
#include "stdin-relay.h"
#include "test-helpers.h"

using namespace stdin_relay;
using test_helpers::captured_log;
using test_helpers::wait_until;
using std::chrono::milliseconds;

namespace {

  class InputRelayTest : public ::testing::Test {
  protected:
    captured_log cap{};
    int pipe_fds[2]{-1, -1};
    std::mutex guard{};
    std::string received{};
    std::atomic_int callback_count{0};

    void SetUp() override {
      ASSERT_EQ(0, pipe(pipe_fds));
    }
    void TearDown() override {
      if (pipe_fds[0] != -1) close(pipe_fds[0]);
      if (pipe_fds[1] != -1) close(pipe_fds[1]);
    }

    on_input_received_t make_callback() {
      return [this](std::string &&data) {
        std::lock_guard<std::mutex> lk(guard);
        received += data;
        callback_count++;
      };
    }

    std::string get_received() {
      std::lock_guard<std::mutex> lk(guard);
      return received;
    }
  };

}

TEST_F(InputRelayTest, ForwardsBytesAsTheyArrive) {
  input_relay relay{cap.log, pipe_fds[0], make_callback(), 50, 20};
  relay.start();
  EXPECT_TRUE(relay.is_running());

  const std::string first{"Content-Length: 2\r\n\r\n{}"};
  ASSERT_EQ((ssize_t) first.size(), write(pipe_fds[1], first.data(), first.size()));
  EXPECT_TRUE(wait_until([&]() { return get_received() == first; }));

  const std::string second{"Content-Length: 4\r\n\r\nnull"};
  ASSERT_EQ((ssize_t) second.size(), write(pipe_fds[1], second.data(), second.size()));
  EXPECT_TRUE(wait_until([&]() { return get_received() == first + second; }));

  relay.stop();
  EXPECT_TRUE(relay.join(milliseconds(1000)));
  EXPECT_FALSE(relay.is_running());
}

TEST_F(InputRelayTest, StopIsNoticedWithinThePollBound) {
  input_relay relay{cap.log, pipe_fds[0], make_callback(), 100, 100};
  relay.start();

  const auto started = std::chrono::steady_clock::now();
  relay.stop();
  EXPECT_TRUE(relay.join(milliseconds(2000)));
  const auto elapsed = std::chrono::steady_clock::now() - started;
  EXPECT_LT(elapsed, milliseconds(1000));
  EXPECT_EQ(0, callback_count.load());
}

TEST_F(InputRelayTest, EndOfStreamBacksOffWithoutCallbacks) {
  input_relay relay{cap.log, pipe_fds[0], make_callback(), 50, 50};
  close(pipe_fds[1]);
  pipe_fds[1] = -1;
  relay.start();

  std::this_thread::sleep_for(milliseconds(300));
  EXPECT_EQ(0, callback_count.load());
  EXPECT_TRUE(relay.is_running());

  relay.stop();
  EXPECT_TRUE(relay.join(milliseconds(1000)));
}

TEST_F(InputRelayTest, JoinWithoutStartReturnsImmediately) {
  input_relay relay{cap.log, pipe_fds[0], make_callback()};
  EXPECT_TRUE(relay.join(milliseconds(10)));
  EXPECT_FALSE(relay.is_running());
}

TEST(MsgChannel, DrainReturnsChunksInPushOrderAndWakesPoller) {
  msg_channel chan;
  pollfd pfd{ chan.get_wake_fd(), POLLIN, 0 };
  EXPECT_EQ(0, poll(&pfd, 1, 0));

  chan.push(std::string("one"));
  chan.push(std::string("two"));
  EXPECT_EQ(1, poll(&pfd, 1, 100));

  auto chunks = chan.drain();
  ASSERT_EQ(2u, chunks.size());
  EXPECT_EQ("one", chunks[0]);
  EXPECT_EQ("two", chunks[1]);

  pfd.revents = 0;
  EXPECT_EQ(0, poll(&pfd, 1, 0));
  EXPECT_TRUE(chan.drain().empty());
}

TEST(MsgChannel, PushFromAnotherThread) {
  msg_channel chan;
  std::thread producer([&chan]() {
    for (int i = 0; i < 100; i++) chan.push(std::to_string(i));
  });
  producer.join();

  auto chunks = chan.drain();
  ASSERT_EQ(100u, chunks.size());
  EXPECT_EQ("0", chunks.front());
  EXPECT_EQ("99", chunks.back());
}
