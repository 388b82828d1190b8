/* msg-reassembler-test.cpp

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
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "msg-reassembler.h"
#include "test-helpers.h"

using namespace udp_relay;
using test_helpers::captured_log;

namespace {

  class MsgReassemblerTest : public ::testing::Test {
  protected:
    captured_log cap{};
    std::vector<std::string> messages{};
    msg_reassembler reassembler{cap.log, [this](const std::string &msg) { messages.push_back(msg); }};

    void feed(const std::string &datagram) {
      reassembler.on_datagram(datagram.data(), datagram.size());
    }
  };

  const std::string BODY{R"({"jsonrpc":"2.0","id":1,"method":"initialize"})"};

  std::string framed(const std::string &body) {
    return "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
  }

}

TEST_F(MsgReassemblerTest, SingleDatagramSingleMessage) {
  feed(framed(BODY));
  ASSERT_EQ(1u, messages.size());
  EXPECT_EQ(framed(BODY), messages[0]);
  EXPECT_EQ(0u, reassembler.buffered_size());
  EXPECT_FALSE(reassembler.is_awaiting_body());
}

TEST_F(MsgReassemblerTest, FragmentationAtEveryBoundaryYieldsOneMessage) {
  const auto whole = framed(BODY);
  for (size_t split = 1; split < whole.size(); split++) {
    messages.clear();
    feed(whole.substr(0, split));
    EXPECT_TRUE(messages.empty()) << "split at " << split;
    feed(whole.substr(split));
    ASSERT_EQ(1u, messages.size()) << "split at " << split;
    EXPECT_EQ(whole, messages[0]);
  }
}

TEST_F(MsgReassemblerTest, ByteAtATime) {
  const auto whole = framed(BODY);
  for (const char ch : whole) {
    feed(std::string(1, ch));
  }
  ASSERT_EQ(1u, messages.size());
  EXPECT_EQ(whole, messages[0]);
}

TEST_F(MsgReassemblerTest, SeveralMessagesInOneDatagramEmittedInOrder) {
  feed(framed("{\"id\":1}") + framed("{\"id\":2}") + framed("{\"id\":3}"));
  ASSERT_EQ(3u, messages.size());
  EXPECT_EQ(framed("{\"id\":1}"), messages[0]);
  EXPECT_EQ(framed("{\"id\":2}"), messages[1]);
  EXPECT_EQ(framed("{\"id\":3}"), messages[2]);
}

TEST_F(MsgReassemblerTest, MessageCompletionAndNextHeaderInSameDatagram) {
  const auto first = framed("{\"id\":1}");
  const auto second = framed("{\"id\":2}");
  feed(first.substr(0, 10));
  feed(first.substr(10) + second.substr(0, 5));
  ASSERT_EQ(1u, messages.size());
  feed(second.substr(5));
  ASSERT_EQ(2u, messages.size());
  EXPECT_EQ(second, messages[1]);
}

TEST_F(MsgReassemblerTest, HeaderSplitAcrossDatagrams) {
  feed("Content-Len");
  feed("gth: 2\r\n");
  EXPECT_FALSE(reassembler.is_awaiting_body());
  feed("\r\n");
  EXPECT_TRUE(reassembler.is_awaiting_body());
  feed("{}");
  ASSERT_EQ(1u, messages.size());
  EXPECT_EQ("Content-Length: 2\r\n\r\n{}", messages[0]);
}

TEST_F(MsgReassemblerTest, ExtraHeaderFieldsAreNotForwarded) {
  feed("Content-Type: application/vscode-jsonrpc; charset=utf-8\r\nContent-Length: 2\r\n\r\n{}");
  ASSERT_EQ(1u, messages.size());
  EXPECT_EQ("Content-Length: 2\r\n\r\n{}", messages[0]);
}

TEST_F(MsgReassemblerTest, MalformedHeaderIsDiscardedAndLaterMessagesRecover) {
  feed("Bogus-Field: 12\r\n\r\n");
  EXPECT_TRUE(messages.empty());
  EXPECT_EQ(1u, cap.count("ERROR: Invalid header received"));
  EXPECT_EQ(0u, reassembler.buffered_size());

  feed(framed(BODY));
  ASSERT_EQ(1u, messages.size());
  EXPECT_EQ(framed(BODY), messages[0]);
}

TEST_F(MsgReassemblerTest, MalformedHeaderDefersRestOfDatagramToNextArrival) {
  feed("Content-Length: abc\r\n\r\n" + framed("{}"));
  EXPECT_TRUE(messages.empty());
  EXPECT_EQ(framed("{}").size(), reassembler.buffered_size());

  feed("");
  ASSERT_EQ(1u, messages.size());
  EXPECT_EQ(framed("{}"), messages[0]);
}

TEST_F(MsgReassemblerTest, InvalidUtf8BodyIsDroppedAndStreamContinues) {
  feed(std::string("Content-Length: 3\r\n\r\n{\xff}") + framed(BODY));
  ASSERT_EQ(1u, messages.size());
  EXPECT_EQ(framed(BODY), messages[0]);
  EXPECT_EQ(1u, cap.count("Invalid UTF-8 message body received"));
}

TEST_F(MsgReassemblerTest, MultibyteBodyHeaderUsesByteLength) {
  const std::string body{"{\"text\":\"h\xc3\xa9llo \xe2\x99\xab\"}"}; // é and a music note
  feed("Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body);
  ASSERT_EQ(1u, messages.size());
  EXPECT_EQ(21u, body.size());
  EXPECT_EQ("Content-Length: 21\r\n\r\n" + body, messages[0]);
}

TEST_F(MsgReassemblerTest, ZeroLengthBody) {
  feed("Content-Length: 0\r\n\r\n");
  ASSERT_EQ(1u, messages.size());
  EXPECT_EQ("Content-Length: 0\r\n\r\n", messages[0]);
}

TEST(MsgReassemblerLimits, HeaderlessGarbageIsDiscardedOnceOverHeaderLimit) {
  captured_log cap{};
  std::vector<std::string> messages;
  msg_reassembler reassembler{cap.log, [&messages](const std::string &msg) { messages.push_back(msg); }, 64, 1024};

  const std::string garbage(40, 'g');
  reassembler.on_datagram(garbage.data(), garbage.size());
  EXPECT_EQ(40u, reassembler.buffered_size());
  reassembler.on_datagram(garbage.data(), garbage.size());
  EXPECT_EQ(0u, reassembler.buffered_size());
  EXPECT_EQ(1u, cap.count("No header delimiter within 64 bytes - discarding 80 buffered bytes"));

  const auto msg = framed("{}");
  reassembler.on_datagram(msg.data(), msg.size());
  ASSERT_EQ(1u, messages.size());
  EXPECT_EQ(msg, messages[0]);
}

TEST(MsgReassemblerLimits, OversizedContentLengthIsRefused) {
  captured_log cap{};
  std::vector<std::string> messages;
  msg_reassembler reassembler{cap.log, [&messages](const std::string &msg) { messages.push_back(msg); }, 64, 1024};

  const std::string huge{"Content-Length: 999999999999999\r\n\r\nabc"};
  reassembler.on_datagram(huge.data(), huge.size());
  EXPECT_FALSE(reassembler.is_awaiting_body());
  EXPECT_EQ(0u, reassembler.buffered_size());
  EXPECT_TRUE(cap.contains("Declared Content-Length 999999999999999 exceeds limit of 1024"));

  const auto msg = framed(std::string(1024, 'b'));
  reassembler.on_datagram(msg.data(), msg.size());
  ASSERT_EQ(1u, messages.size());
  EXPECT_EQ(msg, messages[0]);
}

TEST(MsgReassemblerFunctions, ParseContentLength) {
  size_t len = 0;
  const std::string good{"Content-Length: 1234"};
  EXPECT_TRUE(parse_content_length(good.data(), good.size(), len));
  EXPECT_EQ(1234u, len);

  const std::string no_space{"Content-Length:7"};
  EXPECT_TRUE(parse_content_length(no_space.data(), no_space.size(), len));
  EXPECT_EQ(7u, len);

  const std::string missing{"Content-Type: text/plain"};
  EXPECT_FALSE(parse_content_length(missing.data(), missing.size(), len));

  const std::string not_number{"Content-Length: -5"};
  EXPECT_FALSE(parse_content_length(not_number.data(), not_number.size(), len));

  const std::string too_long{"Content-Length: 99999999999999999999"};
  EXPECT_FALSE(parse_content_length(too_long.data(), too_long.size(), len));
}

TEST(MsgReassemblerFunctions, Utf8Validation) {
  const auto valid = [](const std::string &s) { return is_valid_utf8(s.data(), s.size()); };
  EXPECT_TRUE(valid(""));
  EXPECT_TRUE(valid("plain ascii"));
  EXPECT_TRUE(valid("\xc3\xa9"));               // U+00E9
  EXPECT_TRUE(valid("\xe2\x82\xac"));           // U+20AC
  EXPECT_TRUE(valid("\xf0\x9f\x8e\xb5"));       // U+1F3B5
  EXPECT_FALSE(valid("\xc3"));                  // truncated
  EXPECT_FALSE(valid("\xe2\x82"));              // truncated
  EXPECT_FALSE(valid("\xc0\xaf"));              // overlong
  EXPECT_FALSE(valid("\xed\xa0\x80"));          // surrogate
  EXPECT_FALSE(valid("\xf4\x90\x80\x80"));      // beyond U+10FFFF
  EXPECT_FALSE(valid("\x80"));                  // stray continuation byte
}

TEST(MsgReassemblerFunctions, FrameMessage) {
  EXPECT_EQ("Content-Length: 2\r\n\r\n{}", frame_message("{}", 2));
}
