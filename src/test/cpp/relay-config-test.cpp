/* relay-config-test.cpp

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
#include <string>
#include <gtest/gtest.h>
#include "cfgparse.h"
#include "relay-config.h"
#include "test-helpers.h"

using namespace relay_config;
using test_helpers::captured_log;
using test_helpers::make_temp_file;

TEST(RelayConfig, Defaults) {
  const config_t cfg{};
  EXPECT_EQ("vscode", cfg.ide_name);
#if defined(__linux__)
  EXPECT_EQ("sclang", cfg.sclang_path);
#endif
  EXPECT_EQ(0, cfg.send_port);
  EXPECT_EQ(0, cfg.receive_port);
  EXPECT_FALSE(cfg.verbose);
  EXPECT_TRUE(cfg.extra_args.empty());
}

TEST(RelayConfig, ParsePortAcceptsOnlyValidPortNumbers) {
  EXPECT_EQ(1, parse_port("send", "1"));
  EXPECT_EQ(57120, parse_port("send", "57120"));
  EXPECT_EQ(65535, parse_port("send", "65535"));
  EXPECT_THROW(parse_port("send", "0"), port_config_exception);
  EXPECT_THROW(parse_port("send", "65536"), port_config_exception);
  EXPECT_THROW(parse_port("send", "-1"), port_config_exception);
  EXPECT_THROW(parse_port("send", "12ab"), port_config_exception);
  EXPECT_THROW(parse_port("send", ""), port_config_exception);
}

TEST(RelayConfig, OnlyOnePortGivenIsRejected) {
  EXPECT_NO_THROW(validate_ports(0, 0));
  EXPECT_NO_THROW(validate_ports(5000, 5001));
  try {
    validate_ports(5000, 0);
    FAIL() << "expected port_config_exception";
  } catch (const port_config_exception &ex) {
    EXPECT_STREQ("Both server and client port must specified (or neither)", ex.what());
  }
  EXPECT_THROW(validate_ports(0, 5001), port_config_exception);
}

TEST(RelayConfig, BothPortsGivenAreSwappedIntoSessionRoles) {
  captured_log cap{};
  config_t cfg{};
  cfg.send_port = 5000;
  cfg.receive_port = 5001;
  const auto ports = negotiate_ports(cfg, cap.log);
  EXPECT_EQ(5000, ports.receive_port);
  EXPECT_EQ(5001, ports.send_port);
}

TEST(RelayConfig, NeitherPortGivenFindsTwoDistinctFreePorts) {
  captured_log cap{};
  const config_t cfg{};
  const auto ports = negotiate_ports(cfg, cap.log);
  EXPECT_GT(ports.receive_port, 0);
  EXPECT_GT(ports.send_port, 0);
  EXPECT_NE(ports.receive_port, ports.send_port);
  EXPECT_TRUE(cap.contains("Found free ports"));
}

TEST(RelayConfig, NegotiationFailsBeforeProbingWhenOnePortMissing) {
  captured_log cap{};
  config_t cfg{};
  cfg.receive_port = 5001;
  EXPECT_THROW(negotiate_ports(cfg, cap.log), port_config_exception);
  EXPECT_FALSE(cap.contains("Found free ports"));
}

TEST(RelayConfig, ServerLogLevelFollowsVerbose) {
  config_t cfg{};
  EXPECT_STREQ("warning", server_log_level(cfg));
  cfg.verbose = true;
  EXPECT_STREQ("debug", server_log_level(cfg));
}

TEST(RelayConfig, LoggingPolicy) {
  logger::log_context log{"sc-lsp-bridge-test"};
  config_t cfg{};
  configure_logging(cfg, log);
  EXPECT_EQ(logger::LL::ERR, log.get_level());

  const auto log_path = make_temp_file("");
  cfg.log_file = log_path;
  configure_logging(cfg, log);
  EXPECT_EQ(logger::LL::WARN, log.get_level());

  cfg.verbose = true;
  configure_logging(cfg, log);
  EXPECT_EQ(logger::LL::DEBUG, log.get_level());
  log.log(logger::LL::DEBUG, "written to %s", "log file");

  log.set_output(nullptr);
  remove(log_path.c_str());
}

TEST(RelayConfig, LoadConfigFile) {
  const auto path = make_temp_file(
      "[sclang]\n"
      "path = /opt/sc/bin/sclang\n"
      "ide_name = nvim\n"
      "\n"
      "[ports]\n"
      "send = 57210\n"
      "receive = 57211\n"
      "\n"
      "[log]\n"
      "file = /tmp/sc-lsp-bridge.log\n"
      "verbose = yes\n"
      "syslog = off\n");
  config_t cfg{};
  load_config_file(path.c_str(), cfg);
  EXPECT_EQ("/opt/sc/bin/sclang", cfg.sclang_path);
  EXPECT_EQ("nvim", cfg.ide_name);
  EXPECT_EQ(57210, cfg.send_port);
  EXPECT_EQ(57211, cfg.receive_port);
  EXPECT_EQ("/tmp/sc-lsp-bridge.log", cfg.log_file);
  EXPECT_TRUE(cfg.verbose);
  EXPECT_FALSE(cfg.syslog);
  EXPECT_EQ(path, cfg.config_file);
  remove(path.c_str());
}

TEST(RelayConfig, ConfigFileErrorsAreReported) {
  const auto path = make_temp_file(
      "[ports]\n"
      "send = 70000\n"
      "[sclang]\n"
      "colour = blue\n");
  config_t cfg{};
  try {
    load_config_file(path.c_str(), cfg);
    FAIL() << "expected process_cfg_exception";
  } catch (const process_cfg_exception &ex) {
    const std::string msg{ex.what()};
    EXPECT_NE(std::string::npos, msg.find("'send = 70000'"));
    EXPECT_NE(std::string::npos, msg.find("'colour = blue'"));
  }
  remove(path.c_str());
}

TEST(RelayConfig, MissingConfigFileThrows) {
  config_t cfg{};
  EXPECT_THROW(load_config_file("/nonexistent/sc-lsp-bridge.ini", cfg), process_cfg_exception);
}
