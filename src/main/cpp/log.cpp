/* log.cpp

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
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <cctype>
#include <ctime>
#include <syslog.h>
#include <string>
#include <atomic>
#include <mutex>
#include <algorithm>
#include "format2str.h"
#include "log.h"

namespace logger {

  const char CNEWLINE = '\n';

  static void close_log_file(FILE *p) {
    if (p != nullptr) {
      fclose(p);
    }
  }

  using log_file_sp_t = std::unique_ptr<FILE, decltype(&close_log_file)>;

  struct log_sink {
    const std::string progname;
    std::atomic<LOGGING_LEVEL> level;
    std::mutex guard{};
    FILE *stream{nullptr};
    log_file_sp_t sp_log_file{nullptr, &close_log_file};
    bool is_timestamped{false};
    bool is_syslogging{false};
    bool is_openlog_called{false};
    log_sink(const char *const progname, LOGGING_LEVEL level) : progname{progname}, level{level} {}
    log_sink(const log_sink &) = delete;
    log_sink& operator=(const log_sink &) = delete;
    ~log_sink() {
      if (is_openlog_called) {
        closelog();
      }
    }
  };

  // trim from start
  static inline std::string& ltrim(std::string &s) {
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char c) { return !std::isspace(c); }));
    return s;
  }

  // trim from end
  static inline std::string& rtrim(std::string &s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return !std::isspace(c); }).base(), s.end());
    return s;
  }

  // trim from both ends
  static inline std::string& trim(std::string &s) {
    return ltrim(rtrim(s));
  }

  LOGGING_LEVEL str_to_level(const char *const logging_level) {
    if (logging_level == nullptr) return DEFAULT_LOGGING_LEVEL;
    std::string log_level(logging_level);
    trim(log_level);
    std::transform(log_level.begin(), log_level.end(), log_level.begin(), ::toupper);
    if (log_level.compare("TRACE") == 0) return LL::TRACE;
    if (log_level.compare("DEBUG") == 0) return LL::DEBUG;
    if (log_level.compare("INFO") == 0) return LL::INFO;
    if (log_level.compare("WARN") == 0 || log_level.compare("WARNING") == 0) return LL::WARN;
    if (log_level.compare("ERR") == 0 || log_level.compare("ERROR") == 0) return LL::ERR;
    if (log_level.compare("FATAL") == 0) return LL::FATAL;
    return DEFAULT_LOGGING_LEVEL; // didn't match anything so return default logging level
  }

  const char* level_to_str(LOGGING_LEVEL level) {
    switch (level) {
      case LL::FATAL: return "FATAL";
      case LL::ERR:   return "ERROR";
      case LL::WARN:  return "WARN";
      case LL::INFO:  return "INFO";
      case LL::DEBUG: return "DEBUG";
      case LL::TRACE: return "TRACE";
    }
    return "";
  }

  log_context::log_context(const char *const progname, LOGGING_LEVEL level)
      : sp_sink{std::make_shared<log_sink>(progname, level)}, name{}
  {}

  log_context::log_context(std::shared_ptr<log_sink> sink, std::string &&name)
      : sp_sink{std::move(sink)}, name{std::move(name)}
  {}

  log_context log_context::child(const char *const child_name) const {
    std::string child_nm = name.empty() ? std::string(child_name) : name + "." + child_name;
    return log_context{sp_sink, std::move(child_nm)};
  }

  LOGGING_LEVEL log_context::get_level() const { return sp_sink->level.load(); }

  void log_context::set_level(LOGGING_LEVEL level) { sp_sink->level.store(level); }

  void log_context::set_syslogging(bool is_syslogging_enabled) {
    std::unique_lock<std::mutex> lk(sp_sink->guard);
    sp_sink->is_syslogging = is_syslogging_enabled;
    if (is_syslogging_enabled && !sp_sink->is_openlog_called) {
      openlog(sp_sink->progname.c_str(), LOG_PID, LOG_DAEMON);
      sp_sink->is_openlog_called = true;
    }
  }

  void log_context::set_log_file(const char *const log_file_path) {
    FILE *const fp = fopen(log_file_path, "w");
    if (fp == nullptr) {
      const auto err_no = errno;
      log(LL::ERR, "could not open log file \"%s\": %s", log_file_path, strerror(err_no));
      return;
    }
    setvbuf(fp, nullptr, _IOLBF, 0);
    std::unique_lock<std::mutex> lk(sp_sink->guard);
    sp_sink->sp_log_file.reset(fp);
    sp_sink->stream = fp;
    sp_sink->is_timestamped = true;
  }

  void log_context::set_output(FILE *stream) {
    std::unique_lock<std::mutex> lk(sp_sink->guard);
    sp_sink->sp_log_file.reset(nullptr);
    sp_sink->stream = stream;
    sp_sink->is_timestamped = false;
  }

  void log_context::vlog(LOGGING_LEVEL level, const char * const fmt, va_list ap) const {
    if (!is_enabled(level)) {
      return;
    }

    const char *levelstr = ": ";
    bool is_syslog_level = false;
    switch (level) {
      case LL::FATAL:
        levelstr = ": FATAL: ";
        is_syslog_level = true;
        break;
      case LL::ERR:
        levelstr = ": ERROR: ";
        is_syslog_level = true;
        break;
      case LL::WARN:
        levelstr = ": WARN: ";
        break;
      case LL::INFO:
        levelstr = ": INFO: ";
        break;
      case LL::DEBUG:
        levelstr = ": DEBUG: ";
        break;
      case LL::TRACE:
        levelstr = ": TRACE: ";
        break;
    }

    std::string msg( vformat2str(fmt, ap) );

    std::string line;
    line.reserve(sp_sink->progname.size() + name.size() + msg.size() + 48);
    line += sp_sink->progname;
    line += levelstr;
    if (!name.empty()) {
      line += '[';
      line += name;
      line += "] ";
    }
    line += msg;
    line += CNEWLINE;

    std::unique_lock<std::mutex> lk(sp_sink->guard);
    FILE *const stream = sp_sink->stream != nullptr ? sp_sink->stream : stderr;
    if (sp_sink->is_timestamped) {
      char tmstamp[32];
      const time_t now = time(nullptr);
      struct tm tm_buf{};
      localtime_r(&now, &tm_buf);
      strftime(tmstamp, sizeof(tmstamp), "%Y-%m-%d %H:%M:%S ", &tm_buf);
      fputs(tmstamp, stream);
    }
    fputs(line.c_str(), stream);
    fflush(stream);
    if (is_syslog_level && sp_sink->is_syslogging) {
      syslog(LOG_ERR, "%s: %s", level_to_str(level), msg.c_str());
    }
  }

  void log_context::log(LOGGING_LEVEL level, const char * const fmt, ...) const {
    if (!is_enabled(level)) {
      return;
    }

    va_list ap;
    va_start(ap, fmt);
    vlog(level, fmt, ap);
    va_end(ap);
  }

  void log_context::logm(LOGGING_LEVEL level, const char * const msg) const {
    log(level, "%s", msg);
  }
}
