/* log.h

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
#ifndef __LOG_H__
#define __LOG_H__

#include <cstdarg>
#include <cstdio>
#include <memory>
#include <string>

namespace logger {

  // logging levels
  enum class LOGGING_LEVEL : char {
    FATAL = 6,
    ERR = 5,
    WARN  = 4,
    INFO  = 3,
    DEBUG = 2,
    TRACE = 1
  };
  using LL = LOGGING_LEVEL;

  const LOGGING_LEVEL DEFAULT_LOGGING_LEVEL = LL::INFO;

  LOGGING_LEVEL str_to_level(const char *const logging_level);
  const char* level_to_str(LOGGING_LEVEL level);

  struct log_sink;

  // A logging context is created once at program start-up and handed to each
  // component at construction time. Copies (and contexts made via child())
  // share the same underlying sink, so level and destination changes apply
  // to all of them.
  //
  // NOTE: stdout is never used as a destination - it carries protocol traffic.
  class log_context final {
  private:
    std::shared_ptr<log_sink> sp_sink;
    std::string name;
    log_context(std::shared_ptr<log_sink> sink, std::string &&name);
  public:
    explicit log_context(const char *const progname, LOGGING_LEVEL level = DEFAULT_LOGGING_LEVEL);
    log_context(const log_context &) = default;
    log_context& operator=(const log_context &) = default;
    log_context(log_context &&) noexcept = default;
    log_context& operator=(log_context &&) noexcept = default;
    ~log_context() = default;

    // derives a context that tags its lines with "<this name>.<child_name>"
    log_context child(const char *const child_name) const;
    const std::string& get_name() const { return name; }

    LOGGING_LEVEL get_level() const;
    void set_level(LOGGING_LEVEL level);
    bool is_enabled(LOGGING_LEVEL level) const { return (char) level >= (char) get_level(); }
    bool is_trace_level() const { return get_level() == LL::TRACE; }

    // mirror ERR and FATAL lines to syslog (LOG_DAEMON facility)
    void set_syslogging(bool is_syslogging_enabled);
    // truncates/creates the log file and routes all output there (adds timestamps)
    void set_log_file(const char *const log_file_path);
    // routes all output to a caller owned stream; nullptr restores stderr
    void set_output(FILE *stream);

    void vlog(LOGGING_LEVEL level, const char * const fmt, va_list ap) const;
    void log(LOGGING_LEVEL level, const char * const fmt, ...) const __attribute__((format(printf, 3, 4)));
    void logm(LOGGING_LEVEL level, const char * const msg) const;
  };

}

#endif //__LOG_H__
