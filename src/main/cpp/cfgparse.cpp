/* cfgparse.cpp

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
#include <sys/types.h>
#include <sys/stat.h>
#include <list>
#include <sstream>
#include <string>
#include <ini.h>
#include "format2str.h"
#include "cfgparse.h"

static const char config_file_parse_err_fmt[] = "config file parsing error in [%s] '%s = %s'\n";
static const char config_file_line_err_fmt[]  = "config file parsing error at line %d\n";
static const char config_file_load_err_fmt[]  = "can't load \"%s\"\n";

namespace {
  struct parse_ctx {
    const cfg_parse_handler_t &handler;
    std::list<std::string> &err_list;
  };
}

static int ini_handler_trampoline(void *user, const char *section, const char *name, const char *value) {
  auto const ctx = static_cast<parse_ctx*>(user);
  const int rtn = ctx->handler(section, name, value);
  if (rtn == 0) {
    ctx->err_list.emplace_back(format2str(config_file_parse_err_fmt, section, name, value));
  }
  return rtn;
}

bool process_config(const char * const cfg_file_path, const cfg_parse_handler_t &handler) {
  // check to see if specified config file exist
  struct stat statbuf{};
  if (stat(cfg_file_path, &statbuf) == -1 || (statbuf.st_mode & S_IFMT) != S_IFREG) {
    return false;
  }

  std::list<std::string> err_list;
  parse_ctx ctx{handler, err_list};

  const int rc = ini_parse(cfg_file_path, &ini_handler_trampoline, &ctx);
  if (rc < 0) {
    err_list.emplace_front(format2str(config_file_load_err_fmt, cfg_file_path));
  } else if (rc > 0 && err_list.empty()) {
    // syntax error detected by the parser itself (handler accepted everything it was given)
    err_list.emplace_back(format2str(config_file_line_err_fmt, rc));
  }

  if (!err_list.empty()) {
    std::stringstream ss;
    for(std::list<std::string>::iterator list_iter = err_list.begin(); list_iter != err_list.end(); list_iter++)
    {
      ss << *list_iter;
    }
    err_list.clear();
    throw process_cfg_exception(ss.str());
  }

  return true;
}
