/* format2str.cpp

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
#include <vector>
#include "format2str.h"

std::string vformat2str(const char *const fmt, va_list ap) {
  char strbuf[256];
  va_list parm_copy;
  va_copy(parm_copy, ap);
  auto n = vsnprintf(strbuf, sizeof(strbuf), fmt, ap);
  if (n < 0) {
    va_end(parm_copy);
    return std::string();
  }
  if ((size_t) n < sizeof(strbuf)) {
    va_end(parm_copy);
    return std::string(strbuf, (size_t) n);
  }
  // didn't fit into the stack buffer so format a second time into a sized heap buffer
  std::vector<char> heapbuf((size_t) n + 1);
  n = vsnprintf(heapbuf.data(), heapbuf.size(), fmt, parm_copy);
  va_end(parm_copy);
  return n < 0 ? std::string() : std::string(heapbuf.data(), (size_t) n);
}

std::string format2str(const char *const fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  auto rslt( vformat2str(fmt, ap) );
  va_end(ap);
  return rslt;
}
