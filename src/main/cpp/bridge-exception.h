/* bridge-exception.h

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
#ifndef __BRIDGE_EXCEPTION_H__
#define __BRIDGE_EXCEPTION_H__

#include <exception>
#include <memory>
#include <string>
#include <typeinfo>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wreorder"
class bridge_exception : public std::exception {
protected:
  virtual void make_abstract() = 0;
protected:
  static void free_nm(char *p);
  std::unique_ptr<char, decltype(&free_nm)> _nm{ nullptr, &free_nm };
  std::string _msg;
  char* type_name(const char * const mangled_name);
  explicit bridge_exception(const char * const mangled_type_name, const char * const msg)
    : _msg{ msg } { _nm.reset(type_name(mangled_type_name)); }
  explicit bridge_exception(const char * const mangled_type_name, std::string &msg)
    : _msg{ std::move(msg) } { _nm.reset(type_name(mangled_type_name)); }
  bridge_exception() = default;
public:
  bridge_exception(const char * const msg) = delete;
  bridge_exception(std::string &&) = delete;
  bridge_exception(const std::string &) = delete;
  bridge_exception(std::string &) = delete;
  bridge_exception(const bridge_exception &) = delete;
  bridge_exception& operator=(const bridge_exception &) = delete;
  bridge_exception(bridge_exception &&) = delete;
  bridge_exception& operator=(bridge_exception &&) = delete;
  ~bridge_exception() override = default;
public:
  virtual const char* name() const throw()  { return _nm ? _nm.get() : "bridge_exception"; }
  const char* what() const throw() override { return _msg.c_str(); }
};
#pragma GCC diagnostic pop

#define DECL_EXCEPTION(x) \
class x##_exception : public bridge_exception {\
protected:\
  void make_abstract() override {}\
public:\
  x##_exception() = delete;\
  explicit x##_exception(const char * const msg) : bridge_exception{ typeid(x##_exception).name(), msg } {}\
  explicit x##_exception(std::string &&msg) : bridge_exception{ typeid(x##_exception).name(), msg } {}\
  x##_exception(const std::string &) = delete;\
  x##_exception(std::string &) = delete;\
  x##_exception(const x##_exception &) = delete;\
  x##_exception& operator=(const x##_exception &) = delete;\
  x##_exception(x##_exception &&ex) noexcept : bridge_exception() { this->operator=(std::move(ex)); }\
  x##_exception& operator=(x##_exception &&ex) noexcept {\
    this->_nm  = std::move(ex._nm);\
    this->_msg = std::move(ex._msg);\
    return *this;\
  }\
  ~x##_exception() override = default;\
};

std::string get_unmangled_name(const char * const mangled_name);

#endif // __BRIDGE_EXCEPTION_H__
