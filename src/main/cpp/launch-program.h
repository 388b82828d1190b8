/* launch-program.h

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
#ifndef __LAUNCH_PROGRAM_H__
#define __LAUNCH_PROGRAM_H__

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <sys/types.h>
#include <unistd.h>
#include "bridge-exception.h"

DECL_EXCEPTION(find_program_path)
DECL_EXCEPTION(spawn_child)

namespace launch_program {
  extern const char* const PATH_NOT_EXIST_MSG;

  std::string find_program_path(const char * const prog, const char * const path_var_name);

  // RAII-related declarations for managing file/pipe descriptors (to clean these up if exception thrown)
  struct fd_wrapper_t {
    int fd;
    explicit fd_wrapper_t(int fd) : fd{fd} {}
  };
  using fd_wrapper_cleanup_t = void(*)(fd_wrapper_t *);
  using fd_wrapper_sp_t = std::unique_ptr<fd_wrapper_t, fd_wrapper_cleanup_t>;
  void fd_cleanup_with_delete(fd_wrapper_t *);
  inline fd_wrapper_sp_t make_fd_wrapper(int fd) { return fd_wrapper_sp_t{ new fd_wrapper_t{fd}, &fd_cleanup_with_delete }; }

  using env_vars_t = std::vector<std::pair<std::string, std::string>>;

  // the calling process environment with the given variables added (or overriding existing ones)
  std::vector<std::string> make_child_environment(const env_vars_t &additional_vars);

  struct child_process_t {
    pid_t pid{-1};
    fd_wrapper_sp_t sp_stdin_fd{ nullptr, &fd_cleanup_with_delete };  // write end of the child's stdin
    fd_wrapper_sp_t sp_stdout_fd{ nullptr, &fd_cleanup_with_delete }; // read end of the child's stdout
    fd_wrapper_sp_t sp_stderr_fd{ nullptr, &fd_cleanup_with_delete }; // read end of the child's stderr
  };

  /**
   * Forks and execs prog_path with argv (argv[0] included) and the supplied environment.
   * The child's three standard streams are connected to pipes held by the returned
   * child_process_t; the stdout/stderr read ends are set to non-blocking mode.
   *
   * Throws spawn_child_exception when pipe creation or fork fails, or when exec fails
   * in the child (reported back through a close-on-exec status pipe).
   */
  child_process_t spawn_child(const std::string &prog_path, const std::vector<std::string> &argv,
                              const std::vector<std::string> &envp);

  // sends SIGTERM; false if the process no longer exists
  bool terminate_child(pid_t pid);

  // blocks until the child exits; returns its exit status, or 128 + signal number
  // when it was killed by a signal. on_interrupt is invoked each time the wait is
  // interrupted by a signal before waiting resumes.
  int wait_child(pid_t pid, const std::function<void()> &on_interrupt = nullptr);
}

#endif //__LAUNCH_PROGRAM_H__
