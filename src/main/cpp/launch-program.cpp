/* launch-program.cpp

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
#include <csignal>
#include <memory>
#include <tuple>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
#include "format2str.h"
#include "launch-program.h"

extern char **environ;

enum PIPES : short { READ = 0, WRITE = 1 };

namespace launch_program {

  const char* const PATH_NOT_EXIST_MSG = "The specified sclang path does not exist";

  static std::string get_env_var(const char * const name) {
    char * const val = getenv(name);
    auto rtn_str( val != nullptr ? std::string(val) : std::string() );
    return rtn_str;
  }

  static bool is_program_file(const char * const path) {
    struct stat statbuf{};
    return stat(path, &statbuf) != -1 && ((statbuf.st_mode & S_IFMT) == S_IFREG ||
                                          (statbuf.st_mode & S_IFMT) == S_IFLNK);
  }

  std::string find_program_path(const char * const prog, const char * const path_var_name) {
    if (prog == nullptr || *prog == '\0') {
      throw find_program_path_exception(format2str("no program specified: %s", PATH_NOT_EXIST_MSG));
    }

    if (strchr(prog, '/') != nullptr) {
      // verify that the specified program path exist and is a file or symbolic link
      if (!is_program_file(prog)) {
        const auto err_no = errno;
        const char err_msg_fmt[] = "program path '%s' invalid (%s): %s";
        throw find_program_path_exception(format2str(err_msg_fmt, prog, strerror(err_no), PATH_NOT_EXIST_MSG));
      }
      return std::string(prog);
    }

    const std::string path_env_var( get_env_var(path_var_name) );

    if (path_env_var.empty()) {
      const char * const err_msg_fmt = "there is no %s environment variable defined to locate '%s': %s";
      throw find_program_path_exception(format2str(err_msg_fmt, path_var_name, prog, PATH_NOT_EXIST_MSG));
    }

    std::unique_ptr<char, decltype(&free)> path_env_var_dup{ strdup(path_env_var.c_str()), &free };

    static const char * const delim = ":";
    char *save = nullptr;
    const char * path = strtok_r(path_env_var_dup.get(), delim, &save);

    while(path != nullptr) {
      const auto len = strlen(path);
      const char end_char = path[len - 1];
      const char * const fmt = end_char == '/' ? "%s%s" : "%s/%s";
      auto full_path( format2str(fmt, path, prog) );
      // check to see if program file path exist
      if (is_program_file(full_path.c_str()) && access(full_path.c_str(), X_OK) == 0) {
        return full_path;
      }
      path = strtok_r(nullptr, delim, &save);
    }

    const char * const err_msg_fmt = "could not locate program '%s' via %s environment variable: %s";
    throw find_program_path_exception(format2str(err_msg_fmt, prog, path_var_name, PATH_NOT_EXIST_MSG));
  }

  void fd_cleanup_with_delete(fd_wrapper_t *p) {
    if (p != nullptr && p->fd != -1) {
      close(p->fd);
      p->fd = -1;
    }
    delete p;
  }

  std::vector<std::string> make_child_environment(const env_vars_t &additional_vars) {
    std::vector<std::string> envp{};
    for (char **env = environ; env != nullptr && *env != nullptr; env++) {
      const char * const entry = *env;
      const char * const eq = strchr(entry, '=');
      const size_t name_len = eq != nullptr ? (size_t) (eq - entry) : strlen(entry);
      bool is_overridden = false;
      for (auto const &var : additional_vars) {
        if (var.first.size() == name_len && var.first.compare(0, name_len, entry, name_len) == 0) {
          is_overridden = true;
          break;
        }
      }
      if (!is_overridden) {
        envp.emplace_back(entry);
      }
    }
    for (auto const &var : additional_vars) {
      envp.emplace_back(var.first + "=" + var.second);
    }
    return envp;
  }

  static std::tuple<fd_wrapper_sp_t, fd_wrapper_sp_t> make_anon_pipe(int flags) {
    int pipes[2] { -1, -1 };
    int line_nbr = __LINE__ + 1;
    if (pipe2(pipes, flags) == -1) {
      const char err_msg_fmt[] = "%d: %s() -> pipe2(): failed creating pipe file descriptor pair: %s";
      throw spawn_child_exception{ format2str(err_msg_fmt, line_nbr, __FUNCTION__, strerror(errno)) };
    }
    return std::make_tuple(make_fd_wrapper(pipes[PIPES::READ]), make_fd_wrapper(pipes[PIPES::WRITE]));
  }

  static void set_non_blocking(int fd) {
    const auto flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
      throw spawn_child_exception{ format2str("fcntl(fd{%d}, O_NONBLOCK) failed: %s", fd, strerror(errno)) };
    }
  }

  // runs in the forked child - only async-signal-safe calls from here on
  [[noreturn]] static void exec_child(const char *const prog_path, char *const *argv, char *const *envp,
                                      int stdin_fd, int stdout_fd, int stderr_fd, int status_fd)
  {
    // restore default dispositions that the parent may have altered
    signal(SIGPIPE, SIG_DFL);
    signal(SIGINT, SIG_DFL);
    signal(SIGTERM, SIG_DFL);

    if (dup2(stdin_fd, STDIN_FILENO) == -1 || dup2(stdout_fd, STDOUT_FILENO) == -1 ||
        dup2(stderr_fd, STDERR_FILENO) == -1)
    {
      const int err_no = errno;
      while (write(status_fd, &err_no, sizeof(err_no)) == -1 && errno == EINTR) ;
      _exit(127);
    }

    execve(prog_path, argv, envp);

    const int err_no = errno;
    while (write(status_fd, &err_no, sizeof(err_no)) == -1 && errno == EINTR) ;
    _exit(127);
  }

  child_process_t spawn_child(const std::string &prog_path, const std::vector<std::string> &argv,
                              const std::vector<std::string> &envp)
  {
    static const char* const func_name = __FUNCTION__;

    // the child's end of each pipe is inherited through dup2(); everything else is close-on-exec
    auto stdin_pipe  = make_anon_pipe(O_CLOEXEC);
    auto stdout_pipe = make_anon_pipe(O_CLOEXEC);
    auto stderr_pipe = make_anon_pipe(O_CLOEXEC);
    auto status_pipe = make_anon_pipe(O_CLOEXEC);

    // argv and envp arrays are built before fork() as the child may not allocate
    std::vector<char*> argv_ptrs{};
    argv_ptrs.reserve(argv.size() + 1);
    for (auto const &arg : argv) argv_ptrs.push_back(const_cast<char*>(arg.c_str()));
    argv_ptrs.push_back(nullptr);
    std::vector<char*> envp_ptrs{};
    envp_ptrs.reserve(envp.size() + 1);
    for (auto const &var : envp) envp_ptrs.push_back(const_cast<char*>(var.c_str()));
    envp_ptrs.push_back(nullptr);

    int line_nbr = __LINE__ + 1;
    const pid_t pid = fork();
    if (pid == -1) {
      const char err_msg_fmt[] = "%d: %s() -> fork() of '%s' failed: %s";
      throw spawn_child_exception(format2str(err_msg_fmt, line_nbr, func_name, prog_path.c_str(), strerror(errno)));
    }
    if (pid == 0) {
      // is child process
      exec_child(prog_path.c_str(), argv_ptrs.data(), envp_ptrs.data(),
                 std::get<PIPES::READ>(stdin_pipe)->fd, std::get<PIPES::WRITE>(stdout_pipe)->fd,
                 std::get<PIPES::WRITE>(stderr_pipe)->fd, std::get<PIPES::WRITE>(status_pipe)->fd);
    }

    // parent process: release the child's ends of the pipes
    std::get<PIPES::READ>(stdin_pipe).reset(nullptr);
    std::get<PIPES::WRITE>(stdout_pipe).reset(nullptr);
    std::get<PIPES::WRITE>(stderr_pipe).reset(nullptr);
    std::get<PIPES::WRITE>(status_pipe).reset(nullptr);

    // the status pipe reads EOF once exec() succeeds; otherwise it carries the child's errno
    int exec_errno = 0;
    ssize_t n;
    do {
      n = read(std::get<PIPES::READ>(status_pipe)->fd, &exec_errno, sizeof(exec_errno));
    } while (n == -1 && errno == EINTR);
    if (n == (ssize_t) sizeof(exec_errno)) {
      int status = 0;
      while (waitpid(pid, &status, 0) == -1 && errno == EINTR) ;
      const char err_msg_fmt[] = "exec of '%s' failed: %s";
      throw spawn_child_exception(format2str(err_msg_fmt, prog_path.c_str(), strerror(exec_errno)));
    }

    child_process_t child{};
    child.pid = pid;
    child.sp_stdin_fd = std::move(std::get<PIPES::WRITE>(stdin_pipe));
    child.sp_stdout_fd = std::move(std::get<PIPES::READ>(stdout_pipe));
    child.sp_stderr_fd = std::move(std::get<PIPES::READ>(stderr_pipe));
    set_non_blocking(child.sp_stdout_fd->fd);
    set_non_blocking(child.sp_stderr_fd->fd);
    return child;
  }

  bool terminate_child(pid_t pid) {
    if (pid <= 0) return false;
    return kill(pid, SIGTERM) == 0;
  }

  int wait_child(pid_t pid, const std::function<void()> &on_interrupt) {
    int status = 0;
    do {
      int line_nbr = __LINE__ + 1;
      if (waitpid(pid, &status, 0) == -1) {
        if (errno == EINTR) {
          if (on_interrupt) on_interrupt();
          continue;
        }
        const char err_msg_fmt[] = "%d: %s() -> waitpid(pid:%d): %s";
        throw spawn_child_exception(format2str(err_msg_fmt, line_nbr, __FUNCTION__, pid, strerror(errno)));
      }
    } while (!WIFEXITED(status) && !WIFSIGNALED(status));

    return WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
  }
}
