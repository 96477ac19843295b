#pragma once
/*
 * PtyProcess
 *
 * Purpose: one `/bin/sh -c <command>` child on a pseudo-terminal.
 * Output: read non-blocking, escape sequences dropped, appended as lines of
 * plain text (scrollback capped by the caller).
 * Lifetime: the destructor hangs up the child; reap() collects its status.
 */
#include <sys/types.h>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include "iterminal.hpp"
#include "posix_fd.hpp"

class PtyProcess {
public:
  PtyProcess() = default;
  ~PtyProcess();
  PtyProcess(const PtyProcess&) = delete;
  PtyProcess& operator=(const PtyProcess&) = delete;

  bool spawn(const std::string& command, TermSize size, std::string& msg);
  pid_t pid() const { return pid_; }
  int fd() const { return master_.get(); }

  // drain readable output into lines; returns the number of bytes read
  std::size_t pump(std::vector<std::string>& lines, std::size_t max_lines);
  bool write_all(std::string_view bytes);
  void resize(TermSize size);
  void hangup();
  // non-blocking; true with the decoded exit code once the child is gone
  bool reap(int& exit_code);

private:
  enum class Esc { None, Start, Csi, Osc, OscEsc };
  void feed(char ch, std::vector<std::string>& lines);

  UniqueFd master_;
  pid_t pid_ = -1;
  bool reaped_ = false;
  Esc esc_ = Esc::None;
};
