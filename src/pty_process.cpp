#include "pty_process.hpp"
#include <pty.h>
#include <signal.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>

PtyProcess::~PtyProcess() {
  hangup();
  int code = 0;
  (void)reap(code);
}

bool PtyProcess::spawn(const std::string& command, TermSize size, std::string& msg) {
  struct winsize ws{};
  ws.ws_row = static_cast<unsigned short>(size.rows > 0 ? size.rows : 1);
  ws.ws_col = static_cast<unsigned short>(size.cols > 0 ? size.cols : 1);
  int master = -1;
  pid_t pid = ::forkpty(&master, nullptr, nullptr, &ws);
  if (pid < 0) { msg = std::string("forkpty failed: ") + std::strerror(errno); return false; }
  if (pid == 0) {
    ::setenv("TERM", "dumb", 1);
    ::execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
    ::_exit(127);
  }
  master_.reset(master);
  pid_ = pid;
  reaped_ = false;
  if (!master_.set_nonblocking()) { msg = "can not make pty non-blocking"; return false; }
  return true;
}

void PtyProcess::feed(char ch, std::vector<std::string>& lines) {
  switch (esc_) {
    case Esc::Start:
      if (ch == '[') esc_ = Esc::Csi;
      else if (ch == ']') esc_ = Esc::Osc;
      else esc_ = Esc::None;
      return;
    case Esc::Csi:
      if (ch >= 0x40 && ch <= 0x7e) esc_ = Esc::None;
      return;
    case Esc::Osc:
      if (ch == '\a') esc_ = Esc::None;
      else if (ch == '\x1b') esc_ = Esc::OscEsc;
      return;
    case Esc::OscEsc:
      esc_ = Esc::None;
      return;
    case Esc::None:
      break;
  }
  if (lines.empty()) lines.emplace_back();
  switch (ch) {
    case '\x1b': esc_ = Esc::Start; break;
    case '\n': lines.emplace_back(); break;
    case '\r': break;
    case '\b': if (!lines.back().empty()) lines.back().pop_back(); break;
    case '\t': lines.back().append(8 - lines.back().size() % 8, ' '); break;
    default:
      if (static_cast<unsigned char>(ch) >= 32 && ch != 127) lines.back().push_back(ch);
  }
}

std::size_t PtyProcess::pump(std::vector<std::string>& lines, std::size_t max_lines) {
  if (!master_.valid()) return 0;
  std::size_t total = 0;
  char buf[4096];
  for (;;) {
    ssize_t n = ::read(master_.get(), buf, sizeof(buf));
    if (n > 0) {
      for (ssize_t i = 0; i < n; ++i) feed(buf[i], lines);
      total += static_cast<std::size_t>(n);
      continue;
    }
    if (n < 0 && (errno == EAGAIN || errno == EINTR)) break;
    // EOF, or EIO once the slave side is closed
    master_.reset();
    break;
  }
  if (lines.size() > max_lines) lines.erase(lines.begin(), lines.begin() + static_cast<long>(lines.size() - max_lines));
  return total;
}

bool PtyProcess::write_all(std::string_view bytes) {
  if (!master_.valid()) return false;
  while (!bytes.empty()) {
    ssize_t n = ::write(master_.get(), bytes.data(), bytes.size());
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      return false;
    }
    bytes.remove_prefix(static_cast<std::size_t>(n));
  }
  return true;
}

void PtyProcess::resize(TermSize size) {
  if (!master_.valid()) return;
  struct winsize ws{};
  ws.ws_row = static_cast<unsigned short>(size.rows > 0 ? size.rows : 1);
  ws.ws_col = static_cast<unsigned short>(size.cols > 0 ? size.cols : 1);
  (void)::ioctl(master_.get(), TIOCSWINSZ, &ws);
}

void PtyProcess::hangup() {
  if (pid_ > 0 && !reaped_) ::kill(pid_, SIGHUP);
  master_.reset();
}

bool PtyProcess::reap(int& exit_code) {
  if (pid_ <= 0 || reaped_) return false;
  int status = 0;
  pid_t r = ::waitpid(pid_, &status, WNOHANG);
  if (r != pid_) return false;
  reaped_ = true;
  if (WIFEXITED(status)) exit_code = WEXITSTATUS(status);
  else if (WIFSIGNALED(status)) exit_code = 128 + WTERMSIG(status);
  else exit_code = -1;
  return true;
}
