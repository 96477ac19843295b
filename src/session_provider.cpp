#include "session_provider.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

bool PosixCommandRunner::run(const std::vector<std::string>& argv, int& exit_code, std::string& msg) {
  if (argv.empty()) { msg = "empty command"; return false; }
  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
  args.push_back(nullptr);

  posix_spawn_file_actions_t fa;
  posix_spawn_file_actions_init(&fa);
  posix_spawn_file_actions_addopen(&fa, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
  posix_spawn_file_actions_addopen(&fa, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
  posix_spawn_file_actions_addopen(&fa, STDERR_FILENO, "/dev/null", O_WRONLY, 0);
  pid_t pid = -1;
  int rc = ::posix_spawnp(&pid, args[0], &fa, nullptr, args.data(), environ);
  posix_spawn_file_actions_destroy(&fa);
  if (rc != 0) { msg = "can not run " + argv[0] + ": " + std::strerror(rc); return false; }

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) { msg = "waitpid failed for " + argv[0] + ": " + std::strerror(errno); return false; }
  }
  if (WIFSIGNALED(status)) { msg = argv[0] + " killed by signal " + std::to_string(WTERMSIG(status)); return false; }
  exit_code = WEXITSTATUS(status);
  // the shell convention for "command not found" when spawned through a wrapper
  if (exit_code == 127) { msg = argv[0] + ": command not found"; return false; }
  return true;
}

std::string shell_quote(std::string_view s) {
  std::string out = "'";
  for (char c : s) {
    if (c == '\'') out += "'\\''";
    else out += c;
  }
  out += "'";
  return out;
}

std::string session_id_for(const std::string& prefix, const std::string& surface_name) {
  std::string id = prefix + surface_name;
  // tmux treats '.' and ':' as target separators
  for (char& c : id) if (c == '.' || c == ':' || c == ' ') c = '_';
  return id;
}

TmuxSessionProvider::TmuxSessionProvider(ICommandRunner& runner, std::string binary)
  : runner_(runner), binary_(std::move(binary)) {}

Status TmuxSessionProvider::session_exists(const std::string& session_id, bool& exists) {
  int code = 0;
  std::string m;
  if (!runner_.run({binary_, "has-session", "-t", session_id}, code, m)) {
    return Status::error(ErrorCode::SessionBackendUnavailable, "tmux probe: " + m);
  }
  if (code != 0 && code != 1) {
    return Status::error(ErrorCode::SessionBackendUnavailable, "tmux has-session exited with " + std::to_string(code));
  }
  exists = code == 0;
  return Status::ok();
}

Status TmuxSessionProvider::create_or_attach(const std::string& session_id, const std::string& command, std::string& resolved) {
  bool exists = false;
  if (Status st = session_exists(session_id, exists); !st) return st;
  if (exists) {
    resolved = binary_ + " attach -t " + shell_quote(session_id);
    return Status::ok();
  }
  resolved = binary_ + " new-session -s " + shell_quote(session_id);
  if (!command.empty()) resolved += " " + shell_quote(command);
  return Status::ok();
}

Status TmuxSessionProvider::kill_session(const std::string& session_id) {
  int code = 0;
  std::string m;
  if (!runner_.run({binary_, "kill-session", "-t", session_id}, code, m)) {
    return Status::error(ErrorCode::SessionBackendUnavailable, "tmux kill-session: " + m);
  }
  if (code != 0) {
    return Status::error(ErrorCode::SessionBackendUnavailable, "no tmux session " + session_id);
  }
  return Status::ok();
}

AbducoSessionProvider::AbducoSessionProvider(std::string exit_key, std::string binary)
  : exit_key_(std::move(exit_key)), binary_(std::move(binary)) {}

Status AbducoSessionProvider::create_or_attach(const std::string& session_id, const std::string& command, std::string& resolved) {
  resolved = binary_ + " -e " + shell_quote(exit_key_) + " -A " + shell_quote(session_id);
  if (!command.empty()) resolved += " " + shell_quote(command);
  return Status::ok();
}

Status AbducoSessionProvider::kill_session(const std::string& session_id) {
  return Status::error(ErrorCode::SessionBackendUnavailable, "abduco sessions end with their process (" + session_id + ")");
}

void SessionProviderRegistry::register_provider(std::unique_ptr<ISessionProvider> p) {
  for (auto& existing : providers_) {
    if (existing->name() == p->name()) { existing = std::move(p); return; }
  }
  providers_.push_back(std::move(p));
}

ISessionProvider* SessionProviderRegistry::find(std::string_view name) const {
  for (const auto& p : providers_) if (p->name() == name) return p.get();
  return nullptr;
}

std::vector<std::string> SessionProviderRegistry::names() const {
  std::vector<std::string> out;
  for (const auto& p : providers_) out.emplace_back(p->name());
  return out;
}

void register_default_providers(SessionProviderRegistry& reg, ICommandRunner& runner) {
  reg.register_provider(std::make_unique<TmuxSessionProvider>(runner));
  reg.register_provider(std::make_unique<AbducoSessionProvider>());
}
