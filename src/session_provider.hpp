#pragma once
/*
 * SessionProvider
 *
 * Purpose: keep a surface's process alive while its window is hidden by
 * running it inside a detachable session (tmux, abduco).
 * Design: provider turns (session id, command) into a create-or-attach shell
 * command; probes run through ICommandRunner so tests never spawn binaries.
 */
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include "status.hpp"

class ICommandRunner {
public:
  virtual ~ICommandRunner() = default;
  // false when the command could not be run at all (missing binary, killed)
  virtual bool run(const std::vector<std::string>& argv, int& exit_code, std::string& msg) = 0;
};

// posix_spawnp + waitpid, output discarded
class PosixCommandRunner : public ICommandRunner {
public:
  bool run(const std::vector<std::string>& argv, int& exit_code, std::string& msg) override;
};

class ISessionProvider {
public:
  virtual ~ISessionProvider() = default;
  virtual std::string_view name() const = 0;
  virtual Status create_or_attach(const std::string& session_id, const std::string& command, std::string& resolved) = 0;
  virtual Status kill_session(const std::string& session_id) = 0;
};

class TmuxSessionProvider : public ISessionProvider {
public:
  explicit TmuxSessionProvider(ICommandRunner& runner, std::string binary = "tmux");
  std::string_view name() const override { return "tmux"; }
  Status create_or_attach(const std::string& session_id, const std::string& command, std::string& resolved) override;
  Status kill_session(const std::string& session_id) override;
  Status session_exists(const std::string& session_id, bool& exists);
private:
  ICommandRunner& runner_;
  std::string binary_;
};

// no probe: `abduco -A` attaches or creates atomically
class AbducoSessionProvider : public ISessionProvider {
public:
  explicit AbducoSessionProvider(std::string exit_key = "^Q", std::string binary = "abduco");
  std::string_view name() const override { return "abduco"; }
  Status create_or_attach(const std::string& session_id, const std::string& command, std::string& resolved) override;
  Status kill_session(const std::string& session_id) override;
private:
  std::string exit_key_;
  std::string binary_;
};

class SessionProviderRegistry {
public:
  void register_provider(std::unique_ptr<ISessionProvider> p);
  ISessionProvider* find(std::string_view name) const;
  std::vector<std::string> names() const;
private:
  std::vector<std::unique_ptr<ISessionProvider>> providers_;
};

// tmux + abduco wired to `runner`
void register_default_providers(SessionProviderRegistry& reg, ICommandRunner& runner);

std::string session_id_for(const std::string& prefix, const std::string& surface_name);
std::string shell_quote(std::string_view s);
