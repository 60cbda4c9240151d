#pragma once

#include <memory>
#include <mutex>
#include <utility>

#include "site.hpp"
#include "ssh_session.hpp"

// Site on the far side of an SSH connection. Every reader and writer opens its
// own session so each worker owns exactly one channel; metadata calls, assembly
// and hashing share one control session.
class RemoteSite : public Site {
public:
  explicit RemoteSite(SshOptions options, Logger* logger = nullptr);
  ~RemoteSite() override;

  FileStat stat(const std::string& path) override;
  std::unique_ptr<RangeReader> open_range(const std::string& path,
                                          std::uint64_t offset,
                                          std::uint64_t length) override;
  std::unique_ptr<ArtifactWriter> create_artifact(const std::string& path) override;
  void concatenate(const std::vector<std::string>& parts, const std::string& target) override;
  void rename(const std::string& from, const std::string& to) override;
  void remove(const std::string& path) override;
  std::string sha256(const std::string& path) override;
  std::string describe(const std::string& path) const override;
  void release_idle_connections() override;

private:
  // Runs a command on the control session; a non-zero exit raises
  // AssemblyError carrying the remote stderr.
  SshSession::ExecResult run_checked(const std::string& command, const std::string& what);
  SshSession& control();
  // Runs fn on the control session. A TransferError from a session that was
  // already open is taken as a dead connection: it is replaced and fn runs
  // once more. Caller holds control_mutex_.
  template<typename Fn>
  auto with_control(Fn&& fn) -> decltype(fn(std::declval<SshSession&>()));

  SshOptions options_;
  Logger* logger_;
  std::mutex control_mutex_;
  std::unique_ptr<SshSession> control_;
};
