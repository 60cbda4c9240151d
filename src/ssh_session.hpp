#pragma once

#include <asio.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

class Logger;

struct SshOptions {
  std::string host;
  std::uint16_t port = 22;
  std::string user;
  std::string identity_file;
  std::string known_hosts;
  bool strict_host_keys = false;
  std::chrono::seconds timeout{30};
};

// Reads stdout (stream 0) and stderr of a non-blocking channel in turns until
// the peer signals EOF and both streams are empty, so a command flooding one
// stream cannot stall on a full window while the other is being read.
// read(stream, buffer, capacity) returns the bytes read, 0 at end of stream or
// a negative value when nothing is available yet; wait() blocks until the
// transport can make progress.
template<typename Read, typename AtEof, typename Wait>
void drain_channel_streams(Read&& read, AtEof&& at_eof, Wait&& wait,
                           std::string& out, std::string& err) {
  std::vector<char> buffer(16384);
  auto pump = [&](int stream_id, std::string& dest){
    bool got_data = false;
    while(true) {
      const auto n = read(stream_id, buffer.data(), buffer.size());
      if(n <= 0) break;
      dest.append(buffer.data(), static_cast<std::size_t>(n));
      got_data = true;
    }
    return got_data;
  };

  while(true) {
    const bool got_out = pump(0, out);
    const bool got_err = pump(SSH_EXTENDED_DATA_STDERR, err);
    if(got_out || got_err) continue;
    if(at_eof()) break;
    wait();
  }
}

// Falls back to $USER / $LOGNAME when the endpoint names no user.
std::string effective_ssh_user(const std::string& user);

// One authenticated SSH connection: an asio TCP socket carrying a blocking
// libssh2 session. The constructor connects, verifies the host key and
// authenticates; every failure throws TransferError with libssh2's reason.
// A session is used by a single thread at a time.
class SshSession {
public:
  explicit SshSession(const SshOptions& options, Logger* logger = nullptr);
  ~SshSession();

  SshSession(const SshSession&) = delete;
  SshSession& operator=(const SshSession&) = delete;

  // SFTP subsystem, started on first use.
  LIBSSH2_SFTP* sftp();

  struct ExecResult {
    int exit_status = -1;
    std::string out;
    std::string err;
  };
  // Runs a shell command on an exec channel and waits for it to exit.
  ExecResult exec(const std::string& command);

  std::string last_error() const;
  [[noreturn]] void fail(const std::string& what) const;
  std::string describe() const;

private:
  void connect_socket();
  void handshake();
  void verify_host_key();
  void authenticate();
  bool try_identity_file(const std::string& path);
  bool try_agent();
  // Non-blocking helpers for exec(): wait until libssh2 can make progress.
  void wait_socket();
  void read_exec_output(LIBSSH2_CHANNEL* channel, ExecResult& result);

  SshOptions options_;
  std::string user_;
  Logger* logger_;
  asio::io_context io_;
  asio::ip::tcp::socket socket_;
  LIBSSH2_SESSION* session_ = nullptr;
  LIBSSH2_SFTP* sftp_ = nullptr;
};
