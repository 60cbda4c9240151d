#include "ssh_session.hpp"

#include <cstdlib>
#include <filesystem>
#include <memory>
#include <mutex>
#include <vector>

#include "errors.hpp"
#include "log.hpp"

namespace {

std::once_flag g_libssh2_once;
int g_libssh2_init_rc = 0;

void ensure_libssh2() {
  std::call_once(g_libssh2_once, []{
    g_libssh2_init_rc = libssh2_init(0);
  });
  if(g_libssh2_init_rc != 0) {
    throw TransferError("libssh2 initialisation failed");
  }
}

std::string home_directory() {
  if(const char* home = std::getenv("HOME")) return home;
  return {};
}

int known_host_key_type(int hostkey_type) {
  switch(hostkey_type) {
    case LIBSSH2_HOSTKEY_TYPE_RSA: return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
    case LIBSSH2_HOSTKEY_TYPE_DSS: return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
    case LIBSSH2_HOSTKEY_TYPE_ED25519: return LIBSSH2_KNOWNHOST_KEY_ED25519;
    default: return LIBSSH2_KNOWNHOST_KEY_UNKNOWN;
  }
}

const char* kDefaultIdentities[] = {"id_ed25519", "id_rsa", "id_ecdsa"};

} // namespace

std::string effective_ssh_user(const std::string& user) {
  if(!user.empty()) return user;
  for(const char* name : {"USER", "LOGNAME"}) {
    const char* value = std::getenv(name);
    if(value && *value) return value;
  }
  return {};
}

SshSession::SshSession(const SshOptions& options, Logger* logger)
  : options_(options),
    user_(effective_ssh_user(options.user)),
    logger_(logger),
    socket_(io_) {
  ensure_libssh2();
  if(user_.empty()) {
    throw TransferError("No remote user given for " + options_.host + " and $USER is not set");
  }
  try {
    connect_socket();
    handshake();
    verify_host_key();
    authenticate();
  } catch(...) {
    if(session_) {
      libssh2_session_free(session_);
      session_ = nullptr;
    }
    throw;
  }
  log_debug(logger_, "SSH session established to {}", describe());
}

SshSession::~SshSession() {
  if(sftp_) {
    if(libssh2_sftp_shutdown(sftp_) != 0) {
      log_debug(logger_, "SFTP shutdown on {} failed: {}", describe(), last_error());
    }
    sftp_ = nullptr;
  }
  if(session_) {
    if(libssh2_session_disconnect(session_, "zap done") != 0) {
      log_debug(logger_, "SSH disconnect from {} failed: {}", describe(), last_error());
    }
    libssh2_session_free(session_);
    session_ = nullptr;
  }
  asio::error_code ignored;
  socket_.close(ignored);
}

std::string SshSession::describe() const {
  return user_ + "@" + options_.host + ":" + std::to_string(options_.port);
}

std::string SshSession::last_error() const {
  if(!session_) return "no session";
  char* message = nullptr;
  int length = 0;
  libssh2_session_last_error(session_, &message, &length, 0);
  if(!message || length <= 0) return "unknown error";
  return std::string(message, static_cast<std::size_t>(length));
}

void SshSession::fail(const std::string& what) const {
  throw TransferError(describe() + ": " + what + ": " + last_error());
}

void SshSession::connect_socket() {
  asio::error_code ec;
  asio::ip::tcp::resolver resolver(io_);
  auto endpoints = resolver.resolve(options_.host, std::to_string(options_.port), ec);
  if(ec) {
    throw TransferError("Cannot resolve " + options_.host + ": " + ec.message());
  }

  asio::error_code connect_ec = asio::error::would_block;
  asio::async_connect(socket_, endpoints,
                      [&connect_ec](const asio::error_code& error, const asio::ip::tcp::endpoint&){
                        connect_ec = error;
                      });
  io_.run_for(options_.timeout);
  if(connect_ec == asio::error::would_block) {
    socket_.close(ec);
    throw TransferError("Connection to " + describe() + " timed out");
  }
  if(connect_ec) {
    throw TransferError("Connection to " + describe() + " failed: " + connect_ec.message());
  }
  socket_.set_option(asio::ip::tcp::no_delay(true), ec);
  if(ec) {
    log_debug(logger_, "TCP_NODELAY not applied on {}: {}", describe(), ec.message());
  }
}

void SshSession::handshake() {
  session_ = libssh2_session_init();
  if(!session_) {
    throw TransferError("Cannot allocate SSH session for " + describe());
  }
  libssh2_session_set_blocking(session_, 1);
  libssh2_session_set_timeout(session_, static_cast<long>(options_.timeout.count() * 1000));
  if(libssh2_session_handshake(session_, socket_.native_handle()) != 0) {
    fail("SSH handshake failed");
  }
}

void SshSession::verify_host_key() {
  std::size_t key_length = 0;
  int key_type = LIBSSH2_HOSTKEY_TYPE_UNKNOWN;
  const char* key = libssh2_session_hostkey(session_, &key_length, &key_type);
  if(!key) {
    fail("Server sent no host key");
  }

  std::string path = options_.known_hosts;
  if(path.empty()) {
    auto home = home_directory();
    if(!home.empty()) path = home + "/.ssh/known_hosts";
  }

  LIBSSH2_KNOWNHOSTS* hosts = libssh2_knownhost_init(session_);
  if(!hosts) {
    fail("Cannot initialise known_hosts store");
  }
  int check = LIBSSH2_KNOWNHOST_CHECK_NOTFOUND;
  if(!path.empty() && libssh2_knownhost_readfile(hosts, path.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0) {
    const int type_mask = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | known_host_key_type(key_type);
    check = libssh2_knownhost_checkp(hosts, options_.host.c_str(), options_.port,
                                     key, key_length, type_mask, nullptr);
  } else {
    log_debug(logger_, "known_hosts file '{}' not readable", path);
  }
  libssh2_knownhost_free(hosts);

  switch(check) {
    case LIBSSH2_KNOWNHOST_CHECK_MATCH:
      return;
    case LIBSSH2_KNOWNHOST_CHECK_MISMATCH:
      throw TransferError("Host key for " + options_.host + " does not match " + path);
    case LIBSSH2_KNOWNHOST_CHECK_NOTFOUND:
      if(options_.strict_host_keys) {
        throw TransferError("Host " + options_.host + " is not in " + path + " (strict host key checking)");
      }
      log_debug(logger_, "Host {} is not in known_hosts; continuing", options_.host);
      return;
    default:
      fail("Host key check failed");
  }
}

bool SshSession::try_identity_file(const std::string& path) {
  int rc = libssh2_userauth_publickey_fromfile(session_, user_.c_str(), nullptr, path.c_str(), nullptr);
  if(rc == 0) {
    log_debug(logger_, "Authenticated {} with {}", describe(), path);
    return true;
  }
  log_debug(logger_, "Key {} rejected: {}", path, last_error());
  return false;
}

bool SshSession::try_agent() {
  LIBSSH2_AGENT* agent = libssh2_agent_init(session_);
  if(!agent) return false;
  bool authenticated = false;
  if(libssh2_agent_connect(agent) == 0) {
    if(libssh2_agent_list_identities(agent) == 0) {
      libssh2_agent_publickey* identity = nullptr;
      libssh2_agent_publickey* previous = nullptr;
      while(libssh2_agent_get_identity(agent, &identity, previous) == 0) {
        if(libssh2_agent_userauth(agent, user_.c_str(), identity) == 0) {
          authenticated = true;
          break;
        }
        previous = identity;
      }
    }
    if(libssh2_agent_disconnect(agent) != 0) {
      log_debug(logger_, "ssh-agent disconnect failed: {}", last_error());
    }
  }
  libssh2_agent_free(agent);
  if(authenticated) {
    log_debug(logger_, "Authenticated {} with ssh-agent", describe());
  }
  return authenticated;
}

void SshSession::authenticate() {
  if(!options_.identity_file.empty() && try_identity_file(options_.identity_file)) {
    return;
  }
  auto home = home_directory();
  if(!home.empty()) {
    for(const char* name : kDefaultIdentities) {
      std::string candidate = home + "/.ssh/" + name;
      std::error_code ec;
      if(candidate == options_.identity_file || !std::filesystem::is_regular_file(candidate, ec)) {
        continue;
      }
      if(try_identity_file(candidate)) return;
    }
  }
  if(try_agent()) return;
  fail("Authentication failed (tried identity file, default keys and ssh-agent)");
}

LIBSSH2_SFTP* SshSession::sftp() {
  if(!sftp_) {
    sftp_ = libssh2_sftp_init(session_);
    if(!sftp_) {
      fail("Cannot start SFTP subsystem");
    }
  }
  return sftp_;
}

void SshSession::wait_socket() {
  const int directions = libssh2_session_block_directions(session_);
  asio::error_code wait_ec = asio::error::would_block;
  auto on_ready = [&wait_ec](const asio::error_code& error){ wait_ec = error; };
  if(directions & LIBSSH2_SESSION_BLOCK_OUTBOUND) {
    socket_.async_wait(asio::ip::tcp::socket::wait_write, on_ready);
  } else {
    socket_.async_wait(asio::ip::tcp::socket::wait_read, on_ready);
  }
  io_.restart();
  io_.run_for(options_.timeout);
  if(wait_ec == asio::error::would_block) {
    asio::error_code ignored;
    socket_.cancel(ignored);
    io_.restart();
    io_.run();
    throw TransferError("Timed out waiting for " + describe());
  }
  if(wait_ec) {
    throw TransferError("Socket wait on " + describe() + " failed: " + wait_ec.message());
  }
}

void SshSession::read_exec_output(LIBSSH2_CHANNEL* channel, ExecResult& result) {
  libssh2_session_set_blocking(session_, 0);
  struct RestoreBlocking {
    LIBSSH2_SESSION* session;
    ~RestoreBlocking() { libssh2_session_set_blocking(session, 1); }
  } restore{session_};

  drain_channel_streams(
    [&](int stream_id, char* buffer, std::size_t capacity){
      ssize_t n = libssh2_channel_read_ex(channel, stream_id, buffer, capacity);
      if(n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
        fail("Reading remote command output failed");
      }
      return n;
    },
    [&]{ return libssh2_channel_eof(channel) != 0; },
    [&]{ wait_socket(); },
    result.out,
    result.err);
}

SshSession::ExecResult SshSession::exec(const std::string& command) {
  LIBSSH2_CHANNEL* channel = libssh2_channel_open_session(session_);
  if(!channel) {
    fail("Cannot open exec channel");
  }
  std::unique_ptr<LIBSSH2_CHANNEL, int(*)(LIBSSH2_CHANNEL*)> guard(channel, &libssh2_channel_free);

  if(libssh2_channel_exec(channel, command.c_str()) != 0) {
    fail("Remote exec failed");
  }

  ExecResult result;
  read_exec_output(channel, result);

  if(libssh2_channel_close(channel) != 0 || libssh2_channel_wait_closed(channel) != 0) {
    log_debug(logger_, "Exec channel on {} did not close cleanly: {}", describe(), last_error());
  }
  result.exit_status = libssh2_channel_get_exit_status(channel);
  log_debug(logger_, "{} ran '{}' -> {}", describe(), command, result.exit_status);
  return result;
}
