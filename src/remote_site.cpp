#include "remote_site.hpp"

#include <algorithm>
#include <sstream>

#include "errors.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace {

class SftpHandle {
public:
  SftpHandle(SshSession& session, const std::string& path, unsigned long flags, long mode)
    : session_(session),
      handle_(libssh2_sftp_open(session.sftp(), path.c_str(), flags, mode)) {
    if(!handle_) {
      session.fail("SFTP open of '" + path + "' failed");
    }
  }

  ~SftpHandle() {
    if(handle_) libssh2_sftp_close_handle(handle_);
  }

  SftpHandle(const SftpHandle&) = delete;
  SftpHandle& operator=(const SftpHandle&) = delete;

  LIBSSH2_SFTP_HANDLE* get() const { return handle_; }

  void close(const std::string& path) {
    LIBSSH2_SFTP_HANDLE* handle = handle_;
    handle_ = nullptr;
    if(libssh2_sftp_close_handle(handle) != 0) {
      session_.fail("SFTP close of '" + path + "' failed");
    }
  }

private:
  SshSession& session_;
  LIBSSH2_SFTP_HANDLE* handle_;
};

class RemoteRangeReader : public RangeReader {
public:
  RemoteRangeReader(std::unique_ptr<SshSession> session,
                    const std::string& path,
                    std::uint64_t offset,
                    std::uint64_t length)
    : session_(std::move(session)),
      path_(path),
      handle_(*session_, path, LIBSSH2_FXF_READ, 0),
      remaining_(length) {
    libssh2_sftp_seek64(handle_.get(), offset);
  }

  std::size_t read(char* buffer, std::size_t capacity) override {
    if(remaining_ == 0 || capacity == 0) return 0;
    std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(capacity, remaining_));
    ssize_t n = libssh2_sftp_read(handle_.get(), buffer, want);
    if(n < 0) {
      session_->fail("SFTP read of '" + path_ + "' failed");
    }
    remaining_ -= static_cast<std::uint64_t>(n);
    return static_cast<std::size_t>(n);
  }

private:
  std::unique_ptr<SshSession> session_;
  std::string path_;
  SftpHandle handle_;
  std::uint64_t remaining_;
};

class RemoteArtifactWriter : public ArtifactWriter {
public:
  RemoteArtifactWriter(std::unique_ptr<SshSession> session, const std::string& path)
    : session_(std::move(session)),
      path_(path),
      handle_(*session_, path, LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
              LIBSSH2_SFTP_S_IRUSR | LIBSSH2_SFTP_S_IWUSR | LIBSSH2_SFTP_S_IRGRP | LIBSSH2_SFTP_S_IROTH) {}

  void write(const char* data, std::size_t size) override {
    std::size_t written = 0;
    while(written < size) {
      ssize_t n = libssh2_sftp_write(handle_.get(), data + written, size - written);
      if(n < 0) {
        session_->fail("SFTP write to '" + path_ + "' failed");
      }
      written += static_cast<std::size_t>(n);
    }
  }

  void commit() override {
    if(libssh2_sftp_fsync(handle_.get()) != 0) {
      // fsync@openssh.com is an extension; servers without it still
      // persist the data on close.
      if(libssh2_sftp_last_error(session_->sftp()) != LIBSSH2_FX_OP_UNSUPPORTED) {
        session_->fail("SFTP fsync of '" + path_ + "' failed");
      }
    }
    handle_.close(path_);
  }

private:
  std::unique_ptr<SshSession> session_;
  std::string path_;
  SftpHandle handle_;
};

} // namespace

RemoteSite::RemoteSite(SshOptions options, Logger* logger)
  : options_(std::move(options)), logger_(logger) {}

RemoteSite::~RemoteSite() = default;

SshSession& RemoteSite::control() {
  if(!control_) {
    control_ = std::make_unique<SshSession>(options_, logger_);
  }
  return *control_;
}

template<typename Fn>
auto RemoteSite::with_control(Fn&& fn) -> decltype(fn(std::declval<SshSession&>())) {
  if(control_) {
    try {
      return fn(*control_);
    } catch(const TransferError& e) {
      log_debug(logger_, "Control session to {} lost ({}); reconnecting", options_.host, e.what());
      control_.reset();
    }
  }
  return fn(control());
}

void RemoteSite::release_idle_connections() {
  std::lock_guard<std::mutex> lock(control_mutex_);
  if(control_) {
    log_debug(logger_, "Closing idle control session to {}", options_.host);
    control_.reset();
  }
}

FileStat RemoteSite::stat(const std::string& path) {
  std::lock_guard<std::mutex> lock(control_mutex_);
  LIBSSH2_SFTP_ATTRIBUTES attrs{};
  FileStat result;
  const bool found = with_control([&](SshSession& session){
    attrs = LIBSSH2_SFTP_ATTRIBUTES{};
    if(libssh2_sftp_stat(session.sftp(), path.c_str(), &attrs) != 0) {
      if(libssh2_sftp_last_error(session.sftp()) == LIBSSH2_FX_NO_SUCH_FILE) {
        return false;
      }
      session.fail("SFTP stat of '" + path + "' failed");
    }
    return true;
  });
  if(!found) return result;
  result.exists = true;
  if(attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
    result.regular = LIBSSH2_SFTP_S_ISREG(attrs.permissions);
    result.directory = LIBSSH2_SFTP_S_ISDIR(attrs.permissions);
  }
  if(attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) {
    result.size = attrs.filesize;
  } else if(result.regular) {
    throw ValidationError("Server reported no size for '" + describe(path) + "'");
  }
  return result;
}

std::unique_ptr<RangeReader> RemoteSite::open_range(const std::string& path,
                                                    std::uint64_t offset,
                                                    std::uint64_t length) {
  auto session = std::make_unique<SshSession>(options_, logger_);
  return std::make_unique<RemoteRangeReader>(std::move(session), path, offset, length);
}

std::unique_ptr<ArtifactWriter> RemoteSite::create_artifact(const std::string& path) {
  auto session = std::make_unique<SshSession>(options_, logger_);
  return std::make_unique<RemoteArtifactWriter>(std::move(session), path);
}

SshSession::ExecResult RemoteSite::run_checked(const std::string& command, const std::string& what) {
  std::lock_guard<std::mutex> lock(control_mutex_);
  SshSession::ExecResult result;
  try {
    result = with_control([&](SshSession& session){ return session.exec(command); });
  } catch(const TransferError& e) {
    throw AssemblyError(what + " on " + options_.host + " failed: " + e.what());
  }
  if(result.exit_status != 0) {
    auto err = result.err;
    while(!err.empty() && (err.back() == '\n' || err.back() == '\r')) err.pop_back();
    throw AssemblyError(what + " on " + options_.host + " exited with status " +
                        std::to_string(result.exit_status) + (err.empty() ? "" : ": " + err));
  }
  return result;
}

void RemoteSite::concatenate(const std::vector<std::string>& parts, const std::string& target) {
  std::ostringstream command;
  command << "cat";
  for(const auto& part : parts) {
    command << " " << shell_quote(part);
  }
  command << " > " << shell_quote(target);
  run_checked(command.str(), "Concatenation into '" + target + "'");
}

void RemoteSite::rename(const std::string& from, const std::string& to) {
  run_checked("mv -f -- " + shell_quote(from) + " " + shell_quote(to),
              "Rename of '" + from + "'");
}

void RemoteSite::remove(const std::string& path) {
  std::lock_guard<std::mutex> lock(control_mutex_);
  with_control([&](SshSession& session){
    if(libssh2_sftp_unlink(session.sftp(), path.c_str()) != 0) {
      if(libssh2_sftp_last_error(session.sftp()) == LIBSSH2_FX_NO_SUCH_FILE) return;
      session.fail("SFTP unlink of '" + path + "' failed");
    }
  });
}

std::string RemoteSite::sha256(const std::string& path) {
  auto result = run_checked("sha256sum -- " + shell_quote(path), "sha256sum of '" + path + "'");
  std::istringstream in(result.out);
  std::string digest;
  in >> digest;
  if(digest.size() != 64) {
    throw AssemblyError("Unexpected sha256sum output for '" + describe(path) + "'");
  }
  return digest;
}

std::string RemoteSite::describe(const std::string& path) const {
  std::string host = options_.host.find(':') != std::string::npos
    ? "[" + options_.host + "]"
    : options_.host;
  std::string user = effective_ssh_user(options_.user);
  return (user.empty() ? "" : user + "@") + host + ":" + path;
}
