#include "local_site.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "errors.hpp"
#include "utils.hpp"

namespace {

std::string errno_text() {
  return std::strerror(errno);
}

class FileDescriptor {
public:
  explicit FileDescriptor(int fd = -1) : fd_(fd) {}
  ~FileDescriptor() { reset(); }

  FileDescriptor(const FileDescriptor&) = delete;
  FileDescriptor& operator=(const FileDescriptor&) = delete;

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }

  // Closes and reports whether close() succeeded.
  bool close() {
    if(fd_ < 0) return true;
    int rc = ::close(fd_);
    fd_ = -1;
    return rc == 0;
  }

  void reset() {
    if(fd_ >= 0) ::close(fd_);
    fd_ = -1;
  }

private:
  int fd_;
};

void write_all(int fd, const char* data, std::size_t size, const std::string& path) {
  std::size_t written = 0;
  while(written < size) {
    ssize_t n = ::write(fd, data + written, size - written);
    if(n < 0) {
      if(errno == EINTR) continue;
      throw TransferError("Write to '" + path + "' failed: " + errno_text());
    }
    written += static_cast<std::size_t>(n);
  }
}

class LocalRangeReader : public RangeReader {
public:
  LocalRangeReader(const std::string& path, std::uint64_t offset, std::uint64_t length)
    : path_(path), fd_(::open(path.c_str(), O_RDONLY)), offset_(offset), remaining_(length) {
    if(!fd_.valid()) {
      throw TransferError("Cannot open '" + path + "' for reading: " + errno_text());
    }
  }

  std::size_t read(char* buffer, std::size_t capacity) override {
    if(remaining_ == 0 || capacity == 0) return 0;
    std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(capacity, remaining_));
    while(true) {
      ssize_t n = ::pread(fd_.get(), buffer, want, static_cast<off_t>(offset_));
      if(n < 0) {
        if(errno == EINTR) continue;
        throw TransferError("Read from '" + path_ + "' failed: " + errno_text());
      }
      offset_ += static_cast<std::uint64_t>(n);
      remaining_ -= static_cast<std::uint64_t>(n);
      return static_cast<std::size_t>(n);
    }
  }

private:
  std::string path_;
  FileDescriptor fd_;
  std::uint64_t offset_;
  std::uint64_t remaining_;
};

class LocalArtifactWriter : public ArtifactWriter {
public:
  explicit LocalArtifactWriter(const std::string& path)
    : path_(path), fd_(::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644)) {
    if(!fd_.valid()) {
      throw TransferError("Cannot create '" + path + "': " + errno_text());
    }
  }

  void write(const char* data, std::size_t size) override {
    write_all(fd_.get(), data, size, path_);
  }

  void commit() override {
    if(::fsync(fd_.get()) != 0) {
      throw TransferError("fsync of '" + path_ + "' failed: " + errno_text());
    }
    if(!fd_.close()) {
      throw TransferError("Close of '" + path_ + "' failed: " + errno_text());
    }
  }

private:
  std::string path_;
  FileDescriptor fd_;
};

} // namespace

FileStat LocalSite::stat(const std::string& path) {
  FileStat result;
  struct ::stat st {};
  if(::stat(path.c_str(), &st) != 0) {
    if(errno == ENOENT || errno == ENOTDIR) return result;
    throw TransferError("stat '" + path + "' failed: " + errno_text());
  }
  result.exists = true;
  result.regular = S_ISREG(st.st_mode);
  result.directory = S_ISDIR(st.st_mode);
  result.size = static_cast<std::uint64_t>(st.st_size);
  return result;
}

std::unique_ptr<RangeReader> LocalSite::open_range(const std::string& path,
                                                   std::uint64_t offset,
                                                   std::uint64_t length) {
  return std::make_unique<LocalRangeReader>(path, offset, length);
}

std::unique_ptr<ArtifactWriter> LocalSite::create_artifact(const std::string& path) {
  return std::make_unique<LocalArtifactWriter>(path);
}

void LocalSite::concatenate(const std::vector<std::string>& parts, const std::string& target) {
  FileDescriptor out(::open(target.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
  if(!out.valid()) {
    throw AssemblyError("Cannot create '" + target + "': " + errno_text());
  }
  std::vector<char> buffer(1 << 20);
  for(const auto& part : parts) {
    FileDescriptor in(::open(part.c_str(), O_RDONLY));
    if(!in.valid()) {
      throw AssemblyError("Cannot open chunk artifact '" + part + "': " + errno_text());
    }
    while(true) {
      ssize_t n = ::read(in.get(), buffer.data(), buffer.size());
      if(n < 0) {
        if(errno == EINTR) continue;
        throw AssemblyError("Read from '" + part + "' failed: " + errno_text());
      }
      if(n == 0) break;
      try {
        write_all(out.get(), buffer.data(), static_cast<std::size_t>(n), target);
      } catch(const TransferError& e) {
        throw AssemblyError(e.what());
      }
    }
  }
  if(::fsync(out.get()) != 0) {
    throw AssemblyError("fsync of '" + target + "' failed: " + errno_text());
  }
  if(!out.close()) {
    throw AssemblyError("Close of '" + target + "' failed: " + errno_text());
  }
}

void LocalSite::rename(const std::string& from, const std::string& to) {
  std::error_code ec;
  std::filesystem::rename(from, to, ec);
  if(ec) {
    throw AssemblyError("Rename '" + from + "' -> '" + to + "' failed: " + ec.message());
  }
}

void LocalSite::remove(const std::string& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if(ec) {
    throw TransferError("Remove '" + path + "' failed: " + ec.message());
  }
}

std::string LocalSite::sha256(const std::string& path) {
  try {
    return sha256_file_hex(path);
  } catch(const std::runtime_error& e) {
    throw AssemblyError(e.what());
  }
}

std::string LocalSite::describe(const std::string& path) const {
  return path;
}
