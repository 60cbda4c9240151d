#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct FileStat {
  bool exists = false;
  bool regular = false;
  bool directory = false;
  std::uint64_t size = 0;
};

// Positional reader over one byte range of a file. read() returns the number
// of bytes placed in buffer; 0 means the range is exhausted.
class RangeReader {
public:
  virtual ~RangeReader() = default;
  virtual std::size_t read(char* buffer, std::size_t capacity) = 0;
};

// Exclusive writer for one chunk artifact. Nothing is durable until commit()
// returns; an uncommitted writer may leave a truncated artifact behind.
class ArtifactWriter {
public:
  virtual ~ArtifactWriter() = default;
  virtual void write(const char* data, std::size_t size) = 0;
  virtual void commit() = 0;
};

// One side of a transfer. Failures throw TransferError, except concatenate(),
// rename() and sha256() which belong to assembly and throw AssemblyError.
// Implementations must allow concurrent calls to open_range() and
// create_artifact() from different workers.
class Site {
public:
  virtual ~Site() = default;

  virtual FileStat stat(const std::string& path) = 0;
  virtual std::unique_ptr<RangeReader> open_range(const std::string& path,
                                                  std::uint64_t offset,
                                                  std::uint64_t length) = 0;
  virtual std::unique_ptr<ArtifactWriter> create_artifact(const std::string& path) = 0;

  // Writes the parts, in order, into target (created or truncated).
  virtual void concatenate(const std::vector<std::string>& parts, const std::string& target) = 0;
  // Replaces 'to' if it exists.
  virtual void rename(const std::string& from, const std::string& to) = 0;
  // Missing files are not an error.
  virtual void remove(const std::string& path) = 0;
  virtual std::string sha256(const std::string& path) = 0;

  virtual std::string describe(const std::string& path) const = 0;

  // Called once the pre-flight checks are done and the chunk transfer is
  // about to start. Sites drop connections that would otherwise sit idle
  // until assembly; the next metadata call reconnects.
  virtual void release_idle_connections() {}
};
