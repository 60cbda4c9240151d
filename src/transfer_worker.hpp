#pragma once

#include <atomic>
#include <cstdint>
#include <string>

#include "orchestrator.hpp"
#include "site.hpp"

class Logger;

// Moves one chunk's byte range from the source file into its artifact next to
// the final path on the destination side. Each call to run() is exactly one
// attempt; retrying is the orchestrator's business. Safe to call from several
// threads at once.
class TransferWorker {
public:
  TransferWorker(Site& source,
                 std::string source_path,
                 Site& destination,
                 std::string final_path,
                 std::size_t buffer_size,
                 Logger* logger = nullptr);

  ChunkOutcome run(const ChunkTask& task,
                   const std::atomic<bool>& cancel,
                   std::atomic<std::uint64_t>& bytes_done) const;

  ChunkAttempt as_attempt() const;

private:
  Site& source_;
  std::string source_path_;
  Site& destination_;
  std::string final_path_;
  std::size_t buffer_size_;
  Logger* logger_;
};
