#include "transfer_worker.hpp"

#include <algorithm>
#include <vector>

#include "errors.hpp"
#include "log.hpp"

TransferWorker::TransferWorker(Site& source,
                               std::string source_path,
                               Site& destination,
                               std::string final_path,
                               std::size_t buffer_size,
                               Logger* logger)
  : source_(source),
    source_path_(std::move(source_path)),
    destination_(destination),
    final_path_(std::move(final_path)),
    buffer_size_(std::max<std::size_t>(1, buffer_size)),
    logger_(logger) {}

ChunkOutcome TransferWorker::run(const ChunkTask& task,
                                 const std::atomic<bool>& cancel,
                                 std::atomic<std::uint64_t>& bytes_done) const {
  const Chunk& chunk = task.chunk;
  ChunkOutcome outcome;
  outcome.index = chunk.index;

  if(task.delay.count() > 0 && !wait_cancellable(task.delay, cancel)) {
    outcome.cause = "cancelled during backoff";
    return outcome;
  }

  std::uint64_t moved = 0;
  try {
    if(cancel.load()) {
      throw TransferError("cancelled before start");
    }
    const auto artifact = chunk_artifact_path(final_path_, chunk.index);
    auto reader = source_.open_range(source_path_, chunk.offset, chunk.length);
    auto writer = destination_.create_artifact(artifact);

    std::vector<char> buffer(static_cast<std::size_t>(
      std::min<std::uint64_t>(buffer_size_, std::max<std::uint64_t>(chunk.length, 1))));
    std::uint64_t remaining = chunk.length;
    while(remaining > 0) {
      if(cancel.load()) {
        throw TransferError("cancelled");
      }
      const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), remaining));
      const std::size_t got = reader->read(buffer.data(), want);
      if(got == 0) {
        throw TransferError("source ended early at offset " +
                            std::to_string(chunk.offset + (chunk.length - remaining)));
      }
      writer->write(buffer.data(), got);
      remaining -= got;
      moved += got;
      bytes_done += got;
    }
    writer->commit();
    outcome.success = true;
    log_debug(logger_, "chunk {} -> {} ({} bytes)", chunk.index, destination_.describe(artifact), chunk.length);
  } catch(const std::exception& e) {
    bytes_done -= moved;
    outcome.success = false;
    outcome.cause = e.what();
  }
  return outcome;
}

ChunkAttempt TransferWorker::as_attempt() const {
  return [this](const ChunkTask& task,
                const std::atomic<bool>& cancel,
                std::atomic<std::uint64_t>& bytes_done){
    return run(task, cancel, bytes_done);
  };
}
