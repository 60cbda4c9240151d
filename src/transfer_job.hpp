#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "endpoint.hpp"

enum class ChunkState {
  Pending,
  Dispatched,
  Succeeded,
  Failed,
  Exhausted
};

inline const char* chunk_state_name(ChunkState state) {
  switch(state) {
    case ChunkState::Pending: return "pending";
    case ChunkState::Dispatched: return "dispatched";
    case ChunkState::Succeeded: return "succeeded";
    case ChunkState::Failed: return "failed";
    case ChunkState::Exhausted: return "exhausted";
  }
  return "unknown";
}

struct Chunk {
  std::size_t index = 0;
  std::uint64_t offset = 0;
  std::uint64_t length = 0;
  ChunkState state = ChunkState::Pending;
  std::uint32_t attempts = 0;

  std::uint64_t end() const { return offset + length; }
};

enum class JobOutcome { Running, Completed, Failed };

struct TransferJob {
  Endpoint source;
  Endpoint destination;
  Direction direction = Direction::Push;
  std::uint64_t total_size = 0;
  std::vector<Chunk> chunks;
  std::uint32_t max_retries = 3;

  // Path of the assembled file on the destination side.
  std::string final_path;

  JobOutcome outcome = JobOutcome::Running;
  std::string failure_reason;
};

inline constexpr const char* kChunkArtifactInfix = ".zap-chunk-";
inline constexpr const char* kPartialSuffix = ".zap-partial";

// "<final>.zap-chunk-00007"
std::string chunk_artifact_path(const std::string& final_path, std::size_t index);
std::string partial_path(const std::string& final_path);
