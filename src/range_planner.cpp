#include "range_planner.hpp"

#include <algorithm>

#include "errors.hpp"

std::uint64_t planned_chunk_length(std::uint64_t total_size, std::size_t stream_count) {
  if(stream_count == 0) {
    throw ValidationError("Stream count must be at least 1");
  }
  if(total_size == 0) return 0;
  const std::uint64_t streams = std::min<std::uint64_t>(stream_count, total_size);
  return total_size / streams + (total_size % streams != 0 ? 1 : 0);
}

std::vector<Chunk> plan_ranges(std::uint64_t total_size, std::size_t stream_count) {
  const std::uint64_t chunk_length = planned_chunk_length(total_size, stream_count);

  std::vector<Chunk> chunks;
  if(total_size == 0) {
    chunks.push_back(Chunk{});
    return chunks;
  }

  // ceil() can leave fewer chunks than streams (10 bytes over 4 streams is
  // 3+3+3+1, over 6 streams is 2+2+2+2+2).
  const std::uint64_t count = (total_size + chunk_length - 1) / chunk_length;
  chunks.reserve(static_cast<std::size_t>(count));
  std::uint64_t offset = 0;
  for(std::uint64_t i = 0; i < count; ++i) {
    Chunk chunk;
    chunk.index = static_cast<std::size_t>(i);
    chunk.offset = offset;
    chunk.length = std::min(chunk_length, total_size - offset);
    offset += chunk.length;
    chunks.push_back(chunk);
  }
  return chunks;
}
