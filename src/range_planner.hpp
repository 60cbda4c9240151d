#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "transfer_job.hpp"

// Splits [0, total_size) into contiguous chunks of ceil(total_size / streams)
// bytes, the last one holding the remainder. The chunk count never exceeds
// max(1, total_size); an empty file yields a single zero-length chunk.
// Throws ValidationError when stream_count is 0.
std::vector<Chunk> plan_ranges(std::uint64_t total_size, std::size_t stream_count);

// Chunk length for the given inputs (0 for an empty file).
std::uint64_t planned_chunk_length(std::uint64_t total_size, std::size_t stream_count);
