#include "errors.hpp"
#include "range_planner.hpp"
#include "test_runner_utils.hpp"
#include "transfer_job.hpp"

#include <cstdint>
#include <iostream>
#include <utility>
#include <vector>

namespace {

using zap::test::TestCase;
using zap::test::TestContext;

// Contiguous, in index order, covering [0, total) exactly.
bool is_partition(const std::vector<Chunk>& chunks, std::uint64_t total) {
  if(chunks.empty()) return false;
  std::uint64_t expected_offset = 0;
  for(std::size_t i = 0; i < chunks.size(); ++i) {
    const auto& chunk = chunks[i];
    if(chunk.index != i || chunk.offset != expected_offset) return false;
    if(chunk.state != ChunkState::Pending || chunk.attempts != 0) return false;
    if(total > 0 && chunk.length == 0) return false;
    expected_offset = chunk.end();
  }
  return expected_offset == total;
}

bool test_partition_properties(TestContext& ctx) {
  const std::vector<std::uint64_t> sizes = {1, 2, 5, 10, 19, 20, 21, 4096, 4099, 1000003};
  const std::vector<std::size_t> streams = {1, 2, 3, 4, 6, 7, 20, 64, 1000};
  for(auto total : sizes) {
    for(auto n : streams) {
      auto chunks = plan_ranges(total, n);
      const auto length = planned_chunk_length(total, n);
      bool ok = is_partition(chunks, total) &&
                chunks.size() <= n &&
                chunks.size() <= total;
      for(std::size_t i = 0; ok && i < chunks.size(); ++i) {
        if(i + 1 < chunks.size()) {
          ok = chunks[i].length == length;
        } else {
          ok = chunks[i].length >= 1 && chunks[i].length <= length;
        }
      }
      if(!ok) {
        if(ctx.verbose) std::cout << "\n    bad plan for total=" << total << " streams=" << n << "\n";
        return false;
      }
    }
  }
  return true;
}

bool test_plan_is_deterministic(TestContext&) {
  auto first = plan_ranges(123457, 20);
  auto second = plan_ranges(123457, 20);
  if(first.size() != second.size()) return false;
  for(std::size_t i = 0; i < first.size(); ++i) {
    if(first[i].offset != second[i].offset || first[i].length != second[i].length) return false;
  }
  return true;
}

bool test_empty_file_single_chunk(TestContext&) {
  auto chunks = plan_ranges(0, 20);
  return chunks.size() == 1 &&
         chunks[0].index == 0 && chunks[0].offset == 0 && chunks[0].length == 0 &&
         planned_chunk_length(0, 20) == 0;
}

bool test_streams_clamped_to_size(TestContext&) {
  auto chunks = plan_ranges(5, 20);
  if(chunks.size() != 5) return false;
  for(const auto& chunk : chunks) {
    if(chunk.length != 1) return false;
  }
  return true;
}

bool test_uneven_split(TestContext&) {
  auto chunks = plan_ranges(10, 4);
  const std::vector<std::pair<std::uint64_t, std::uint64_t>> expected = {
    {0, 3}, {3, 3}, {6, 3}, {9, 1}
  };
  if(chunks.size() != expected.size()) return false;
  for(std::size_t i = 0; i < expected.size(); ++i) {
    if(chunks[i].offset != expected[i].first || chunks[i].length != expected[i].second) return false;
  }
  // ceil(10 / 6) = 2 leaves only five chunks.
  return plan_ranges(10, 6).size() == 5 && plan_ranges(4099, 8).size() == 8;
}

bool test_single_stream(TestContext&) {
  auto chunks = plan_ranges(4096, 1);
  return chunks.size() == 1 && chunks[0].length == 4096;
}

bool test_zero_streams_rejected(TestContext&) {
  try {
    plan_ranges(100, 0);
  } catch(const ValidationError&) {
    return true;
  }
  return false;
}

bool test_artifact_names(TestContext&) {
  return chunk_artifact_path("/data/out.bin", 7) == "/data/out.bin.zap-chunk-00007" &&
         chunk_artifact_path("f", 123456) == "f.zap-chunk-123456" &&
         partial_path("/data/out.bin") == "/data/out.bin.zap-partial";
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"partition_properties", test_partition_properties},
    {"plan_is_deterministic", test_plan_is_deterministic},
    {"empty_file_single_chunk", test_empty_file_single_chunk},
    {"streams_clamped_to_size", test_streams_clamped_to_size},
    {"uneven_split", test_uneven_split},
    {"single_stream", test_single_stream},
    {"zero_streams_rejected", test_zero_streams_rejected},
    {"artifact_names", test_artifact_names}
  };
  return zap::test::run_test_cases("range planner", tests, argc, argv);
}
