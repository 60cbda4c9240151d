#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <random>
#include <string>
#include <vector>

#include "transfer_job.hpp"

class Logger;

struct OrchestratorConfig {
  std::size_t stream_count = 20;
  std::uint32_t max_retries = 3;
  std::chrono::milliseconds retry_base_delay{1000}; // 0 = redispatch immediately
  std::chrono::milliseconds retry_max_delay{30000};
  std::chrono::milliseconds progress_interval{200};
  bool enable_meter = false;
};

// Read-only snapshot handed to a worker at dispatch time.
struct ChunkTask {
  Chunk chunk;
  // Backoff the worker waits out (cancellably) before opening its channel.
  std::chrono::milliseconds delay{0};
};

struct ChunkOutcome {
  std::size_t index = 0;
  bool success = false;
  std::string cause;
};

// One attempt at one chunk. Must return (not throw) promptly once cancel is
// set, and add every byte it moves to bytes_done.
using ChunkAttempt = std::function<ChunkOutcome(const ChunkTask& task,
                                                const std::atomic<bool>& cancel,
                                                std::atomic<std::uint64_t>& bytes_done)>;

using OrchestratorMeterCallback = std::function<void(const std::vector<Chunk>& chunks,
                                                     std::uint64_t bytes_done,
                                                     bool force)>;

struct OrchestratorResult {
  JobOutcome outcome = JobOutcome::Running;
  std::size_t exhausted_chunks = 0;
  std::string failure_reason;
};

// Drives one worker thread per dispatched chunk, at most stream_count at a
// time, lowest pending index first. All chunk state lives here and is only
// mutated on the thread that calls run(); workers report back through a
// single outcome queue.
class Orchestrator {
public:
  Orchestrator(OrchestratorConfig config,
               ChunkAttempt attempt,
               OrchestratorMeterCallback meter = {},
               Logger* logger = nullptr);

  // Returns Completed iff every chunk Succeeded. On the first Exhausted chunk
  // the remaining workers are cancelled and drained before returning Failed.
  OrchestratorResult run(std::vector<Chunk>& chunks);

  // Chunk indices in the order they were dispatched, retries included.
  const std::vector<std::size_t>& dispatch_order() const { return dispatch_order_; }
  std::size_t peak_in_flight() const { return peak_in_flight_; }

  std::chrono::milliseconds backoff_delay(std::uint32_t attempts);

private:
  OrchestratorConfig config_;
  ChunkAttempt attempt_;
  OrchestratorMeterCallback meter_;
  Logger* logger_;
  std::mt19937 rng_;
  std::vector<std::size_t> dispatch_order_;
  std::size_t peak_in_flight_ = 0;
};

// Sleeps for delay in 50 ms slices; returns false if cancel was raised.
bool wait_cancellable(std::chrono::milliseconds delay, const std::atomic<bool>& cancel);
