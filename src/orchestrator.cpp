#include "orchestrator.hpp"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <thread>

#include "errors.hpp"
#include "log.hpp"

namespace {

class OutcomeQueue {
public:
  void push(ChunkOutcome outcome) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      queue_.push_back(std::move(outcome));
    }
    cv_.notify_one();
  }

  std::optional<ChunkOutcome> pop_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if(!cv_.wait_for(lock, timeout, [&]{ return !queue_.empty(); })) {
      return std::nullopt;
    }
    ChunkOutcome outcome = std::move(queue_.front());
    queue_.pop_front();
    return outcome;
  }

private:
  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<ChunkOutcome> queue_;
};

}

bool wait_cancellable(std::chrono::milliseconds delay, const std::atomic<bool>& cancel) {
  auto deadline = std::chrono::steady_clock::now() + delay;
  while(!cancel.load()) {
    auto now = std::chrono::steady_clock::now();
    if(now >= deadline) return true;
    auto slice = std::min<std::chrono::steady_clock::duration>(deadline - now, std::chrono::milliseconds(50));
    std::this_thread::sleep_for(slice);
  }
  return false;
}

Orchestrator::Orchestrator(OrchestratorConfig config,
                           ChunkAttempt attempt,
                           OrchestratorMeterCallback meter,
                           Logger* logger)
  : config_(config),
    attempt_(std::move(attempt)),
    meter_(std::move(meter)),
    logger_(logger),
    rng_(std::random_device{}()) {}

std::chrono::milliseconds Orchestrator::backoff_delay(std::uint32_t attempts) {
  if(attempts == 0 || config_.retry_base_delay.count() <= 0) {
    return std::chrono::milliseconds(0);
  }
  const auto cap = std::max(config_.retry_max_delay, config_.retry_base_delay);
  auto delay = config_.retry_base_delay;
  for(std::uint32_t i = 1; i < attempts && delay < cap; ++i) {
    delay *= 2;
  }
  delay = std::min(delay, cap);
  std::uniform_real_distribution<double> jitter(0.8, 1.2);
  return std::chrono::milliseconds(static_cast<std::int64_t>(static_cast<double>(delay.count()) * jitter(rng_)));
}

OrchestratorResult Orchestrator::run(std::vector<Chunk>& chunks) {
  if(config_.stream_count == 0) {
    throw ValidationError("Stream count must be at least 1");
  }
  if(!attempt_) {
    throw std::invalid_argument("Orchestrator needs a chunk attempt function");
  }

  OrchestratorResult result;
  dispatch_order_.clear();
  peak_in_flight_ = 0;
  if(chunks.empty()) {
    result.outcome = JobOutcome::Completed;
    return result;
  }

  std::set<std::size_t> pending;
  for(std::size_t i = 0; i < chunks.size(); ++i) {
    if(chunks[i].index != i) {
      throw std::invalid_argument("Chunk list is not ordered by index");
    }
    if(chunks[i].state == ChunkState::Pending) pending.insert(i);
  }

  OutcomeQueue outcomes;
  std::map<std::size_t, std::thread> in_flight;
  std::atomic<bool> cancel{false};
  std::atomic<std::uint64_t> bytes_done{0};
  std::size_t succeeded = 0;
  for(const auto& chunk : chunks) {
    if(chunk.state == ChunkState::Succeeded) {
      ++succeeded;
      bytes_done += chunk.length;
    }
  }

  auto meter_interval = config_.progress_interval.count() > 0
    ? config_.progress_interval
    : std::chrono::milliseconds(200);
  auto emit_meter = [&](bool force){
    if(!config_.enable_meter || !meter_) return;
    meter_(chunks, bytes_done.load(), force);
  };

  auto dispatch_more = [&]{
    while(!cancel.load() && in_flight.size() < config_.stream_count && !pending.empty()) {
      const std::size_t index = *pending.begin();
      pending.erase(pending.begin());
      Chunk& chunk = chunks[index];
      chunk.state = ChunkState::Dispatched;
      ChunkTask task{chunk, backoff_delay(chunk.attempts)};
      dispatch_order_.push_back(index);
      log_debug(logger_, "dispatch chunk {} [{}, {}) attempt {} delay {}ms",
                index, chunk.offset, chunk.end(), chunk.attempts + 1, task.delay.count());
      in_flight.emplace(index, std::thread([this, task, &cancel, &bytes_done, &outcomes]{
        ChunkOutcome outcome;
        try {
          outcome = attempt_(task, cancel, bytes_done);
        } catch(const std::exception& e) {
          outcome.success = false;
          outcome.cause = e.what();
        }
        outcome.index = task.chunk.index;
        outcomes.push(std::move(outcome));
      }));
      peak_in_flight_ = std::max(peak_in_flight_, in_flight.size());
    }
  };

  auto join_all = [&]{
    for(auto& entry : in_flight) {
      if(entry.second.joinable()) entry.second.join();
    }
    in_flight.clear();
  };

  try {
    emit_meter(true);
    dispatch_more();
    while(!in_flight.empty()) {
      auto outcome = outcomes.pop_for(meter_interval);
      if(!outcome) {
        emit_meter(true);
        continue;
      }
      auto worker = in_flight.find(outcome->index);
      if(worker != in_flight.end()) {
        if(worker->second.joinable()) worker->second.join();
        in_flight.erase(worker);
      }

      Chunk& chunk = chunks[outcome->index];
      if(outcome->success) {
        chunk.state = ChunkState::Succeeded;
        ++succeeded;
      } else if(cancel.load()) {
        chunk.state = ChunkState::Failed;
        log_debug(logger_, "chunk {} stopped: {}", chunk.index, outcome->cause);
      } else if(chunk.attempts < config_.max_retries) {
        ++chunk.attempts;
        log_warn(logger_, "chunk {} failed (retry {}/{}): {}",
                 chunk.index, chunk.attempts, config_.max_retries, outcome->cause);
        chunk.state = ChunkState::Pending;
        pending.insert(chunk.index);
      } else {
        chunk.state = ChunkState::Exhausted;
        ++result.exhausted_chunks;
        log_error(logger_, "chunk {} exhausted {} retries: {}",
                  chunk.index, config_.max_retries, outcome->cause);
        if(result.failure_reason.empty()) {
          result.failure_reason = "chunk " + std::to_string(chunk.index) + ": " + outcome->cause;
        }
        cancel = true;
      }
      emit_meter(false);
      dispatch_more();
    }
  } catch(...) {
    cancel = true;
    join_all();
    throw;
  }

  // Anything cancelled before dispatch stays Pending.
  if(succeeded == chunks.size()) {
    result.outcome = JobOutcome::Completed;
    emit_meter(true);
  } else {
    result.outcome = JobOutcome::Failed;
    if(result.failure_reason.empty()) {
      result.failure_reason = "transfer stopped before every chunk completed";
    }
  }
  return result;
}
