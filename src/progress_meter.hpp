#pragma once

#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "transfer_job.hpp"

// Single-line "\r" progress display fed by the orchestrator's meter callback.
class ProgressMeter {
public:
  ProgressMeter(std::string label,
                std::uint64_t total_size,
                std::size_t width = 40,
                std::ostream& out = std::cout);

  void update(const std::vector<Chunk>& chunks, std::uint64_t bytes_done, bool force);
  // Blanks the meter line.
  void finish();

  // "[##__ ...] 42.0% 12.3 MB/s"; a slot fills with the share of its bytes
  // that belong to succeeded chunks.
  static std::string format(const std::vector<Chunk>& chunks,
                            std::uint64_t bytes_done,
                            std::uint64_t total_size,
                            std::size_t slots,
                            double bytes_per_second);

private:
  std::string label_;
  std::uint64_t total_size_;
  std::size_t width_;
  std::ostream& out_;
  std::chrono::steady_clock::time_point started_;
  std::chrono::steady_clock::time_point last_render_{};
  std::size_t line_width_ = 0;
};
