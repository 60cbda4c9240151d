#include "progress_meter.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

ProgressMeter::ProgressMeter(std::string label,
                             std::uint64_t total_size,
                             std::size_t width,
                             std::ostream& out)
  : label_(std::move(label)),
    total_size_(total_size),
    width_(std::max<std::size_t>(1, width)),
    out_(out),
    started_(std::chrono::steady_clock::now()) {}

std::string ProgressMeter::format(const std::vector<Chunk>& chunks,
                                  std::uint64_t bytes_done,
                                  std::uint64_t total_size,
                                  std::size_t slots,
                                  double bytes_per_second) {
  slots = std::max<std::size_t>(1, slots);
  static constexpr char kMeterChars[] = {' ', '.', '_', 'v', 'Y', 'X', 'H', '#'};
  constexpr std::size_t kMeterCharCount = sizeof(kMeterChars) / sizeof(kMeterChars[0]);

  std::string bar;
  bar.reserve(slots);
  if(total_size == 0 || chunks.empty()) {
    const bool done = !chunks.empty() &&
      std::all_of(chunks.begin(), chunks.end(), [](const Chunk& c){ return c.state == ChunkState::Succeeded; });
    bar.assign(slots, done ? '#' : ' ');
  } else {
    auto scaled_position = [total_size, slots](std::size_t idx) -> std::uint64_t {
      std::uint64_t base = (total_size / slots) * idx;
      std::uint64_t remainder = (total_size % slots) * idx / slots;
      return base + remainder;
    };
    std::size_t chunk_idx = 0;
    for(std::size_t slot = 0; slot < slots; ++slot) {
      std::uint64_t slot_start = scaled_position(slot);
      if(slot_start >= total_size) {
        bar.push_back(' ');
        continue;
      }
      std::uint64_t slot_end = scaled_position(slot + 1);
      if(slot_end <= slot_start) slot_end = slot_start + 1;
      if(slot_end > total_size) slot_end = total_size;
      const std::uint64_t slot_len = slot_end - slot_start;

      while(chunk_idx + 1 < chunks.size() && chunks[chunk_idx].end() <= slot_start) {
        ++chunk_idx;
      }
      std::uint64_t filled = 0;
      for(std::size_t i = chunk_idx; i < chunks.size() && chunks[i].offset < slot_end; ++i) {
        if(chunks[i].state != ChunkState::Succeeded) continue;
        std::uint64_t overlap_start = std::max(slot_start, chunks[i].offset);
        std::uint64_t overlap_end = std::min(slot_end, chunks[i].end());
        if(overlap_end > overlap_start) filled += overlap_end - overlap_start;
      }
      const double ratio = std::clamp(static_cast<double>(filled) / static_cast<double>(slot_len), 0.0, 1.0);
      std::size_t index = static_cast<std::size_t>(ratio * static_cast<double>(kMeterCharCount));
      if(index >= kMeterCharCount) index = kMeterCharCount - 1;
      bar.push_back(kMeterChars[index]);
    }
  }

  double percent = total_size == 0
    ? (bar.front() == '#' ? 100.0 : 0.0)
    : (static_cast<double>(std::min(bytes_done, total_size)) / static_cast<double>(total_size)) * 100.0;
  std::ostringstream oss;
  oss << "[" << bar << "] " << std::fixed << std::setprecision(1) << percent << "% "
      << std::setprecision(1) << (bytes_per_second / (1024.0 * 1024.0)) << " MB/s";
  return oss.str();
}

void ProgressMeter::update(const std::vector<Chunk>& chunks, std::uint64_t bytes_done, bool force) {
  auto now = std::chrono::steady_clock::now();
  if(!force && now - last_render_ < std::chrono::milliseconds(100)) return;
  last_render_ = now;

  const double seconds = std::chrono::duration<double>(now - started_).count();
  const double rate = seconds > 0.0 ? static_cast<double>(bytes_done) / seconds : 0.0;
  std::ostringstream line;
  line << "\r" << label_ << " " << format(chunks, bytes_done, total_size_, width_, rate);
  auto rendered = line.str();
  out_ << rendered;
  if(rendered.size() < line_width_) {
    out_ << std::string(line_width_ - rendered.size(), ' ');
  } else {
    line_width_ = rendered.size();
  }
  out_.flush();
}

void ProgressMeter::finish() {
  if(line_width_ > 0) {
    out_ << "\r" << std::string(line_width_, ' ') << "\r";
    out_.flush();
  }
  line_width_ = 0;
}
