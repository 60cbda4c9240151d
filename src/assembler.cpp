#include "assembler.hpp"

#include <sstream>

#include "errors.hpp"
#include "log.hpp"

Assembler::Assembler(Site& destination, Logger* logger)
  : destination_(destination), logger_(logger) {}

std::vector<std::string> Assembler::artifact_paths(const TransferJob& job) {
  std::vector<std::string> paths;
  paths.reserve(job.chunks.size());
  for(const auto& chunk : job.chunks) {
    paths.push_back(chunk_artifact_path(job.final_path, chunk.index));
  }
  return paths;
}

void Assembler::assemble(const TransferJob& job) {
  if(job.chunks.empty()) {
    throw AssemblyError("Nothing to assemble for " + destination_.describe(job.final_path));
  }
  for(const auto& chunk : job.chunks) {
    if(chunk.state != ChunkState::Succeeded) {
      throw AssemblyError("Chunk " + std::to_string(chunk.index) + " is " +
                          chunk_state_name(chunk.state) + "; refusing to assemble");
    }
  }

  const auto parts = artifact_paths(job);
  const auto staging = partial_path(job.final_path);
  log_debug(logger_, "assembling {} chunk(s) into {}", parts.size(), destination_.describe(staging));
  destination_.concatenate(parts, staging);

  FileStat assembled;
  try {
    assembled = destination_.stat(staging);
  } catch(const TransferError& e) {
    throw AssemblyError(std::string("Cannot stat assembled file: ") + e.what());
  }
  if(!assembled.exists || assembled.size != job.total_size) {
    std::ostringstream message;
    message << "Assembled size " << assembled.size << " of " << destination_.describe(staging)
            << " does not match expected " << job.total_size;
    std::string offenders;
    for(std::size_t i = 0; i < parts.size(); ++i) {
      FileStat st;
      try {
        st = destination_.stat(parts[i]);
      } catch(const TransferError& e) {
        log_warn(logger_, "cannot stat {}: {}", parts[i], e.what());
        continue;
      }
      if(!st.exists || st.size != job.chunks[i].length) {
        if(!offenders.empty()) offenders += ", ";
        offenders += parts[i] + " (" + std::to_string(st.size) + " of " +
                     std::to_string(job.chunks[i].length) + " bytes)";
      }
    }
    if(!offenders.empty()) message << "; bad chunk artifacts: " << offenders;
    message << "; partial output and chunk artifacts left in place";
    throw AssemblyError(message.str());
  }

  destination_.rename(staging, job.final_path);

  for(const auto& part : parts) {
    try {
      destination_.remove(part);
    } catch(const TransferError& e) {
      log_warn(logger_, "could not remove chunk artifact {}: {}", destination_.describe(part), e.what());
    }
  }
  log_debug(logger_, "assembled {} ({} bytes)", destination_.describe(job.final_path), job.total_size);
}
