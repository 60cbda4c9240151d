#include "transfer_job.hpp"

#include <fmt/format.h>

std::string chunk_artifact_path(const std::string& final_path, std::size_t index) {
  return fmt::format("{}{}{:05d}", final_path, kChunkArtifactInfix, index);
}

std::string partial_path(const std::string& final_path) {
  return final_path + kPartialSuffix;
}
