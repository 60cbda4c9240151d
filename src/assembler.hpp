#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "site.hpp"
#include "transfer_job.hpp"

class Logger;

// Joins the chunk artifacts of a completed job, in index order, into a
// staging file beside the final path, checks its size against the job total,
// renames it into place and removes the artifacts. On any failure the staging
// file and all artifacts are left where they are and AssemblyError is thrown.
class Assembler {
public:
  explicit Assembler(Site& destination, Logger* logger = nullptr);

  void assemble(const TransferJob& job);

  static std::vector<std::string> artifact_paths(const TransferJob& job);

private:
  Site& destination_;
  Logger* logger_;
};
