#pragma once

#include "site.hpp"

// Site backed by the local filesystem. Readers use pread() so any number of
// workers can read disjoint ranges of the same file through separate
// descriptors.
class LocalSite : public Site {
public:
  FileStat stat(const std::string& path) override;
  std::unique_ptr<RangeReader> open_range(const std::string& path,
                                          std::uint64_t offset,
                                          std::uint64_t length) override;
  std::unique_ptr<ArtifactWriter> create_artifact(const std::string& path) override;
  void concatenate(const std::vector<std::string>& parts, const std::string& target) override;
  void rename(const std::string& from, const std::string& to) override;
  void remove(const std::string& path) override;
  std::string sha256(const std::string& path) override;
  std::string describe(const std::string& path) const override;
};
