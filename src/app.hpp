#pragma once

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "transfer_engine.hpp"

struct AppHooks {
  bool load_settings_file = true;
  TransferEngine::SiteFactory remote_site_factory;
  std::ostream* progress_out = &std::cout;
  // Receives every user-facing line; tests attach listeners here.
  std::shared_ptr<Logger> logger;
};

// Full command-line run: settings file, argv, transfer, report. Returns the
// process exit code (0 success, 1 validation/transfer/assembly, 2 usage).
int run_app(const std::vector<std::string>& args, const AppHooks& hooks = {});
int run_app(int argc, char* argv[], const AppHooks& hooks = {});

std::string format_summary(const TransferSummary& summary);
