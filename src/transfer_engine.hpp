#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "endpoint.hpp"
#include "log.hpp"
#include "site.hpp"
#include "transfer_job.hpp"

class SettingsManager;

// Settings after range checks, in the units the modules want.
struct TransferRequest {
  std::string source;
  std::string destination;
  std::size_t streams = 20;
  std::uint32_t max_retries = 3;
  std::uint16_t port = 22;
  std::string user;
  std::string identity_file;
  std::string known_hosts;
  bool strict_host_keys = false;
  std::chrono::seconds timeout{30};
  std::size_t buffer_size = 1024 * 1024;
  std::chrono::milliseconds retry_base_delay{1000};
  std::chrono::milliseconds retry_max_delay{30000};
  bool verify = false;
  bool show_progress = true;

  // Throws ValidationError for values that parsed but are out of range.
  static TransferRequest from_settings(const SettingsManager& settings);
};

struct TransferSummary {
  Direction direction = Direction::Push;
  std::string final_path;
  std::string final_location;
  std::uint64_t bytes = 0;
  std::size_t chunks = 0;
  std::chrono::steady_clock::duration elapsed{};
  std::optional<std::string> sha256;
};

// Resolves the endpoints, plans the chunks, drives the orchestrator and hands
// the result to the assembler. Every failure surfaces as a ZapError subclass
// naming the stage that failed.
class TransferEngine {
public:
  using SiteFactory = std::function<std::unique_ptr<Site>(const Endpoint& remote,
                                                          const TransferRequest& request,
                                                          Logger* logger)>;

  struct Options {
    // Builds the Site for the remote endpoint; defaults to an SSH-backed site.
    SiteFactory remote_site_factory;
    std::ostream* progress_out = &std::cout;
    std::shared_ptr<Logger> logger;
  };

  TransferEngine(std::shared_ptr<SettingsManager> settings, Options options);
  explicit TransferEngine(std::shared_ptr<SettingsManager> settings);

  TransferSummary run();
  TransferSummary execute(const TransferRequest& request);

  LogListenerHandle add_log_listener(Logger::Listener listener, void* user_data = nullptr);
  void remove_log_listener(LogListenerHandle handle);

  static SiteFactory ssh_site_factory();

private:
  std::string resolve_final_path(const ResolvedEndpoints& endpoints, Site& remote) const;

  std::shared_ptr<SettingsManager> settings_;
  Options options_;
  std::shared_ptr<Logger> logger_;
};
