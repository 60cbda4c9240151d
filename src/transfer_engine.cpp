#include "transfer_engine.hpp"

#include <algorithm>
#include <filesystem>
#include <limits>

#include "assembler.hpp"
#include "errors.hpp"
#include "local_site.hpp"
#include "orchestrator.hpp"
#include "progress_meter.hpp"
#include "range_planner.hpp"
#include "remote_site.hpp"
#include "settings_manager.hpp"
#include "transfer_worker.hpp"
#include "utils.hpp"

namespace {

constexpr std::uint64_t kMaxBufferKb = 1024 * 1024;

std::uint64_t get_uint(const SettingsManager& settings, const char* key) {
  return settings.get<std::uint64_t>(key);
}

}

TransferRequest TransferRequest::from_settings(const SettingsManager& settings) {
  TransferRequest request;
  request.source = settings.get<std::string>("source");
  request.destination = settings.get<std::string>("destination");

  const auto port = get_uint(settings, "port");
  if(port < 1 || port > 65535) {
    throw ValidationError("Port " + std::to_string(port) + " is out of range 1..65535");
  }
  request.port = static_cast<std::uint16_t>(port);

  const auto streams = get_uint(settings, "streams");
  if(streams < 1) {
    throw ValidationError("Stream count must be at least 1");
  }
  request.streams = static_cast<std::size_t>(std::min<std::uint64_t>(streams, std::numeric_limits<std::size_t>::max()));

  const auto retries = get_uint(settings, "retries");
  if(retries > std::numeric_limits<std::uint32_t>::max()) {
    throw ValidationError("Retry count " + std::to_string(retries) + " is too large");
  }
  request.max_retries = static_cast<std::uint32_t>(retries);

  const auto timeout = get_uint(settings, "timeout_s");
  if(timeout < 1 || timeout > 86400) {
    throw ValidationError("Timeout must be between 1 and 86400 seconds");
  }
  request.timeout = std::chrono::seconds(static_cast<std::int64_t>(timeout));

  const auto buffer_kb = get_uint(settings, "buffer_kb");
  if(buffer_kb < 1 || buffer_kb > kMaxBufferKb) {
    throw ValidationError("Buffer size must be between 1 and " + std::to_string(kMaxBufferKb) + " KiB");
  }
  request.buffer_size = static_cast<std::size_t>(buffer_kb * 1024);

  const auto base_delay = get_uint(settings, "retry_delay_ms");
  const auto max_delay = get_uint(settings, "retry_max_delay_ms");
  constexpr std::uint64_t kMaxDelayMs = 24ull * 3600 * 1000;
  if(base_delay > kMaxDelayMs || max_delay > kMaxDelayMs) {
    throw ValidationError("Retry delays must not exceed one day");
  }
  request.retry_base_delay = std::chrono::milliseconds(static_cast<std::int64_t>(base_delay));
  request.retry_max_delay = std::chrono::milliseconds(static_cast<std::int64_t>(max_delay));

  request.user = settings.get<std::string>("user");
  request.identity_file = settings.get<std::string>("identity");
  request.known_hosts = settings.get<std::string>("known_hosts");
  request.strict_host_keys = settings.get<bool>("strict_host_keys");
  request.verify = settings.get<bool>("verify");
  request.show_progress = settings.get<bool>("progress") && !settings.get<bool>("quiet");
  return request;
}

TransferEngine::TransferEngine(std::shared_ptr<SettingsManager> settings, Options options)
  : settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    options_(std::move(options)),
    logger_(options_.logger ? options_.logger : std::make_shared<Logger>("zap")) {
  if(!options_.remote_site_factory) {
    options_.remote_site_factory = ssh_site_factory();
  }
}

TransferEngine::TransferEngine(std::shared_ptr<SettingsManager> settings)
  : TransferEngine(std::move(settings), Options{}) {}

LogListenerHandle TransferEngine::add_log_listener(Logger::Listener listener, void* user_data) {
  return logger_->add_listener(std::move(listener), user_data);
}

void TransferEngine::remove_log_listener(LogListenerHandle handle) {
  if(handle != 0) {
    logger_->remove_listener(handle);
  }
}

TransferEngine::SiteFactory TransferEngine::ssh_site_factory() {
  return [](const Endpoint& remote, const TransferRequest& request, Logger* logger) -> std::unique_ptr<Site> {
    SshOptions ssh;
    ssh.host = remote.host.value_or("");
    ssh.port = remote.port;
    ssh.user = remote.user.value_or(request.user);
    ssh.identity_file = request.identity_file;
    ssh.known_hosts = request.known_hosts;
    ssh.strict_host_keys = request.strict_host_keys;
    ssh.timeout = request.timeout;
    return std::make_unique<RemoteSite>(std::move(ssh), logger);
  };
}

std::string TransferEngine::resolve_final_path(const ResolvedEndpoints& endpoints, Site& remote) const {
  if(endpoints.direction == Direction::Pull) {
    const auto name = posix_basename(endpoints.source.path);
    if(name.empty() || name == "." || name == "..") {
      throw ValidationError("Remote source '" + endpoints.source.to_string() + "' does not name a file");
    }
    return (std::filesystem::path(endpoints.destination.path) / name).string();
  }

  const auto& target = endpoints.destination.path;
  const auto source_name = local_basename(endpoints.source.path);
  if(target.back() == '/') {
    return posix_join(target, source_name);
  }
  auto st = remote.stat(target);
  if(st.exists && st.directory) {
    return posix_join(target, source_name);
  }
  return target;
}

TransferSummary TransferEngine::run() {
  return execute(TransferRequest::from_settings(*settings_));
}

TransferSummary TransferEngine::execute(const TransferRequest& request) {
  const auto started = std::chrono::steady_clock::now();

  EndpointResolver::Options resolver_options;
  resolver_options.port = request.port;
  resolver_options.default_user = request.user;
  EndpointResolver resolver(resolver_options);
  auto endpoints = resolver.resolve(request.source, request.destination);
  EndpointResolver::check_local_paths(endpoints, request.identity_file);

  const bool pull = endpoints.direction == Direction::Pull;
  const Endpoint& remote_endpoint = pull ? endpoints.source : endpoints.destination;
  log_debug(logger_.get(), "{} {} -> {}", direction_name(endpoints.direction),
            endpoints.source.to_string(), endpoints.destination.to_string());

  LocalSite local;
  auto remote = options_.remote_site_factory(remote_endpoint, request, logger_.get());
  if(!remote) {
    throw TransferError("No site available for " + remote_endpoint.to_string());
  }
  Site& source_site = pull ? *remote : static_cast<Site&>(local);
  Site& destination_site = pull ? static_cast<Site&>(local) : *remote;

  TransferJob job;
  job.source = endpoints.source;
  job.destination = endpoints.destination;
  job.direction = endpoints.direction;
  job.max_retries = request.max_retries;

  auto source_stat = source_site.stat(endpoints.source.path);
  if(!source_stat.exists) {
    throw ValidationError("Source '" + endpoints.source.to_string() + "' does not exist");
  }
  if(!source_stat.regular) {
    throw ValidationError("Source '" + endpoints.source.to_string() + "' is not a regular file");
  }
  job.total_size = source_stat.size;
  job.final_path = resolve_final_path(endpoints, *remote);
  job.chunks = plan_ranges(job.total_size, request.streams);
  remote->release_idle_connections();

  log_debug(logger_.get(), "{} {} in {} chunk(s) of up to {} to {}",
            pull ? "Pulling" : "Pushing",
            format_bytes(job.total_size),
            job.chunks.size(),
            format_bytes(planned_chunk_length(job.total_size, request.streams)),
            destination_site.describe(job.final_path));

  auto worker_logger = logger_->child("worker");
  TransferWorker worker(source_site, endpoints.source.path,
                        destination_site, job.final_path,
                        request.buffer_size, worker_logger.get());

  OrchestratorConfig config;
  config.stream_count = request.streams;
  config.max_retries = request.max_retries;
  config.retry_base_delay = request.retry_base_delay;
  config.retry_max_delay = request.retry_max_delay;
  config.enable_meter = request.show_progress && options_.progress_out != nullptr;

  std::unique_ptr<ProgressMeter> meter;
  OrchestratorMeterCallback meter_callback;
  if(config.enable_meter) {
    meter = std::make_unique<ProgressMeter>(local_basename(job.final_path), job.total_size, 40, *options_.progress_out);
    meter_callback = [&meter](const std::vector<Chunk>& chunks, std::uint64_t bytes_done, bool force){
      meter->update(chunks, bytes_done, force);
    };
  }

  auto orchestrator_logger = logger_->child("orchestrator");
  Orchestrator orchestrator(config, worker.as_attempt(), meter_callback, orchestrator_logger.get());
  auto result = orchestrator.run(job.chunks);
  if(meter) meter->finish();
  job.outcome = result.outcome;
  job.failure_reason = result.failure_reason;
  if(result.outcome != JobOutcome::Completed) {
    throw TransferError(result.failure_reason, result.exhausted_chunks);
  }

  auto assembler_logger = logger_->child("assembler");
  Assembler assembler(destination_site, assembler_logger.get());
  assembler.assemble(job);

  TransferSummary summary;
  summary.direction = job.direction;
  summary.final_path = job.final_path;
  summary.final_location = destination_site.describe(job.final_path);
  summary.bytes = job.total_size;
  summary.chunks = job.chunks.size();

  if(request.verify) {
    const auto source_digest = source_site.sha256(endpoints.source.path);
    const auto result_digest = destination_site.sha256(job.final_path);
    if(source_digest != result_digest) {
      throw AssemblyError("SHA-256 mismatch for " + summary.final_location + ": source " +
                          source_digest + ", result " + result_digest + " (file left in place)");
    }
    log_debug(logger_.get(), "sha256 {} verified", result_digest);
    summary.sha256 = result_digest;
  }

  summary.elapsed = std::chrono::steady_clock::now() - started;
  return summary;
}
