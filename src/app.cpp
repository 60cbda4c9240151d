#include "app.hpp"

#include <fmt/format.h>

#include "command_line_parser.hpp"
#include "errors.hpp"
#include "settings_manager.hpp"
#include "utils.hpp"

std::string format_summary(const TransferSummary& summary) {
  const double seconds = std::chrono::duration<double>(summary.elapsed).count();
  const double rate = seconds > 0.0 ? static_cast<double>(summary.bytes) / seconds : 0.0;
  auto line = fmt::format("Transferred {} bytes in {} chunk{} to {} ({:.2f}s, {}/s)",
                          summary.bytes,
                          summary.chunks,
                          summary.chunks == 1 ? "" : "s",
                          summary.final_location,
                          seconds,
                          format_bytes(static_cast<std::uint64_t>(rate)));
  if(summary.sha256) {
    line += "\nsha256 " + *summary.sha256;
  }
  return line;
}

int run_app(int argc, char* argv[], const AppHooks& hooks) {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  return run_app(args, hooks);
}

int run_app(const std::vector<std::string>& args, const AppHooks& hooks) {
  auto logger = hooks.logger ? hooks.logger : std::make_shared<Logger>("zap");
  auto settings = std::make_shared<SettingsManager>();
  if(hooks.load_settings_file) {
    settings->load();
  }

  CommandLineParser parser("zap");
  try {
    parser.parse(args, *settings);
  } catch(const UsageError& e) {
    init(false, false);
    logger->write(LogChannel::PrintErr, "zap: {}", e.what());
    parser.usage(true);
    return e.exit_code();
  }
  if(settings->help_requested()) {
    parser.usage();
    return 0;
  }

  const bool quiet = settings->get<bool>("quiet");
  init(settings->get<bool>("verbose") && !quiet, quiet);

  TransferEngine::Options options;
  options.remote_site_factory = hooks.remote_site_factory;
  options.progress_out = hooks.progress_out;
  options.logger = logger;
  TransferEngine engine(settings, options);

  try {
    auto summary = engine.run();
    if(!quiet) {
      logger->write(LogChannel::Print, "{}", format_summary(summary));
    }
    return 0;
  } catch(const TransferError& e) {
    logger->write(LogChannel::PrintErr, "{} failed: {}", stage_name(e.stage()), e.what());
    if(e.exhausted_chunks() > 0) {
      logger->write(LogChannel::PrintErr, "{} chunk(s) exhausted retries", e.exhausted_chunks());
    }
    return e.exit_code();
  } catch(const ZapError& e) {
    logger->write(LogChannel::PrintErr, "{} failed: {}", stage_name(e.stage()), e.what());
    return e.exit_code();
  }
}
