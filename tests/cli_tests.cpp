#include "app.hpp"
#include "command_line_parser.hpp"
#include "errors.hpp"
#include "local_site.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"
#include "transfer_engine.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

using zap::test::TestCase;
using zap::test::TestContext;
using zap::test::ScratchDir;
using zap::test::read_file;
using zap::test::write_file;

class RefusingSite : public LocalSite {
public:
  std::unique_ptr<ArtifactWriter> create_artifact(const std::string&) override {
    throw TransferError("permission denied");
  }
};

struct AppRun {
  int exit_code = -1;
  std::shared_ptr<Logger> logger = std::make_shared<Logger>("zap");
  std::ostringstream progress;
};

template<typename SiteT = LocalSite>
int run(TestContext& ctx, AppRun& out, const std::vector<std::string>& args) {
  ctx.logs.attach(out.logger);
  AppHooks hooks;
  hooks.load_settings_file = false;
  hooks.remote_site_factory = [](const Endpoint&, const TransferRequest&, Logger*) -> std::unique_ptr<Site> {
    return std::make_unique<SiteT>();
  };
  hooks.progress_out = &out.progress;
  hooks.logger = out.logger;
  out.exit_code = run_app(args, hooks);
  return out.exit_code;
}

bool parse_ok(const std::vector<std::string>& args, SettingsManager& settings) {
  CommandLineParser parser("zap");
  try {
    parser.parse(args, settings);
  } catch(const UsageError&) {
    return false;
  }
  return true;
}

bool test_options_and_positionals(TestContext&) {
  SettingsManager settings;
  bool ok = parse_ok({"-s", "8", "--port=2222", "-r", "5", "-V", "-i", "/keys/id", "a.bin", "host:/x"}, settings);
  return ok &&
         settings.get<std::uint64_t>("streams") == 8 &&
         settings.get<std::uint64_t>("port") == 2222 &&
         settings.get<std::uint64_t>("retries") == 5 &&
         settings.get<bool>("verify") &&
         !settings.get<bool>("verbose") &&
         settings.get<std::string>("identity") == "/keys/id" &&
         settings.get<std::string>("source") == "a.bin" &&
         settings.get<std::string>("destination") == "host:/x";
}

bool test_defaults(TestContext&) {
  SettingsManager settings;
  return settings.get<std::uint64_t>("streams") == 20 &&
         settings.get<std::uint64_t>("port") == 22 &&
         settings.get<std::uint64_t>("retries") == 3 &&
         settings.get<bool>("progress") &&
         !settings.get<bool>("quiet");
}

bool test_ssh_key_path_alias(TestContext&) {
  SettingsManager settings;
  return parse_ok({"--ssh_key_path", "/k", "a", "h:/b"}, settings) &&
         settings.get<std::string>("identity") == "/k";
}

bool test_bad_tokens_are_usage_errors(TestContext&) {
  SettingsManager settings;
  return !parse_ok({"-p", "abc", "a", "h:/b"}, settings) &&
         !parse_ok({"-p", "-1", "a", "h:/b"}, settings) &&
         !parse_ok({"-s", "2.5", "a", "h:/b"}, settings) &&
         !parse_ok({"--bogus", "a", "h:/b"}, settings) &&
         !parse_ok({"-x", "a", "h:/b"}, settings) &&
         !parse_ok({"a"}, settings) &&
         !parse_ok({"a", "h:/b", "extra"}, settings) &&
         !parse_ok({"-p"}, settings);
}

bool test_settings_file(TestContext&) {
  ScratchDir dir("cli");
  const auto path = dir / "settings.json";
  write_file(path, R"({"streams": 6, "ssh_key_path": "/from/file", "source": "ignored", "nonsense": 1, "port": "x"})");
  SettingsManager settings;
  settings.set_settings_path(path);
  bool loaded = settings.load();
  std::string error;
  const bool json_port = settings.set_from_json("port", nlohmann::json(2200), error);
  const bool json_negative = settings.set_from_json("retries", nlohmann::json(-1), error);
  return loaded &&
         json_port && !json_negative && !error.empty() &&
         settings.get<std::uint64_t>("retries") == 3 &&
         settings.get<std::uint64_t>("streams") == 6 &&
         settings.get<std::string>("identity") == "/from/file" &&
         settings.get<std::string>("source").empty() &&
         settings.get<std::uint64_t>("port") == 2200;
}

bool test_only_declared_types_convert(TestContext&) {
  const auto specification = nlohmann::json::array({
    {{"key","count"}, {"type","uint"}, {"default",1}},
    {{"key","offset"}, {"type","int"}, {"default",0}}
  });
  SettingsManager settings(specification);
  std::string uint_error, int_error, json_error;
  const bool uint_ok = settings.set_from_string("count", "7", uint_error);
  const bool int_ok = settings.set_from_string("offset", "-3", int_error);
  const bool json_ok = settings.set_from_json("offset", nlohmann::json(-3), json_error);
  return uint_ok && settings.get<std::uint64_t>("count") == 7 &&
         !int_ok && int_error == "unsupported type 'int'" &&
         !json_ok && json_error == "unsupported type 'int'" &&
         settings.get<int>("offset") == 0;
}

bool test_port_range(TestContext& ctx) {
  AppRun zero, high, negative, word;
  run(ctx, zero, {"-p", "0", "a.bin", "h:/x"});
  run(ctx, high, {"-p", "65536", "a.bin", "h:/x"});
  run(ctx, negative, {"-p", "-1", "a.bin", "h:/x"});
  run(ctx, word, {"-p", "abc", "a.bin", "h:/x"});
  return zero.exit_code == 1 &&
         high.exit_code == 1 &&
         negative.exit_code == 2 &&
         word.exit_code == 2 &&
         ctx.logs.contains("validation failed: Port 0") &&
         ctx.logs.contains("zap: Invalid value for option 'p'");
}

bool test_usage_exit_codes(TestContext& ctx) {
  AppRun missing, unknown, help;
  run(ctx, missing, {"only-one"});
  run(ctx, unknown, {"--frobnicate", "a", "h:/b"});
  run(ctx, help, {"--help"});
  return missing.exit_code == 2 &&
         unknown.exit_code == 2 &&
         help.exit_code == 0 &&
         ctx.logs.contains("Missing required argument <destination>");
}

bool test_endpoint_errors(TestContext& ctx) {
  AppRun both_local, malformed, both_remote, zero_streams;
  run(ctx, both_local, {"a.bin", "b.bin"});
  run(ctx, malformed, {"a.bin", "user@2001:db8::1:/path"});
  run(ctx, both_remote, {"h1:/a", "h2:/b"});
  run(ctx, zero_streams, {"-s", "0", "a.bin", "h:/b"});
  return both_local.exit_code == 1 &&
         malformed.exit_code == 1 &&
         both_remote.exit_code == 1 &&
         zero_streams.exit_code == 1 &&
         ctx.logs.contains("validation failed: Both source and destination are local") &&
         ctx.logs.contains("validation failed: Both source and destination are remote");
}

bool test_push_succeeds(TestContext& ctx) {
  ScratchDir dir("cli");
  const auto source = dir / "send.bin";
  const auto data = zap::test::make_pattern(12345, 9);
  write_file(source, data);
  const auto target = dir / "received.bin";

  AppRun app;
  run(ctx, app, {"-s", "4", "-rd", "0", "-V", source, "loopback:" + target});
  return app.exit_code == 0 &&
         read_file(target) == data &&
         ctx.logs.contains("Transferred 12345 bytes in 4 chunks to " + target) &&
         ctx.logs.contains("sha256 ") &&
         app.progress.str().find("100.0%") != std::string::npos;
}

bool test_quiet_suppresses_summary(TestContext& ctx) {
  ScratchDir dir("cli");
  const auto source = dir / "send.bin";
  write_file(source, "payload");

  AppRun app;
  run(ctx, app, {"-q", source, "loopback:" + (dir / "out.bin")});
  init(false, false);
  return app.exit_code == 0 &&
         !ctx.logs.contains("Transferred") &&
         app.progress.str().empty();
}

bool test_exhausted_retries_reported(TestContext& ctx) {
  ScratchDir dir("cli");
  const auto source = dir / "send.bin";
  write_file(source, zap::test::make_pattern(100));

  AppRun app;
  run<RefusingSite>(ctx, app, {"-s", "2", "-r", "1", "-rd", "0", "-P", "false",
                               source, "loopback:" + (dir / "out.bin")});
  return app.exit_code == 1 &&
         ctx.logs.contains("transfer failed: chunk") &&
         ctx.logs.contains("permission denied") &&
         ctx.logs.contains("exhausted retries");
}

bool test_summary_format(TestContext&) {
  TransferSummary summary;
  summary.final_location = "host:/srv/f";
  summary.bytes = 10;
  summary.chunks = 1;
  summary.elapsed = std::chrono::seconds(2);
  const auto line = format_summary(summary);
  return line.rfind("Transferred 10 bytes in 1 chunk to host:/srv/f (2.00s, ", 0) == 0 &&
         line.find("sha256") == std::string::npos;
}

bool test_log_levels(TestContext&) {
  const auto normal = log_levels(false, false);
  const auto verbose = log_levels(true, false);
  const auto quiet = log_levels(false, true);
  return normal.info == spdlog::level::info &&
         normal.error == spdlog::level::warn &&
         verbose.info == spdlog::level::debug &&
         quiet.info == spdlog::level::off &&
         quiet.print == spdlog::level::off &&
         quiet.error == spdlog::level::warn &&
         quiet.print_err == spdlog::level::info &&
         log_channel_level(LogChannel::Warn) >= quiet.error;
}

bool test_channel_names_reach_listeners(TestContext&) {
  auto parent = std::make_shared<Logger>("zap");
  auto worker = parent->child("worker");
  std::vector<std::string> seen;
  auto handle = parent->add_listener(
    [&seen](void*, const std::string& channel, spdlog::level::level_enum level, const std::string& message) {
      seen.push_back(channel + "|" + std::to_string(static_cast<int>(level)) + "|" + message);
      return true;
    });
  log_warn(worker.get(), "retry {} of {}", 1, 3);
  parent->write(LogChannel::PrintErr, "{}", "bye");
  parent->remove_listener(handle);
  return seen.size() == 2 &&
         seen[0] == "zap/worker:warn|" + std::to_string(static_cast<int>(spdlog::level::warn)) + "|retry 1 of 3" &&
         seen[1] == "zap:print_err|" + std::to_string(static_cast<int>(spdlog::level::err)) + "|bye";
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"options_and_positionals", test_options_and_positionals},
    {"defaults", test_defaults},
    {"ssh_key_path_alias", test_ssh_key_path_alias},
    {"bad_tokens_are_usage_errors", test_bad_tokens_are_usage_errors},
    {"settings_file", test_settings_file},
    {"only_declared_types_convert", test_only_declared_types_convert},
    {"port_range", test_port_range},
    {"usage_exit_codes", test_usage_exit_codes},
    {"endpoint_errors", test_endpoint_errors},
    {"push_succeeds", test_push_succeeds},
    {"quiet_suppresses_summary", test_quiet_suppresses_summary},
    {"exhausted_retries_reported", test_exhausted_retries_reported},
    {"summary_format", test_summary_format},
    {"log_levels", test_log_levels},
    {"channel_names_reach_listeners", test_channel_names_reach_listeners}
  };
  return zap::test::run_test_cases("cli", tests, argc, argv);
}
