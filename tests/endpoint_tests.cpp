#include "endpoint.hpp"
#include "errors.hpp"
#include "test_runner_utils.hpp"

#include <optional>
#include <string>
#include <variant>

namespace {

using zap::test::TestCase;
using zap::test::TestContext;

bool is_local(const std::string& text) {
  return std::holds_alternative<LocalSpecifier>(parse_specifier(text));
}

bool is_malformed(const std::string& text) {
  return std::holds_alternative<MalformedSpecifier>(parse_specifier(text));
}

std::optional<RemoteSpecifier> as_remote(const std::string& text) {
  auto parsed = parse_specifier(text);
  if(const auto* remote = std::get_if<RemoteSpecifier>(&parsed)) return *remote;
  return std::nullopt;
}

template<typename Fn>
bool throws_validation(Fn&& fn) {
  try {
    fn();
  } catch(const ValidationError&) {
    return true;
  }
  return false;
}

bool test_user_host_path(TestContext&) {
  auto remote = as_remote("user@host:/path");
  return remote && remote->user && *remote->user == "user" &&
         remote->host == "host" && remote->path == "/path" && !remote->bracketed;
}

bool test_host_without_user(TestContext&) {
  auto remote = as_remote("example.org:data/file.bin");
  return remote && !remote->user && remote->host == "example.org" && remote->path == "data/file.bin";
}

bool test_empty_path_rejected(TestContext&) {
  EndpointResolver resolver;
  return is_malformed("host:") &&
         throws_validation([&]{ resolver.resolve("host:", "/tmp"); });
}

bool test_bracketed_ipv6(TestContext&) {
  auto remote = as_remote("[::1]:/p");
  auto scoped = as_remote("me@[fe80::1%eth0]:/srv/f");
  return remote && remote->host == "::1" && remote->path == "/p" && remote->bracketed &&
         scoped && scoped->host == "fe80::1%eth0" && scoped->user && *scoped->user == "me";
}

bool test_unbracketed_ipv6_rejected(TestContext&) {
  return is_malformed("user@2001:db8::1:/path") && is_malformed("::1:/p");
}

bool test_drive_letter_is_local(TestContext&) {
  return is_local("C:\\Users\\f.txt") && is_local("c:/x") && is_local("D:") &&
         is_drive_letter_path("C:\\Users\\f.txt") && !is_drive_letter_path("user@C:/x");
}

bool test_drive_letter_with_user_is_remote(TestContext&) {
  auto remote = as_remote("user@C:/x");
  return remote && remote->host == "C" && remote->path == "/x";
}

bool test_unc_is_local(TestContext&) {
  return is_local("\\\\server\\share\\f") && is_unc_path("\\\\server\\share\\f") && !is_unc_path("\\x");
}

bool test_plain_paths_are_local(TestContext&) {
  return is_local("file.bin") && is_local("./a:b") && is_local("/x/y:z") && is_local("relative/dir/f");
}

bool test_at_sign_rules(TestContext&) {
  return is_malformed("a@b@host:/p") &&
         is_malformed("@host:/p") &&
         is_malformed("user@:/p") &&
         is_malformed("user@host");
}

bool test_bracket_rules(TestContext&) {
  return is_malformed("[::1:/p") &&
         is_malformed("host]:/p") &&
         is_malformed("[::1]x:/p") &&
         is_malformed("[zz]:/p") &&
         is_malformed("[]:/p") &&
         is_malformed("[[::1]]:/p");
}

bool test_colon_in_path(TestContext&) {
  auto ok = as_remote("host:/path:sub");
  return ok && ok->path == "/path:sub" &&
         is_malformed("host:path:extra") &&
         is_malformed("host::/path");
}

bool test_whitespace_and_length(TestContext&) {
  std::string long_host(kMaxHostLength + 1, 'a');
  std::string max_host(kMaxHostLength, 'a');
  std::string long_user(kMaxUserLength + 1, 'u');
  return is_malformed("host:/pa th") &&
         is_malformed("host:/pa\tth") &&
         is_malformed("ho st:/p") &&
         is_malformed("us er@host:/p") &&
         is_malformed(long_host + ":/p") &&
         as_remote(max_host + ":/p").has_value() &&
         is_malformed(long_user + "@host:/p") &&
         is_malformed("ho$t:/p");
}

bool test_both_local_rejected(TestContext&) {
  EndpointResolver resolver;
  bool threw = false;
  try {
    resolver.resolve("a.bin", "b.bin");
  } catch(const ValidationError& e) {
    threw = std::string(e.what()).find("Both source and destination are local") != std::string::npos;
  }
  return threw;
}

bool test_both_remote_rejected(TestContext&) {
  EndpointResolver resolver;
  std::string message;
  try {
    resolver.resolve("h1:/x", "alice@h2:/y");
  } catch(const ValidationError& e) {
    message = e.what();
  }
  // Single-letter hosts read as drive letters, so "a:/x" is a local path.
  bool drive_letters_are_local = false;
  try {
    resolver.resolve("a:/x", "b:/y");
  } catch(const ValidationError& e) {
    drive_letters_are_local = std::string(e.what()).find("Both source and destination are local") != std::string::npos;
  }
  return message.find("Both source and destination are remote") != std::string::npos &&
         drive_letters_are_local;
}

bool test_direction_and_port(TestContext&) {
  EndpointResolver::Options options;
  options.port = 2222;
  options.default_user = "deploy";
  EndpointResolver resolver(options);

  auto push = resolver.resolve("local.bin", "host:/srv/");
  auto pull = resolver.resolve("alice@[::1]:/srv/f", "/tmp");
  return push.direction == Direction::Push &&
         !push.source.is_remote() && !push.source.user && !push.source.host && push.source.port == 0 &&
         push.destination.is_remote() && push.destination.port == 2222 &&
         push.destination.user && *push.destination.user == "deploy" &&
         pull.direction == Direction::Pull &&
         pull.source.user && *pull.source.user == "alice" &&
         pull.source.to_string() == "alice@[::1]:/srv/f" &&
         pull.destination.path == "/tmp";
}

bool test_local_path_checks(TestContext&) {
  zap::test::ScratchDir dir("endpoint");
  const auto file = dir / "source.bin";
  zap::test::write_file(file, "abc");
  const auto missing = dir / "missing.bin";
  EndpointResolver resolver;

  bool ok = true;
  EndpointResolver::check_local_paths(resolver.resolve(file, "host:/x"), "");
  EndpointResolver::check_local_paths(resolver.resolve("host:/x", dir.path().string()), file);

  ok = ok && throws_validation([&]{
    EndpointResolver::check_local_paths(resolver.resolve(missing, "host:/x"), "");
  });
  ok = ok && throws_validation([&]{
    EndpointResolver::check_local_paths(resolver.resolve(dir.path().string(), "host:/x"), "");
  });
  ok = ok && throws_validation([&]{
    EndpointResolver::check_local_paths(resolver.resolve("host:/x", file), "");
  });
  ok = ok && throws_validation([&]{
    EndpointResolver::check_local_paths(resolver.resolve("host:/x", missing), "");
  });
  ok = ok && throws_validation([&]{
    EndpointResolver::check_local_paths(resolver.resolve(file, "host:/x"), dir.path().string());
  });
  ok = ok && throws_validation([&]{
    EndpointResolver::check_local_paths(resolver.resolve(file, "host:/x"), missing);
  });
  return ok;
}

bool test_port_zero_rejected(TestContext&) {
  EndpointResolver::Options options;
  options.port = 0;
  EndpointResolver resolver(options);
  return throws_validation([&]{ resolver.resolve("a.bin", "host:/x"); });
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"user_host_path", test_user_host_path},
    {"host_without_user", test_host_without_user},
    {"empty_path_rejected", test_empty_path_rejected},
    {"bracketed_ipv6", test_bracketed_ipv6},
    {"unbracketed_ipv6_rejected", test_unbracketed_ipv6_rejected},
    {"drive_letter_is_local", test_drive_letter_is_local},
    {"drive_letter_with_user_is_remote", test_drive_letter_with_user_is_remote},
    {"unc_is_local", test_unc_is_local},
    {"plain_paths_are_local", test_plain_paths_are_local},
    {"at_sign_rules", test_at_sign_rules},
    {"bracket_rules", test_bracket_rules},
    {"colon_in_path", test_colon_in_path},
    {"whitespace_and_length", test_whitespace_and_length},
    {"both_local_rejected", test_both_local_rejected},
    {"both_remote_rejected", test_both_remote_rejected},
    {"direction_and_port", test_direction_and_port},
    {"local_path_checks", test_local_path_checks},
    {"port_zero_rejected", test_port_zero_rejected}
  };
  return zap::test::run_test_cases("endpoint", tests, argc, argv);
}
