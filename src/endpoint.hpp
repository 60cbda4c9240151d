#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

enum class Locality { Local, Remote };
enum class Direction { Push, Pull };

const char* direction_name(Direction direction);

// One side of a transfer after resolution. Remote endpoints always carry a
// host and a non-empty path; local endpoints never carry user/host/port.
struct Endpoint {
  Locality locality = Locality::Local;
  std::optional<std::string> user;
  std::optional<std::string> host;
  std::uint16_t port = 0;
  std::string path;

  bool is_remote() const { return locality == Locality::Remote; }

  // Renders back to specifier form; IPv6 hosts are bracketed again.
  std::string to_string() const;
};

// Outcome of scanning a single specifier, before any cross-checking of the
// pair. The scanner never throws.
struct LocalSpecifier {
  std::string path;
};

struct RemoteSpecifier {
  std::optional<std::string> user;
  std::string host;
  bool bracketed = false;
  std::string path;
};

struct MalformedSpecifier {
  std::string reason;
};

using SpecifierParse = std::variant<LocalSpecifier, RemoteSpecifier, MalformedSpecifier>;

inline constexpr std::size_t kMaxHostLength = 255;
inline constexpr std::size_t kMaxUserLength = 255;

// "C:\dir\file", "c:/x", "D:" (one letter, a colon, no '@' anywhere).
bool is_drive_letter_path(const std::string& text);
// "\\server\share\file"
bool is_unc_path(const std::string& text);

SpecifierParse parse_specifier(const std::string& text);

struct ResolvedEndpoints {
  Endpoint source;
  Endpoint destination;
  Direction direction = Direction::Push;
};

class EndpointResolver {
public:
  struct Options {
    std::uint16_t port = 22;
    std::string default_user;
  };

  EndpointResolver();
  explicit EndpointResolver(Options options);

  // Throws ValidationError for malformed specifiers and for pairs that are
  // not exactly one local plus one remote.
  ResolvedEndpoints resolve(const std::string& source, const std::string& destination) const;

  // Existence/type checks on the local side: a local source must be a regular
  // file, a local destination must be a directory, and a non-empty identity
  // path must be a regular file. Throws ValidationError.
  static void check_local_paths(const ResolvedEndpoints& endpoints,
                                const std::string& identity_file);

private:
  Endpoint to_endpoint(const SpecifierParse& parsed,
                       const std::string& role,
                       const std::string& text) const;

  Options options_;
};
