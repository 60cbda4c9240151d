#include "endpoint.hpp"

#include <asio.hpp>

#include <cctype>
#include <filesystem>
#include <system_error>

#include "errors.hpp"

const char* direction_name(Direction direction) {
  return direction == Direction::Push ? "push" : "pull";
}

std::string Endpoint::to_string() const {
  if(locality == Locality::Local) return path;
  std::string out;
  if(user) out += *user + "@";
  const std::string& h = host ? *host : std::string();
  if(h.find(':') != std::string::npos) {
    out += "[" + h + "]";
  } else {
    out += h;
  }
  out += ":" + path;
  return out;
}

namespace {

bool is_space(char c) {
  return c == ' ' || c == '\t';
}

bool has_space_or_control(const std::string& text) {
  for(char c : text) {
    if(is_space(c) || std::iscntrl(static_cast<unsigned char>(c))) return true;
  }
  return false;
}

bool is_hostname_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '-' || c == '_';
}

// scp's rule: anything whose first path segment has no ':' (and no user or
// bracketed host) is a plain local path.
bool head_is_plain_path(const std::string& text) {
  auto slash = text.find('/');
  std::string head = text.substr(0, slash);
  if(head.empty()) return true;
  if(head.front() == '[') return false;
  return head.find(':') == std::string::npos && head.find('@') == std::string::npos;
}

MalformedSpecifier malformed(const std::string& reason) {
  return MalformedSpecifier{reason};
}

SpecifierParse scan_remote(const std::string& text) {
  // Locate the separator colon, counting '@' and tracking brackets along the way.
  std::size_t at_count = 0;
  std::size_t at_pos = std::string::npos;
  std::size_t open_bracket = std::string::npos;
  std::size_t close_bracket = std::string::npos;
  std::size_t separator = std::string::npos;
  bool in_brackets = false;

  for(std::size_t i = 0; i < text.size() && separator == std::string::npos; ++i) {
    char c = text[i];
    if(in_brackets) {
      if(c == '[') return malformed("nested '[' in host");
      if(c == ']') {
        in_brackets = false;
        close_bracket = i;
      }
      continue;
    }
    switch(c) {
      case '[':
        if(open_bracket != std::string::npos) return malformed("more than one bracketed host");
        open_bracket = i;
        in_brackets = true;
        break;
      case ']':
        return malformed("unmatched ']' in host");
      case '@':
        ++at_count;
        at_pos = i;
        break;
      case ':':
        separator = i;
        break;
      default:
        break;
    }
  }

  if(in_brackets) return malformed("unmatched '[' in host");
  if(separator == std::string::npos) return malformed("missing ':' between host and path");
  if(at_count > 1) return malformed("more than one '@'");

  RemoteSpecifier remote;
  std::size_t host_begin = 0;
  if(at_count == 1) {
    std::string user = text.substr(0, at_pos);
    if(user.empty()) return malformed("empty user before '@'");
    if(user.size() > kMaxUserLength) return malformed("user longer than 255 characters");
    if(has_space_or_control(user)) return malformed("whitespace in user");
    if(user.find('[') != std::string::npos || user.find(']') != std::string::npos) {
      return malformed("brackets in user");
    }
    remote.user = std::move(user);
    host_begin = at_pos + 1;
  }

  std::string host_part = text.substr(host_begin, separator - host_begin);
  if(host_part.empty()) return malformed("empty host");

  if(open_bracket != std::string::npos) {
    // The bracketed literal must be the whole host part.
    if(open_bracket != host_begin || close_bracket + 1 != separator) {
      return malformed("misplaced brackets in host");
    }
    std::string literal = text.substr(open_bracket + 1, close_bracket - open_bracket - 1);
    if(literal.empty()) return malformed("empty IPv6 literal");
    std::error_code ec;
    asio::ip::make_address_v6(literal, ec);
    if(ec) return malformed("invalid IPv6 literal '" + literal + "'");
    remote.host = std::move(literal);
    remote.bracketed = true;
  } else {
    for(char c : host_part) {
      if(is_space(c) || std::iscntrl(static_cast<unsigned char>(c))) {
        return malformed("whitespace in host");
      }
      if(!is_hostname_char(c)) {
        return malformed(std::string("invalid character '") + c + "' in host");
      }
    }
    remote.host = std::move(host_part);
  }
  if(remote.host.size() > kMaxHostLength) return malformed("host longer than 255 characters");

  std::string path = text.substr(separator + 1);
  if(path.empty()) return malformed("empty path");
  if(has_space_or_control(path)) return malformed("whitespace in path");
  auto first_slash = path.find('/');
  auto first_colon = path.find(':');
  if(first_colon != std::string::npos && first_colon < first_slash) {
    return malformed("ambiguous ':' after host (unbracketed IPv6 literal?)");
  }
  remote.path = std::move(path);
  return remote;
}

} // namespace

bool is_drive_letter_path(const std::string& text) {
  if(text.size() < 2) return false;
  if(!std::isalpha(static_cast<unsigned char>(text[0])) || text[1] != ':') return false;
  return text.find('@') == std::string::npos;
}

bool is_unc_path(const std::string& text) {
  return text.size() >= 2 && text[0] == '\\' && text[1] == '\\';
}

SpecifierParse parse_specifier(const std::string& text) {
  if(text.empty()) return malformed("empty specifier");
  if(is_unc_path(text)) return LocalSpecifier{text};
  if(is_drive_letter_path(text)) return LocalSpecifier{text};
  if(head_is_plain_path(text)) return LocalSpecifier{text};
  return scan_remote(text);
}

EndpointResolver::EndpointResolver() = default;

EndpointResolver::EndpointResolver(Options options)
  : options_(std::move(options)) {}

Endpoint EndpointResolver::to_endpoint(const SpecifierParse& parsed,
                                       const std::string& role,
                                       const std::string& text) const {
  if(const auto* bad = std::get_if<MalformedSpecifier>(&parsed)) {
    throw ValidationError("Invalid " + role + " '" + text + "': " + bad->reason);
  }
  Endpoint endpoint;
  if(const auto* local = std::get_if<LocalSpecifier>(&parsed)) {
    endpoint.locality = Locality::Local;
    endpoint.path = local->path;
    return endpoint;
  }
  const auto& remote = std::get<RemoteSpecifier>(parsed);
  endpoint.locality = Locality::Remote;
  endpoint.user = remote.user;
  if(!endpoint.user && !options_.default_user.empty()) {
    endpoint.user = options_.default_user;
  }
  endpoint.host = remote.host;
  endpoint.port = options_.port;
  endpoint.path = remote.path;
  return endpoint;
}

ResolvedEndpoints EndpointResolver::resolve(const std::string& source,
                                            const std::string& destination) const {
  if(options_.port == 0) {
    throw ValidationError("Port must be in range 1..65535");
  }
  ResolvedEndpoints result;
  result.source = to_endpoint(parse_specifier(source), "source", source);
  result.destination = to_endpoint(parse_specifier(destination), "destination", destination);

  const bool src_remote = result.source.is_remote();
  const bool dst_remote = result.destination.is_remote();
  if(!src_remote && !dst_remote) {
    throw ValidationError("Both source and destination are local; one must be [user@]host:path");
  }
  if(src_remote && dst_remote) {
    throw ValidationError("Both source and destination are remote; one must be a local path");
  }
  result.direction = src_remote ? Direction::Pull : Direction::Push;
  return result;
}

void EndpointResolver::check_local_paths(const ResolvedEndpoints& endpoints,
                                         const std::string& identity_file) {
  namespace fs = std::filesystem;
  std::error_code ec;

  if(endpoints.direction == Direction::Push) {
    const auto& path = endpoints.source.path;
    auto status = fs::status(path, ec);
    if(ec || !fs::exists(status)) {
      throw ValidationError("Source file '" + path + "' does not exist");
    }
    if(fs::is_directory(status)) {
      throw ValidationError("Source '" + path + "' is a directory; only single files are supported");
    }
    if(!fs::is_regular_file(status)) {
      throw ValidationError("Source '" + path + "' is not a regular file");
    }
  } else {
    const auto& path = endpoints.destination.path;
    auto status = fs::status(path, ec);
    if(ec || !fs::exists(status)) {
      throw ValidationError("Destination directory '" + path + "' does not exist");
    }
    if(!fs::is_directory(status)) {
      throw ValidationError("Destination '" + path + "' is not a directory");
    }
  }

  if(!identity_file.empty()) {
    auto status = fs::status(identity_file, ec);
    if(ec || !fs::exists(status)) {
      throw ValidationError("Identity file '" + identity_file + "' does not exist");
    }
    if(!fs::is_regular_file(status)) {
      throw ValidationError("Identity file '" + identity_file + "' is not a regular file");
    }
  }
}
