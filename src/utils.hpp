#pragma once
#include <cstdint>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::vector<unsigned char> sha256_bytes(const std::string &data);
std::string sha256_hex(const std::string &data);

// Streams the file through SHA-256. Throws std::runtime_error on read failure.
std::string sha256_file_hex(const std::string &path);

// Wraps text in single quotes for /bin/sh, escaping embedded quotes.
std::string shell_quote(const std::string &text);

// '/'-separated path helpers for remote paths (independent of the local OS).
std::string posix_basename(const std::string &path);
std::string posix_join(const std::string &dir, const std::string &name);

// Local-path basename; accepts both '/' and '\\' separators.
std::string local_basename(const std::string &path);

std::string format_bytes(uint64_t bytes);
