#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

// Stage a job was in when it stopped. Reported to the user and mapped to the
// process exit code.
enum class Stage {
  Usage,
  Validation,
  Transfer,
  Assembly
};

const char* stage_name(Stage stage);

class ZapError : public std::runtime_error {
public:
  ZapError(Stage stage, const std::string& message);

  Stage stage() const { return stage_; }
  int exit_code() const;

private:
  Stage stage_;
};

// Argument text could not be parsed as its declared type (exit 2).
class UsageError : public ZapError {
public:
  explicit UsageError(const std::string& message)
    : ZapError(Stage::Usage, message) {}
};

// Argument parsed but violates a domain constraint (exit 1).
class ValidationError : public ZapError {
public:
  explicit ValidationError(const std::string& message)
    : ZapError(Stage::Validation, message) {}
};

// Channel establishment, channel loss or destination write failure. Inside a
// worker it fails one attempt; thrown out of the engine it means at least one
// chunk ran out of retries.
class TransferError : public ZapError {
public:
  explicit TransferError(const std::string& message, std::size_t exhausted_chunks = 0)
    : ZapError(Stage::Transfer, message),
      exhausted_chunks_(exhausted_chunks) {}

  std::size_t exhausted_chunks() const { return exhausted_chunks_; }

private:
  std::size_t exhausted_chunks_;
};

// Concatenation, verification or rename of the final file failed.
class AssemblyError : public ZapError {
public:
  explicit AssemblyError(const std::string& message)
    : ZapError(Stage::Assembly, message) {}
};
