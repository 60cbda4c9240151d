#include "errors.hpp"

const char* stage_name(Stage stage) {
  switch(stage) {
    case Stage::Usage: return "usage";
    case Stage::Validation: return "validation";
    case Stage::Transfer: return "transfer";
    case Stage::Assembly: return "assembly";
  }
  return "unknown";
}

ZapError::ZapError(Stage stage, const std::string& message)
  : std::runtime_error(message), stage_(stage) {}

int ZapError::exit_code() const {
  return stage_ == Stage::Usage ? 2 : 1;
}
