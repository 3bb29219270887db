#pragma once
#include "log_stream.hpp"

namespace customio {

// Handlers and services print through this wrapper so tests can swap the
// underlying IOutput.
class ConsoleOutput {

  customio::IOutput &logger_;

public:
  ConsoleOutput(customio::IOutput &logger) : logger_(logger) {}

  customio::IOutput &logger() { return logger_; }
  // Plain result stream (tables, JSON) without a log prefix.
  std::ostream &out() { return logger_.stream(); }
};

} // namespace customio
