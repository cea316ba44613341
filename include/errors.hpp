#pragma once
#include <stdexcept>
#include <string>

// The user-visible failure of one pipeline stage for one file.
class ProcessingError : public std::runtime_error {
public:
  ProcessingError(const std::string& file, const std::string& stage, const std::string& msg)
    : std::runtime_error(stage + ": " + file + ": " + msg), file_(file), stage_(stage) {}

  const std::string& file() const { return file_; }
  const std::string& stage() const { return stage_; }

private:
  std::string file_;
  std::string stage_;
};

class UnsupportedFormatError : public std::runtime_error {
public:
  UnsupportedFormatError(const std::string& file, const std::string& ext)
    : std::runtime_error("reader: unsupported format '" + ext + "' for " + file), file_(file) {}

  const std::string& file() const { return file_; }

private:
  std::string file_;
};

class StrategyError : public std::invalid_argument {
public:
  explicit StrategyError(const std::string& name)
    : std::invalid_argument("chunker: unknown strategy '" + name + "'") {}
};

class Cancelled : public std::runtime_error {
public:
  Cancelled() : std::runtime_error("operation cancelled") {}
};
