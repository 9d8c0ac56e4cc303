#pragma once
#include <stdexcept>
#include <string>

namespace invaders {

// Invalid enumeration or missing callable at construction.
class ConfigurationError : public std::invalid_argument {
public:
  explicit ConfigurationError(const std::string &what)
      : std::invalid_argument(what) {}
};

// Action outside the bounds of the configured action space.
class InvalidAction : public std::out_of_range {
public:
  explicit InvalidAction(const std::string &what) : std::out_of_range(what) {}
};

// Nonzero result from the hardware. Fatal, never retried.
class EmulatorFailure : public std::runtime_error {
public:
  explicit EmulatorFailure(const std::string &what)
      : std::runtime_error(what) {}
};

class EmptyBufferError : public std::runtime_error {
public:
  explicit EmptyBufferError(const std::string &what)
      : std::runtime_error(what) {}
};

class InsufficientPopulationError : public std::invalid_argument {
public:
  explicit InsufficientPopulationError(const std::string &what)
      : std::invalid_argument(what) {}
};

// Stepping an episode that has not been reset since it finished.
class StaleEpisodeError : public std::runtime_error {
public:
  explicit StaleEpisodeError(const std::string &what)
      : std::runtime_error(what) {}
};

} // namespace invaders
