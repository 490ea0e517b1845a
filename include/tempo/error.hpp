#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace tempo
{

/// Raised when a caller violates the controller contract (negative
/// durations, missing on_success handler, invalid config).
class configuration_error : public std::invalid_argument
{
  public:
    explicit configuration_error(const std::string& what)
      : std::invalid_argument(what)
    {
    }
};

/// Human readable description of a captured failure, for logging.
std::string describe(std::exception_ptr error);

} // namespace tempo
