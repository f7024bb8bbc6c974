#pragma once
#include <stdexcept>
#include <string>

namespace execrelay {

// A raw line could not be decoded by the selected engine: invalid JSON,
// a non-object envelope, or a missing/unrecognized top-level discriminator.
class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Invalid render budget or unknown engine id. Raised before any event is processed.
class ConfigError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

} // namespace execrelay
