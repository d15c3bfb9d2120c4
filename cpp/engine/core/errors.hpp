#pragma once
/*
================================================================================
Core: Error Types (Engine-Wide)
FILE: cpp/engine/core/errors.hpp

Purpose:
  - Provide uniform exception types so validation and runtime failures are:
      * searchable
      * catchable by category
      * mappable to CLI exit codes

Scope:
  - The classification/aggregation core never throws for finite input.
  - These types are raised by settings validation, stream readers and tools.
  - Bad rows in the record source are reported per row, not thrown.
================================================================================
*/

#include <stdexcept>
#include <string>
#include <utility>

namespace abcven {

// Base error for the engine.
class AbcVenError : public std::runtime_error {
 public:
  explicit AbcVenError(std::string msg) : std::runtime_error(std::move(msg)) {}
};

// Thrown when settings/config input fails validation.
class ValidationError : public AbcVenError {
 public:
  explicit ValidationError(std::string msg) : AbcVenError(std::move(msg)) {}
};

// Thrown for stream read/write failures.
class IOError : public AbcVenError {
 public:
  explicit IOError(std::string msg) : AbcVenError(std::move(msg)) {}
};

} // namespace abcven
