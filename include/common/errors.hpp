#pragma once
#include <stdexcept>
#include <string>

namespace rf {

/**
 * Error kinds raised by the shape-propagation and window-selection code.
 * Each derives from the closest standard exception so callers may catch
 * either the precise kind or the std base.
 */

// Negative (or otherwise unusable) count or index passed to a length function.
class InvalidArgument : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

// Stage with non-positive kernel/stride/dilation, bad padding, or a bad
// model description.
class InvalidConfiguration : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

// Propagation attempted on a chain with no stages.
class EmptyChain : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

// Available length cannot hold the requested windows.
class InsufficientLength : public std::length_error {
public:
  using std::length_error::length_error;
};

// Selection parameters produce identical or overlapping windows.
class DuplicateWindow : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace rf
