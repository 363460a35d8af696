#pragma once

#include <stdexcept>
#include <string>

namespace lazyseq {
// Raised when a sequence constrained to a single traversal is traversed again.
class illegal_state_error : public std::logic_error {
  public:
    explicit illegal_state_error(const std::string& what) : std::logic_error(what) {}

    explicit illegal_state_error(const char* what) : std::logic_error(what) {}
};
}  // namespace lazyseq
