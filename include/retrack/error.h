#pragma once

#include <stdexcept>

namespace retrack {

// Misuse of the library, such as reading through an empty observation
// wrapper or running an effect that has been stopped.
struct error : std::logic_error {
  using std::logic_error::logic_error;
};

} // namespace retrack
