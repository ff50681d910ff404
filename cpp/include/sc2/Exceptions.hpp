#pragma once

#include "util/Exceptions.hpp"

namespace sc2 {

// An action, argument or distribution-head index outside the bounds declared by the
// ActionSpaceDescriptor. Always indicates a shape mismatch between collaborators.
class IndexOutOfRange : public util::Exception {
 public:
  using util::Exception::Exception;
};

// The environment threw during reset() or step(), or produced a malformed observation.
class EnvironmentFailure : public util::Exception {
 public:
  using util::Exception::Exception;
};

}  // namespace sc2
