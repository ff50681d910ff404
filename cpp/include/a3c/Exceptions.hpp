#pragma once

#include "util/Exceptions.hpp"

namespace a3c {

// A push or pull against the ParameterStore could not be honored. Fatal to the calling worker.
class ParameterStoreUnavailable : public util::Exception {
 public:
  using util::Exception::Exception;
};

}  // namespace a3c
