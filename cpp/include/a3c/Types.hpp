#pragma once

#include <Eigen/Core>

#include <cstdint>
#include <vector>

namespace a3c {

using ParameterVector = Eigen::VectorXf;
using Distribution = Eigen::VectorXf;

// Indexed [arg_type][dim], matching sc2::ActionSpaceDescriptor::arg_types().
using ArgDistributions = std::vector<std::vector<Distribution>>;
using ArgSamples = std::vector<std::vector<int>>;

struct ParameterSnapshot {
  ParameterVector values;
  int64_t version = 0;
};

}  // namespace a3c
