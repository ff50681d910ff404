#pragma once

#include "sc2/BasicTypes.hpp"

#include <Eigen/Core>
#include <unsupported/Eigen/CXX11/Tensor>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace sc2 {

// Spatial feature layers, indexed (channel, y, x).
using FeatureLayers = Eigen::Tensor<int32_t, 3, Eigen::RowMajor>;

// A structured observation field, one row per unit for the unit-list fields.
using FieldArray = Eigen::Array<int32_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

struct RawObservation {
  FeatureLayers screen;
  FeatureLayers minimap;
  std::vector<function_id_t> available_actions;
  std::map<std::string, FieldArray> fields;
};

struct TimeStep {
  StepType step_type = StepType::kFirst;
  float reward = 0;
  RawObservation observation;

  bool last() const { return step_type == StepType::kLast; }
};

// A function id plus one integer list per declared argument type, in declared order.
struct FunctionCall {
  function_id_t function;
  std::vector<std::vector<int>> arguments;
};

/*
 * A game environment driven by a single worker. Implementations need not be thread-safe: each
 * worker owns its own instance.
 *
 * step() after a TimeStep with step_type == kLast is undefined; call reset() instead.
 */
class Environment {
 public:
  virtual ~Environment() = default;

  virtual TimeStep reset() = 0;
  virtual TimeStep step(const FunctionCall& call) = 0;
};

using EnvironmentFactory = std::function<std::unique_ptr<Environment>(int worker_index)>;

}  // namespace sc2
