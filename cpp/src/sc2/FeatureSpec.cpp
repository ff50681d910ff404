#include "sc2/FeatureSpec.hpp"

#include "sc2/BasicTypes.hpp"

namespace sc2 {

const std::vector<NonspatialField>& FeatureSpec::fields() {
  static const std::vector<NonspatialField> defs = {
    {"player", 1, 11, false},
    {"game_loop", 1, 1, false},
    {"score_cumulative", 1, 13, false},
    {"control_groups", 10, 2, false},
    {"single_select", 1, kUnitRowSize, true},
    {"multi_select", 500, kUnitRowSize, true},
    {"cargo", 500, kUnitRowSize, true},
    {"cargo_slots_available", 1, 1, false},
    {"build_queue", 10, kUnitRowSize, true},
  };
  return defs;
}

int FeatureSpec::fields_size() {
  static const int size = [] {
    int n = 0;
    for (const auto& field : fields()) n += field.encoded_size();
    return n;
  }();
  return size;
}

}  // namespace sc2
