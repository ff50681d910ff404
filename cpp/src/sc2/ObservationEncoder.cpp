#include "sc2/ObservationEncoder.hpp"

#include "sc2/Exceptions.hpp"
#include "sc2/FeatureSpec.hpp"

#include <algorithm>

namespace sc2 {

AgentState::AgentState(const ActionSpaceDescriptor& descriptor) : descriptor_(descriptor) {
  reset();
}

void AgentState::reset() {
  last_action_used_ = 0;
  max_units_seen_ = Eigen::VectorXf::Zero(kNumUnitTypes);
  used_general_actions_ = Eigen::VectorXf::Zero(descriptor_.num_general_actions());
  used_race_actions_ = Eigen::VectorXf::Zero(descriptor_.num_race_actions());
}

void AgentState::act(action_index_t index) {
  descriptor_.resolve(index);  // bounds check
  last_action_used_ = index;
  if (descriptor_.is_general(index)) {
    used_general_actions_[index] += 1;
  } else {
    used_race_actions_[index - descriptor_.num_general_actions()] += 1;
  }
}

void AgentState::observe_enemies(const Eigen::VectorXf& enemy_counts) {
  for (int i = 1; i < kNumUnitTypes; ++i) {
    float decayed = max_units_seen_[i] * kDecay;
    if (decayed < kFloor) decayed = 0;
    max_units_seen_[i] = std::max(decayed, enemy_counts[i]);
  }
}

ObservationEncoder::ObservationEncoder(const ActionSpaceDescriptor& descriptor)
    : descriptor_(descriptor), nonspatial_size_(nonspatial_size(descriptor)) {}

int ObservationEncoder::nonspatial_size(const ActionSpaceDescriptor& descriptor) {
  // usage counts (one per action) + availability mask (one per action) + last action used
  return kNumUnitTypes + 2 * descriptor.action_count() + 1 + FeatureSpec::fields_size();
}

EncodedStep ObservationEncoder::encode(const TimeStep& time_step, AgentState& state) const {
  const RawObservation& raw = time_step.observation;

  state.observe_enemies(count_enemy_units(raw.screen));

  EncodedStep out;
  out.reward = time_step.reward;
  out.terminal = time_step.last();
  out.available = descriptor_.mask_of(raw.available_actions);

  auto obs = std::make_shared<EncodedObservation>();
  obs->nonspatial = Eigen::VectorXf::Zero(nonspatial_size_);
  Eigen::VectorXf& v = obs->nonspatial;

  int offset = 0;
  auto append = [&](const Eigen::VectorXf& x) {
    v.segment(offset, x.size()) = x;
    offset += x.size();
  };

  append(state.max_units_seen());
  append(state.used_general_actions());
  append(state.used_race_actions());
  for (int i = 0; i < descriptor_.action_count(); ++i) {
    v[offset + i] = out.available[i] ? 1.f : 0.f;
  }
  offset += descriptor_.action_count();
  v[offset++] = state.last_action_used();

  for (const NonspatialField& field : FeatureSpec::fields()) {
    auto it = raw.fields.find(field.name);
    if (it != raw.fields.end()) {
      const FieldArray& arr = it->second;
      if (field.variable) {
        if (arr.rows() > 0 && arr.cols() != field.cols) {
          throw EnvironmentFailure("Field {} has {} columns (expected {})", field.name, arr.cols(),
                                   field.cols);
        }
        int rows = std::min<int>(arr.rows(), field.rows);
        for (int r = 0; r < rows; ++r) {
          for (int c = 0; c < field.cols; ++c) {
            v[offset + r * field.cols + c] = arr(r, c);
          }
        }
      } else {
        if (arr.size() != field.encoded_size()) {
          throw EnvironmentFailure("Field {} has {} entries (expected {})", field.name, arr.size(),
                                   field.encoded_size());
        }
        for (int k = 0; k < field.encoded_size(); ++k) {
          v[offset + k] = arr.data()[k];
        }
      }
    }
    offset += field.encoded_size();
  }

  obs->screen = stack_layers(raw.screen, ScreenChannel::kNumChannels);
  obs->minimap = stack_layers(raw.minimap, MinimapChannel::kNumChannels);
  out.observation = obs;
  return out;
}

Eigen::VectorXf ObservationEncoder::count_enemy_units(const FeatureLayers& screen) {
  Eigen::VectorXf counts = Eigen::VectorXf::Zero(kNumUnitTypes);
  if (screen.dimension(0) <= ScreenChannel::kUnitType) return counts;

  for (int y = 0; y < screen.dimension(1); ++y) {
    for (int x = 0; x < screen.dimension(2); ++x) {
      if (screen(ScreenChannel::kPlayerRelative, y, x) != kPlayerEnemy) continue;
      int unit_type = screen(ScreenChannel::kUnitType, y, x);
      if (unit_type < 0 || unit_type >= kNumUnitTypes) continue;
      counts[unit_type] += 1;
    }
  }
  return counts;
}

SpatialTensor ObservationEncoder::stack_layers(const FeatureLayers& layers, int expected_channels) {
  if (layers.dimension(0) != expected_channels) {
    throw EnvironmentFailure("Got {} feature layers (expected {})", layers.dimension(0),
                             expected_channels);
  }
  Eigen::array<int, 3> shuffle{1, 2, 0};
  SpatialTensor out = layers.cast<float>().shuffle(shuffle);
  return out;
}

}  // namespace sc2
