#pragma once

#include <string>
#include <vector>

namespace sc2 {

// Screen feature layers, in the order they are stacked.
struct ScreenChannel {
  enum : int {
    kHeightMap,
    kVisibilityMap,
    kCreep,
    kPower,
    kPlayerId,
    kPlayerRelative,
    kUnitType,
    kSelected,
    kUnitHitPoints,
    kUnitHitPointsRatio,
    kUnitEnergy,
    kUnitEnergyRatio,
    kUnitShields,
    kUnitShieldsRatio,
    kUnitDensity,
    kUnitDensityAa,
    kEffects,
    kNumChannels
  };
};

// Minimap feature layers, in the order they are stacked.
struct MinimapChannel {
  enum : int {
    kHeightMap,
    kVisibilityMap,
    kCreep,
    kCamera,
    kPlayerId,
    kPlayerRelative,
    kSelected,
    kNumChannels
  };
};

/*
 * A structured (non-spatial) observation field. Fixed fields always have exactly rows x cols
 * entries. Variable fields carry between 0 and max_rows rows of cols entries each, and are
 * zero-padded (or truncated) to max_rows rows when encoded.
 */
struct NonspatialField {
  std::string name;
  int rows;  // max rows for variable fields
  int cols;
  bool variable;

  int encoded_size() const { return rows * cols; }
};

class FeatureSpec {
 public:
  // All structured fields, in the order they are appended to the nonspatial vector.
  static const std::vector<NonspatialField>& fields();

  // Sum of encoded_size() over fields().
  static int fields_size();
};

}  // namespace sc2
