#pragma once

#include "sc2/BasicTypes.hpp"

#include <string>
#include <vector>

namespace sc2 {

/*
 * The static catalogue of game functions and their typed arguments.
 *
 * Each argument type has one or more dimensions. A declared size of 0 marks a spatial dimension
 * whose size depends on the active screen or minimap resolution; see
 * ActionSpaceDescriptor::arg_size().
 *
 * Functions tagged Race::kNeutral are available to every faction and form the "general" part of
 * the action space. The rest belong to exactly one faction.
 */
class ActionCatalogue {
 public:
  enum ArgTypeIndex : int {
    kScreen,
    kMinimap,
    kScreen2,
    kQueued,
    kControlGroupAct,
    kControlGroupId,
    kSelectPointAct,
    kSelectAdd,
    kSelectUnitAct,
    kSelectUnitId,
    kSelectWorker,
    kBuildQueueId,
    kUnloadId,
    kNumArgTypes
  };

  struct ArgTypeDef {
    std::string name;
    std::vector<int> sizes;
  };

  struct FunctionDef {
    function_id_t id;
    std::string name;
    Race race;
    std::vector<int> arg_types;  // ArgTypeIndex values
  };

  // Well-known function ids.
  static constexpr function_id_t kNoOp = 0;
  static constexpr function_id_t kMoveCamera = 1;
  static constexpr function_id_t kSelectPoint = 2;
  static constexpr function_id_t kSelectRect = 3;
  static constexpr function_id_t kSelectControlGroup = 4;
  static constexpr function_id_t kSelectUnit = 5;
  static constexpr function_id_t kSelectIdleWorker = 6;
  static constexpr function_id_t kSelectArmy = 7;
  static constexpr function_id_t kAttackScreen = 12;
  static constexpr function_id_t kAttackMinimap = 13;
  static constexpr function_id_t kHoldPositionQuick = 274;
  static constexpr function_id_t kMoveScreen = 331;
  static constexpr function_id_t kMoveMinimap = 332;
  static constexpr function_id_t kSmartScreen = 451;
  static constexpr function_id_t kSmartMinimap = 452;
  static constexpr function_id_t kStopQuick = 453;

  static const std::vector<ArgTypeDef>& arg_types();
  static const std::vector<FunctionDef>& functions();

  // Throws IndexOutOfRange if id is not in the catalogue.
  static const FunctionDef& function(function_id_t id);

  // Functions tagged with exactly the given race, in catalogue order.
  static std::vector<const FunctionDef*> functions_of(Race race);
};

}  // namespace sc2
