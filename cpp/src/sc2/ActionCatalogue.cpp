#include "sc2/ActionCatalogue.hpp"

#include "sc2/Exceptions.hpp"

namespace sc2 {

namespace {

using C = ActionCatalogue;

constexpr Race N = Race::kNeutral;
constexpr Race T = Race::kTerran;
constexpr Race P = Race::kProtoss;
constexpr Race Z = Race::kZerg;

}  // namespace

const std::vector<ActionCatalogue::ArgTypeDef>& ActionCatalogue::arg_types() {
  // Order must match ArgTypeIndex.
  static const std::vector<ArgTypeDef> defs = {
    {"screen", {0, 0}},
    {"minimap", {0, 0}},
    {"screen2", {0, 0}},
    {"queued", {2}},
    {"control_group_act", {5}},
    {"control_group_id", {10}},
    {"select_point_act", {4}},
    {"select_add", {2}},
    {"select_unit_act", {4}},
    {"select_unit_id", {500}},
    {"select_worker", {4}},
    {"build_queue_id", {10}},
    {"unload_id", {500}},
  };
  return defs;
}

const std::vector<ActionCatalogue::FunctionDef>& ActionCatalogue::functions() {
  static const std::vector<FunctionDef> defs = {
    {0, "no_op", N, {}},
    {1, "move_camera", N, {C::kMinimap}},
    {2, "select_point", N, {C::kSelectPointAct, C::kScreen}},
    {3, "select_rect", N, {C::kSelectAdd, C::kScreen, C::kScreen2}},
    {4, "select_control_group", N, {C::kControlGroupAct, C::kControlGroupId}},
    {5, "select_unit", N, {C::kSelectUnitAct, C::kSelectUnitId}},
    {6, "select_idle_worker", N, {C::kSelectWorker}},
    {7, "select_army", N, {C::kSelectAdd}},
    {8, "select_warp_gates", P, {C::kSelectAdd}},
    {9, "select_larva", Z, {}},
    {10, "unload", N, {C::kUnloadId}},
    {11, "build_queue", N, {C::kBuildQueueId}},
    {12, "Attack_screen", N, {C::kQueued, C::kScreen}},
    {13, "Attack_minimap", N, {C::kQueued, C::kMinimap}},
    {42, "Build_Barracks_screen", T, {C::kQueued, C::kScreen}},
    {44, "Build_CommandCenter_screen", T, {C::kQueued, C::kScreen}},
    {50, "Build_EngineeringBay_screen", T, {C::kQueued, C::kScreen}},
    {57, "Build_Gateway_screen", P, {C::kQueued, C::kScreen}},
    {65, "Build_Nexus_screen", P, {C::kQueued, C::kScreen}},
    {70, "Build_Pylon_screen", P, {C::kQueued, C::kScreen}},
    {79, "Build_Refinery_screen", T, {C::kQueued, C::kScreen}},
    {84, "Build_SpawningPool_screen", Z, {C::kQueued, C::kScreen}},
    {86, "Build_Hatchery_screen", Z, {C::kQueued, C::kScreen}},
    {91, "Build_SupplyDepot_screen", T, {C::kQueued, C::kScreen}},
    {264, "Harvest_Gather_screen", N, {C::kQueued, C::kScreen}},
    {269, "Harvest_Return_quick", N, {C::kQueued}},
    {274, "HoldPosition_quick", N, {C::kQueued}},
    {331, "Move_screen", N, {C::kQueued, C::kScreen}},
    {332, "Move_minimap", N, {C::kQueued, C::kMinimap}},
    {333, "Patrol_screen", N, {C::kQueued, C::kScreen}},
    {334, "Patrol_minimap", N, {C::kQueued, C::kMinimap}},
    {451, "Smart_screen", N, {C::kQueued, C::kScreen}},
    {452, "Smart_minimap", N, {C::kQueued, C::kMinimap}},
    {453, "Stop_quick", N, {C::kQueued}},
    {467, "Train_Drone_quick", Z, {C::kQueued}},
    {477, "Train_Marine_quick", T, {C::kQueued}},
    {480, "Train_Overlord_quick", Z, {C::kQueued}},
    {485, "Train_Probe_quick", P, {C::kQueued}},
    {490, "Train_SCV_quick", T, {C::kQueued}},
    {503, "Train_Zealot_quick", P, {C::kQueued}},
    {508, "Train_Zergling_quick", Z, {C::kQueued}},
  };
  return defs;
}

const ActionCatalogue::FunctionDef& ActionCatalogue::function(function_id_t id) {
  for (const FunctionDef& def : functions()) {
    if (def.id == id) return def;
  }
  throw IndexOutOfRange("Unknown function id {}", id);
}

std::vector<const ActionCatalogue::FunctionDef*> ActionCatalogue::functions_of(Race race) {
  std::vector<const FunctionDef*> out;
  for (const FunctionDef& def : functions()) {
    if (def.race == race) out.push_back(&def);
  }
  return out;
}

}  // namespace sc2
