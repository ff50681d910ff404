#pragma once

#include "sc2/ActionSpaceDescriptor.hpp"
#include "sc2/BasicTypes.hpp"
#include "sc2/Environment.hpp"

#include <random>
#include <string>
#include <vector>

namespace sc2 {

enum class MapKind : int8_t { kMoveToBeacon, kDefeatRoaches };

struct MapInfo {
  std::string name;
  MapKind kind;
  int num_marines;
  int num_roaches;  // per wave
  int step_limit;
};

class MapRegistry {
 public:
  static const std::vector<MapInfo>& maps();

  // Throws util::CleanException for unknown names.
  static const MapInfo& lookup(const std::string& name);
};

/*
 * A lightweight single-screen simulation of the classic mini-game maps. The camera covers the
 * whole map, positions are continuous screen coordinates, and one step() advances the game by one
 * agent step.
 *
 * Only the functions listed by available_actions() have an effect. Any other call, including one
 * that was never offered, is a no-op.
 */
class MiniGameEnv : public Environment {
 public:
  static constexpr int kMarineType = 48;
  static constexpr int kRoachType = 110;
  static constexpr int kBeaconType = 317;

  static constexpr float kRoachKillReward = 10;
  static constexpr float kMarineLossReward = -1;
  static constexpr float kBeaconReward = 1;

  MiniGameEnv(const MapInfo& map, const SpatialConfig& spatial_config, std::mt19937 prng);

  TimeStep reset() override;
  TimeStep step(const FunctionCall& call) override;

  int step_count() const { return step_count_; }
  int num_units(int owner) const;
  int num_selected() const;
  float score() const { return score_; }

 private:
  enum class Order : int8_t { kIdle, kMove, kAttackMove, kAttackUnit, kHold };

  struct Unit {
    int tag;
    int unit_type;
    int owner;  // player_relative value
    float x;
    float y;
    float hp;
    float max_hp;
    float damage;
    float range;
    float speed;
    int weapon_period;
    int cooldown = 0;
    bool selected = false;
    Order order = Order::kIdle;
    float dest_x = 0;
    float dest_y = 0;
    int target_tag = -1;
  };

  Unit make_marine(float x, float y);
  Unit make_roach(float x, float y);
  void spawn_roach_wave();
  void place_beacon();

  void apply(const FunctionCall& call);
  void select_point(int act, float x, float y);
  void select_rect(bool add, float x1, float y1, float x2, float y2);
  void select_army(bool add);
  void command_selected(Order order, float x, float y);

  float simulate();
  Unit* find(int tag);
  Unit* nearest(float x, float y, int owner, float max_dist);
  void move_toward(Unit& unit, float x, float y);
  bool terminal() const;

  TimeStep observe(StepType step_type, float reward) const;
  std::vector<function_id_t> available_actions() const;
  void paint(FeatureLayers& screen, FeatureLayers& minimap, const Unit& unit) const;

  static float distance(float x1, float y1, float x2, float y2);

  const MapInfo map_;
  const SpatialConfig spatial_config_;
  const float scale_;  // screen units per 64-cell reference map
  std::mt19937 prng_;

  std::vector<Unit> units_;
  int next_tag_ = 1;
  int step_count_ = 0;
  float score_ = 0;
  int roaches_killed_ = 0;
};

}  // namespace sc2
