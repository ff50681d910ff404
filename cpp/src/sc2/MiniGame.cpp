#include "sc2/MiniGame.hpp"

#include "sc2/ActionCatalogue.hpp"
#include "sc2/Exceptions.hpp"
#include "sc2/FeatureSpec.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exceptions.hpp"
#include "util/Random.hpp"

#include <boost/dynamic_bitset.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace sc2 {

namespace {

constexpr float kReferenceMapSize = 64;
constexpr float kClickRadius = 1.5f;
constexpr float kBeaconRadius = 2.f;
constexpr float kAggroRadius = 9.f;
constexpr float kAcquireSlack = 2.f;
constexpr int kGameLoopsPerStep = 8;

using C = ActionCatalogue;

}  // namespace

const std::vector<MapInfo>& MapRegistry::maps() {
  static const std::vector<MapInfo> infos = {
    {"MoveToBeacon", MapKind::kMoveToBeacon, 1, 0, 240},
    {"DefeatRoaches", MapKind::kDefeatRoaches, 9, 4, 240},
  };
  return infos;
}

const MapInfo& MapRegistry::lookup(const std::string& name) {
  std::string known;
  for (const MapInfo& info : maps()) {
    if (info.name == name) return info;
    known += known.empty() ? info.name : ", " + info.name;
  }
  throw util::CleanException("Unknown map \"{}\" (known maps: {})", name, known);
}

MiniGameEnv::MiniGameEnv(const MapInfo& map, const SpatialConfig& spatial_config,
                         std::mt19937 prng)
    : map_(map),
      spatial_config_(spatial_config),
      scale_(spatial_config.screen_size / kReferenceMapSize),
      prng_(prng) {}

TimeStep MiniGameEnv::reset() {
  units_.clear();
  step_count_ = 0;
  score_ = 0;
  roaches_killed_ = 0;

  float s = spatial_config_.screen_size;
  if (map_.kind == MapKind::kMoveToBeacon) {
    for (int i = 0; i < map_.num_marines; ++i) {
      units_.push_back(make_marine(util::Random::uniform_real(prng_, 0.1f * s, 0.9f * s),
                                   util::Random::uniform_real(prng_, 0.1f * s, 0.9f * s)));
    }
    place_beacon();
  } else {
    for (int i = 0; i < map_.num_marines; ++i) {
      float y = s * (0.3f + 0.4f * (i + 0.5f) / map_.num_marines);
      units_.push_back(make_marine(0.2f * s, y));
    }
    spawn_roach_wave();
  }
  return observe(StepType::kFirst, 0);
}

TimeStep MiniGameEnv::step(const FunctionCall& call) {
  std::vector<function_id_t> available = available_actions();
  if (std::find(available.begin(), available.end(), call.function) != available.end()) {
    apply(call);
  }

  float reward = simulate();
  step_count_++;
  score_ += reward;
  return observe(terminal() ? StepType::kLast : StepType::kMid, reward);
}

int MiniGameEnv::num_units(int owner) const {
  return std::count_if(units_.begin(), units_.end(),
                       [&](const Unit& u) { return u.owner == owner; });
}

int MiniGameEnv::num_selected() const {
  return std::count_if(units_.begin(), units_.end(), [](const Unit& u) { return u.selected; });
}

MiniGameEnv::Unit MiniGameEnv::make_marine(float x, float y) {
  Unit unit{next_tag_++, kMarineType, kPlayerSelf, x, y, 45, 45, 6, 5 * scale_, scale_, 2};
  return unit;
}

MiniGameEnv::Unit MiniGameEnv::make_roach(float x, float y) {
  Unit unit{next_tag_++, kRoachType, kPlayerEnemy, x, y, 145, 145, 16, 4 * scale_,
            0.9f * scale_, 4};
  return unit;
}

void MiniGameEnv::spawn_roach_wave() {
  float s = spatial_config_.screen_size;
  for (int i = 0; i < map_.num_roaches; ++i) {
    float y = s * (0.35f + 0.3f * (i + 0.5f) / map_.num_roaches);
    units_.push_back(make_roach(0.8f * s, y));
  }
}

void MiniGameEnv::place_beacon() {
  int s = spatial_config_.screen_size;
  units_.erase(std::remove_if(units_.begin(), units_.end(),
                              [](const Unit& u) { return u.unit_type == kBeaconType; }),
               units_.end());

  // Candidate cells: inside the margin and not already within reach of a marine.
  int margin = std::max(1, (int)std::ceil(kBeaconRadius * scale_));
  boost::dynamic_bitset<> free_cells(s * s);
  for (int y = margin; y < s - margin; ++y) {
    for (int x = margin; x < s - margin; ++x) {
      free_cells.set(y * s + x);
    }
  }
  for (const Unit& u : units_) {
    if (u.owner != kPlayerSelf) continue;
    for (int y = 0; y < s; ++y) {
      for (int x = 0; x < s; ++x) {
        if (distance(u.x, u.y, x + 0.5f, y + 0.5f) < 2 * kBeaconRadius * scale_) {
          free_cells.reset(y * s + x);
        }
      }
    }
  }

  int cell = boost_util::get_random_set_index(prng_, free_cells);
  if (cell < 0) {
    cell = (s / 2) * s + s / 2;
  }
  Unit beacon{next_tag_++, kBeaconType, kPlayerNeutral, cell % s + 0.5f, cell / s + 0.5f, 0, 0, 0,
              0, 0, 0};
  units_.push_back(beacon);
}

void MiniGameEnv::apply(const FunctionCall& call) {
  const auto& def = ActionCatalogue::function(call.function);
  const auto& arg_defs = ActionCatalogue::arg_types();
  if (call.arguments.size() != def.arg_types.size()) {
    throw EnvironmentFailure("{} expects {} arguments, got {}", def.name, def.arg_types.size(),
                             call.arguments.size());
  }
  for (size_t i = 0; i < call.arguments.size(); ++i) {
    const auto& arg_def = arg_defs[def.arg_types[i]];
    if (call.arguments[i].size() != arg_def.sizes.size()) {
      throw EnvironmentFailure("Argument {} of {} expects {} values, got {}", arg_def.name,
                               def.name, arg_def.sizes.size(), call.arguments[i].size());
    }
  }

  float to_screen = float(spatial_config_.screen_size) / spatial_config_.minimap_size;
  auto point = [&](int i) {
    return std::make_pair(call.arguments[i][0] + 0.5f, call.arguments[i][1] + 0.5f);
  };
  auto minimap_point = [&](int i) {
    return std::make_pair((call.arguments[i][0] + 0.5f) * to_screen,
                          (call.arguments[i][1] + 0.5f) * to_screen);
  };

  switch (call.function) {
    case C::kSelectPoint: {
      auto [x, y] = point(1);
      select_point(call.arguments[0][0], x, y);
      break;
    }
    case C::kSelectRect: {
      auto [x1, y1] = point(1);
      auto [x2, y2] = point(2);
      select_rect(call.arguments[0][0] != 0, x1, y1, x2, y2);
      break;
    }
    case C::kSelectArmy:
      select_army(call.arguments[0][0] != 0);
      break;
    case C::kAttackScreen: {
      auto [x, y] = point(1);
      command_selected(Order::kAttackMove, x, y);
      break;
    }
    case C::kAttackMinimap: {
      auto [x, y] = minimap_point(1);
      command_selected(Order::kAttackMove, x, y);
      break;
    }
    case C::kMoveScreen:
    case C::kSmartScreen: {
      auto [x, y] = point(1);
      command_selected(Order::kMove, x, y);
      break;
    }
    case C::kMoveMinimap:
    case C::kSmartMinimap: {
      auto [x, y] = minimap_point(1);
      command_selected(Order::kMove, x, y);
      break;
    }
    case C::kStopQuick:
      command_selected(Order::kIdle, 0, 0);
      break;
    case C::kHoldPositionQuick:
      command_selected(Order::kHold, 0, 0);
      break;
    default:
      break;
  }
}

void MiniGameEnv::select_point(int act, float x, float y) {
  // act: 0 = select, 1 = toggle, 2 = select all of type, 3 = add all of type
  Unit* clicked = nearest(x, y, kPlayerSelf, kClickRadius * scale_);
  if (act == 1) {
    if (clicked) clicked->selected = !clicked->selected;
    return;
  }
  if (act != 3) {
    for (Unit& u : units_) u.selected = false;
  }
  if (!clicked) return;
  if (act == 0) {
    clicked->selected = true;
    return;
  }
  for (Unit& u : units_) {
    if (u.owner == kPlayerSelf && u.unit_type == clicked->unit_type) u.selected = true;
  }
}

void MiniGameEnv::select_rect(bool add, float x1, float y1, float x2, float y2) {
  float lo_x = std::min(x1, x2) - 0.5f;
  float hi_x = std::max(x1, x2) + 0.5f;
  float lo_y = std::min(y1, y2) - 0.5f;
  float hi_y = std::max(y1, y2) + 0.5f;
  for (Unit& u : units_) {
    if (u.owner != kPlayerSelf) continue;
    bool inside = u.x >= lo_x && u.x <= hi_x && u.y >= lo_y && u.y <= hi_y;
    u.selected = inside || (add && u.selected);
  }
}

void MiniGameEnv::select_army(bool add) {
  for (Unit& u : units_) {
    if (u.owner == kPlayerSelf) {
      u.selected = true;
    } else if (!add) {
      u.selected = false;
    }
  }
}

void MiniGameEnv::command_selected(Order order, float x, float y) {
  Unit* target = nullptr;
  if (order == Order::kAttackMove) {
    target = nearest(x, y, kPlayerEnemy, kClickRadius * scale_);
  }
  for (Unit& u : units_) {
    if (!u.selected || u.owner != kPlayerSelf) continue;
    u.order = order;
    u.dest_x = x;
    u.dest_y = y;
    u.target_tag = -1;
    if (target) {
      u.order = Order::kAttackUnit;
      u.target_tag = target->tag;
    }
  }
}

float MiniGameEnv::simulate() {
  for (Unit& u : units_) {
    if (u.owner == kPlayerNeutral) continue;

    int enemy = u.owner == kPlayerSelf ? kPlayerEnemy : kPlayerSelf;
    Unit* target = nullptr;
    switch (u.order) {
      case Order::kAttackUnit:
        target = find(u.target_tag);
        if (!target) u.order = Order::kIdle;
        break;
      case Order::kAttackMove:
        target = nearest(u.x, u.y, enemy, u.range + kAcquireSlack * scale_);
        break;
      case Order::kIdle:
        target = nearest(u.x, u.y, enemy,
                         u.owner == kPlayerEnemy ? kAggroRadius * scale_ : u.range);
        break;
      case Order::kHold:
        target = nearest(u.x, u.y, enemy, u.range);
        break;
      case Order::kMove:
        break;
    }

    if (u.cooldown > 0) u.cooldown--;

    if (target) {
      if (distance(u.x, u.y, target->x, target->y) <= u.range) {
        if (u.cooldown == 0) {
          target->hp -= u.damage;
          u.cooldown = u.weapon_period;
        }
      } else if (u.order != Order::kHold) {
        move_toward(u, target->x, target->y);
      }
    } else if (u.order == Order::kMove || u.order == Order::kAttackMove) {
      move_toward(u, u.dest_x, u.dest_y);
      if (u.x == u.dest_x && u.y == u.dest_y) u.order = Order::kIdle;
    }
  }

  float reward = 0;
  for (const Unit& u : units_) {
    if (u.owner == kPlayerNeutral || u.hp > 0) continue;
    if (u.owner == kPlayerEnemy) {
      reward += kRoachKillReward;
      roaches_killed_++;
    } else {
      reward += kMarineLossReward;
    }
  }
  auto dead = [](const Unit& u) { return u.owner != kPlayerNeutral && u.hp <= 0; };
  units_.erase(std::remove_if(units_.begin(), units_.end(), dead), units_.end());

  if (map_.kind == MapKind::kMoveToBeacon) {
    const Unit* beacon = nullptr;
    for (const Unit& u : units_) {
      if (u.unit_type == kBeaconType) beacon = &u;
    }
    bool reached = false;
    for (const Unit& u : units_) {
      if (beacon && u.owner == kPlayerSelf &&
          distance(u.x, u.y, beacon->x, beacon->y) < kBeaconRadius * scale_) {
        reached = true;
      }
    }
    if (reached) {
      reward += kBeaconReward;
      place_beacon();
    }
  } else if (num_units(kPlayerEnemy) == 0 && num_units(kPlayerSelf) > 0) {
    spawn_roach_wave();
  }
  return reward;
}

MiniGameEnv::Unit* MiniGameEnv::find(int tag) {
  for (Unit& u : units_) {
    if (u.tag == tag) return &u;
  }
  return nullptr;
}

MiniGameEnv::Unit* MiniGameEnv::nearest(float x, float y, int owner, float max_dist) {
  Unit* best = nullptr;
  float best_dist = std::numeric_limits<float>::max();
  for (Unit& u : units_) {
    if (u.owner != owner) continue;
    float d = distance(x, y, u.x, u.y);
    if (d <= max_dist && d < best_dist) {
      best = &u;
      best_dist = d;
    }
  }
  return best;
}

void MiniGameEnv::move_toward(Unit& unit, float x, float y) {
  float d = distance(unit.x, unit.y, x, y);
  if (d <= unit.speed) {
    unit.x = x;
    unit.y = y;
    return;
  }
  unit.x += (x - unit.x) * unit.speed / d;
  unit.y += (y - unit.y) * unit.speed / d;
}

bool MiniGameEnv::terminal() const {
  if (step_count_ >= map_.step_limit) return true;
  return map_.kind == MapKind::kDefeatRoaches && num_units(kPlayerSelf) == 0;
}

TimeStep MiniGameEnv::observe(StepType step_type, float reward) const {
  int s = spatial_config_.screen_size;
  int m = spatial_config_.minimap_size;

  TimeStep ts;
  ts.step_type = step_type;
  ts.reward = reward;
  RawObservation& obs = ts.observation;

  obs.screen = FeatureLayers(ScreenChannel::kNumChannels, s, s);
  obs.screen.setZero();
  obs.minimap = FeatureLayers(MinimapChannel::kNumChannels, m, m);
  obs.minimap.setZero();

  // The camera covers the whole map and everything is visible.
  obs.screen.chip(ScreenChannel::kVisibilityMap, 0).setConstant(2);
  obs.minimap.chip(MinimapChannel::kVisibilityMap, 0).setConstant(2);
  obs.minimap.chip(MinimapChannel::kCamera, 0).setConstant(1);

  for (const Unit& u : units_) paint(obs.screen, obs.minimap, u);

  obs.available_actions = available_actions();

  int marines = num_units(kPlayerSelf);
  FieldArray player = FieldArray::Zero(1, 11);
  player(0, 0) = 1;        // player_id
  player(0, 3) = marines;  // food_used
  player(0, 4) = 200;      // food_cap
  player(0, 5) = marines;  // food_army
  player(0, 8) = marines;  // army_count
  obs.fields["player"] = player;

  obs.fields["game_loop"] = FieldArray::Constant(1, 1, step_count_ * kGameLoopsPerStep);

  FieldArray score = FieldArray::Zero(1, 13);
  score(0, 0) = std::lround(score_);
  score(0, 5) = roaches_killed_ * 125;  // killed_value_units
  obs.fields["score_cumulative"] = score;

  obs.fields["control_groups"] = FieldArray::Zero(10, 2);

  std::vector<const Unit*> selected;
  for (const Unit& u : units_) {
    if (u.selected) selected.push_back(&u);
  }
  FieldArray rows(selected.size(), kUnitRowSize);
  rows.setZero();
  for (size_t i = 0; i < selected.size(); ++i) {
    rows(i, 0) = selected[i]->unit_type;
    rows(i, 1) = selected[i]->owner;
    rows(i, 2) = std::lround(selected[i]->hp);
  }
  obs.fields["single_select"] = selected.size() == 1 ? rows : FieldArray(0, kUnitRowSize);
  obs.fields["multi_select"] = selected.size() > 1 ? rows : FieldArray(0, kUnitRowSize);
  obs.fields["cargo"] = FieldArray(0, kUnitRowSize);
  obs.fields["cargo_slots_available"] = FieldArray::Zero(1, 1);
  obs.fields["build_queue"] = FieldArray(0, kUnitRowSize);
  return ts;
}

std::vector<function_id_t> MiniGameEnv::available_actions() const {
  std::vector<function_id_t> ids = {C::kNoOp, C::kMoveCamera, C::kSelectPoint, C::kSelectRect};
  if (num_units(kPlayerSelf) > 0) {
    ids.push_back(C::kSelectArmy);
  }
  bool any_selected = std::any_of(units_.begin(), units_.end(), [](const Unit& u) {
    return u.selected && u.owner == kPlayerSelf;
  });
  if (any_selected) {
    for (function_id_t id : {C::kAttackScreen, C::kAttackMinimap, C::kHoldPositionQuick,
                             C::kMoveScreen, C::kMoveMinimap, C::kSmartScreen, C::kSmartMinimap,
                             C::kStopQuick}) {
      ids.push_back(id);
    }
  }
  return ids;
}

void MiniGameEnv::paint(FeatureLayers& screen, FeatureLayers& minimap, const Unit& unit) const {
  int s = spatial_config_.screen_size;
  int m = spatial_config_.minimap_size;
  int player_id = unit.owner == kPlayerSelf ? 1 : unit.owner == kPlayerEnemy ? 2 : 16;
  float radius = unit.unit_type == kBeaconType ? kBeaconRadius * scale_ : 0.5f;

  int x0 = std::max(0, int(unit.x - radius));
  int x1 = std::min(s - 1, int(unit.x + radius));
  int y0 = std::max(0, int(unit.y - radius));
  int y1 = std::min(s - 1, int(unit.y + radius));
  for (int y = y0; y <= y1; ++y) {
    for (int x = x0; x <= x1; ++x) {
      bool covered = (int(unit.x) == x && int(unit.y) == y) ||
                     distance(unit.x, unit.y, x + 0.5f, y + 0.5f) <= radius;
      if (!covered) continue;

      screen(ScreenChannel::kPlayerId, y, x) = player_id;
      screen(ScreenChannel::kPlayerRelative, y, x) = unit.owner;
      screen(ScreenChannel::kUnitType, y, x) = unit.unit_type;
      screen(ScreenChannel::kSelected, y, x) = unit.selected ? 1 : 0;
      if (unit.max_hp > 0) {
        screen(ScreenChannel::kUnitHitPoints, y, x) = std::lround(unit.hp);
        screen(ScreenChannel::kUnitHitPointsRatio, y, x) = std::lround(255 * unit.hp / unit.max_hp);
      }
      screen(ScreenChannel::kUnitDensity, y, x) += 1;
      screen(ScreenChannel::kUnitDensityAa, y, x) =
        std::min(255, screen(ScreenChannel::kUnitDensityAa, y, x) + 16);
    }
  }

  int mx = std::clamp(int(unit.x * m / s), 0, m - 1);
  int my = std::clamp(int(unit.y * m / s), 0, m - 1);
  minimap(MinimapChannel::kPlayerId, my, mx) = player_id;
  minimap(MinimapChannel::kPlayerRelative, my, mx) = unit.owner;
  minimap(MinimapChannel::kSelected, my, mx) = unit.selected ? 1 : 0;
}

float MiniGameEnv::distance(float x1, float y1, float x2, float y2) {
  return std::hypot(x1 - x2, y1 - y2);
}

}  // namespace sc2
