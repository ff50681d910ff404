#pragma once

#include <cstdint>
#include <string>

namespace sc2 {

using function_id_t = int;
using action_index_t = int;

enum class Race : int8_t { kNeutral, kTerran, kProtoss, kZerg };

// Parses "T", "P" or "Z". Throws util::CleanException for anything else.
Race parse_race(const std::string& str);

const char* race_name(Race race);

enum class StepType : int8_t { kFirst, kMid, kLast };

// Values of the player_relative feature layer.
constexpr int kPlayerNone = 0;
constexpr int kPlayerSelf = 1;
constexpr int kPlayerAlly = 2;
constexpr int kPlayerNeutral = 3;
constexpr int kPlayerEnemy = 4;

// Unit ids at or above this value are outside the known catalogue and are not tracked.
constexpr int kNumUnitTypes = 512;

// Width of a row in the unit-list observation fields (single_select, multi_select, cargo,
// build_queue): unit_type, player_relative, health, shields, energy, transport_slots_taken,
// build_progress.
constexpr int kUnitRowSize = 7;

}  // namespace sc2

#include "inline/sc2/BasicTypes.inl"
