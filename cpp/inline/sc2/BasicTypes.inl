#include "sc2/BasicTypes.hpp"

#include "util/Exceptions.hpp"

namespace sc2 {

inline Race parse_race(const std::string& str) {
  if (str == "T") return Race::kTerran;
  if (str == "P") return Race::kProtoss;
  if (str == "Z") return Race::kZerg;
  throw util::CleanException("Invalid race \"{}\" (must be one of T, P, Z)", str);
}

inline const char* race_name(Race race) {
  switch (race) {
    case Race::kNeutral:
      return "Neutral";
    case Race::kTerran:
      return "Terran";
    case Race::kProtoss:
      return "Protoss";
    case Race::kZerg:
      return "Zerg";
  }
  return "?";
}

}  // namespace sc2
