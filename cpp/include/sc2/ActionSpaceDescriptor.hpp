#pragma once

#include "sc2/ActionCatalogue.hpp"
#include "sc2/BasicTypes.hpp"

#include <boost/dynamic_bitset.hpp>

#include <map>
#include <string>
#include <vector>

namespace sc2 {

// One bit per action index: set iff the action is currently available.
using ActionMask = boost::dynamic_bitset<>;

struct SpatialConfig {
  int screen_size = 64;
  int minimap_size = 64;
};

// An argument type with every dimension resolved to a concrete size.
struct ArgType {
  std::string name;
  std::vector<int> dims;
};

struct ActionSpec {
  function_id_t id;
  std::string name;
  std::vector<int> arg_types;  // indices into ActionSpaceDescriptor::arg_types()
};

// A single categorical distribution produced by the network: one dimension of one argument type.
struct Head {
  int arg_type;
  int dim;
  int size;
};

/*
 * Immutable description of the factored action space for one faction at one spatial resolution.
 *
 * Action indices are contiguous: [0, num_general_actions()) are the faction-neutral functions,
 * followed by the faction's own functions, both in catalogue order.
 *
 * heads() is the canonical list of argument distributions. The network sizes its output layers
 * from it, and ActionCodec samples over it, so both always agree on shapes.
 */
class ActionSpaceDescriptor {
 public:
  ActionSpaceDescriptor(Race race, const SpatialConfig& spatial_config);

  Race race() const { return race_; }
  const SpatialConfig& spatial_config() const { return spatial_config_; }

  int action_count() const { return general_actions_.size() + race_actions_.size(); }
  int num_general_actions() const { return general_actions_.size(); }
  int num_race_actions() const { return race_actions_.size(); }

  // Throws IndexOutOfRange if index is not in [0, action_count()).
  const ActionSpec& resolve(action_index_t index) const;

  bool is_general(action_index_t index) const { return index < num_general_actions(); }

  // Returns -1 if the function is not part of this action space.
  action_index_t index_of(function_id_t id) const;

  const std::vector<ArgType>& arg_types() const { return arg_types_; }
  int num_arg_types() const { return arg_types_.size(); }

  /*
   * Resolves the size of one argument dimension. A declared size of 0 resolves to the minimap
   * size for the "minimap" argument and to the screen size for the other spatial arguments.
   * Nonzero declared sizes are returned as-is.
   */
  static int arg_size(const std::string& arg_name, int declared_size, const SpatialConfig&);

  const std::vector<Head>& heads() const { return heads_; }
  int num_heads() const { return heads_.size(); }

  // Index into heads() of the given argument dimension.
  int head_index(int arg_type, int dim) const;

  // Bit i is set iff resolve(i).id is in available_ids. Ids outside this action space are ignored.
  ActionMask mask_of(const std::vector<function_id_t>& available_ids) const;

 private:
  static ActionSpec make_spec(const ActionCatalogue::FunctionDef& def);

  const Race race_;
  const SpatialConfig spatial_config_;
  std::vector<ActionSpec> general_actions_;
  std::vector<ActionSpec> race_actions_;
  std::vector<ArgType> arg_types_;
  std::vector<Head> heads_;
  std::vector<int> head_offsets_;  // per arg type, index of its first head
  std::map<function_id_t, action_index_t> index_lookup_;
};

}  // namespace sc2
