#include "sc2/ActionSpaceDescriptor.hpp"

#include "sc2/Exceptions.hpp"
#include "util/Asserts.hpp"

namespace sc2 {

ActionSpaceDescriptor::ActionSpaceDescriptor(Race race, const SpatialConfig& spatial_config)
    : race_(race), spatial_config_(spatial_config) {
  CLEAN_ASSERT(race != Race::kNeutral, "A player faction must be selected");
  CLEAN_ASSERT(spatial_config.screen_size > 0 && spatial_config.minimap_size > 0,
               "Invalid spatial resolution (screen={} minimap={})", spatial_config.screen_size,
               spatial_config.minimap_size);

  for (const auto* def : ActionCatalogue::functions_of(Race::kNeutral)) {
    general_actions_.push_back(make_spec(*def));
  }
  for (const auto* def : ActionCatalogue::functions_of(race)) {
    race_actions_.push_back(make_spec(*def));
  }

  for (action_index_t i = 0; i < action_count(); ++i) {
    index_lookup_[resolve(i).id] = i;
  }

  for (const auto& def : ActionCatalogue::arg_types()) {
    ArgType arg_type{def.name, {}};
    for (int declared : def.sizes) {
      arg_type.dims.push_back(arg_size(def.name, declared, spatial_config_));
    }
    arg_types_.push_back(arg_type);
  }

  for (int a = 0; a < num_arg_types(); ++a) {
    head_offsets_.push_back(heads_.size());
    const ArgType& arg_type = arg_types_[a];
    for (int d = 0; d < (int)arg_type.dims.size(); ++d) {
      heads_.push_back(Head{a, d, arg_type.dims[d]});
    }
  }
}

const ActionSpec& ActionSpaceDescriptor::resolve(action_index_t index) const {
  if (index < 0 || index >= action_count()) {
    throw IndexOutOfRange("Action index {} out of range [0, {})", index, action_count());
  }
  if (index < num_general_actions()) {
    return general_actions_[index];
  }
  return race_actions_[index - num_general_actions()];
}

action_index_t ActionSpaceDescriptor::index_of(function_id_t id) const {
  auto it = index_lookup_.find(id);
  return it == index_lookup_.end() ? -1 : it->second;
}

int ActionSpaceDescriptor::arg_size(const std::string& arg_name, int declared_size,
                                    const SpatialConfig& spatial_config) {
  if (declared_size > 0) return declared_size;
  if (arg_name == "minimap") return spatial_config.minimap_size;
  return spatial_config.screen_size;
}

int ActionSpaceDescriptor::head_index(int arg_type, int dim) const {
  if (arg_type < 0 || arg_type >= num_arg_types()) {
    throw IndexOutOfRange("Argument type {} out of range [0, {})", arg_type, num_arg_types());
  }
  int num_dims = arg_types_[arg_type].dims.size();
  if (dim < 0 || dim >= num_dims) {
    throw IndexOutOfRange("Dimension {} of argument {} out of range [0, {})", dim,
                          arg_types_[arg_type].name, num_dims);
  }
  return head_offsets_[arg_type] + dim;
}

ActionMask ActionSpaceDescriptor::mask_of(const std::vector<function_id_t>& available_ids) const {
  ActionMask mask(action_count());
  for (function_id_t id : available_ids) {
    action_index_t index = index_of(id);
    if (index >= 0) mask.set(index);
  }
  return mask;
}

ActionSpec ActionSpaceDescriptor::make_spec(const ActionCatalogue::FunctionDef& def) {
  return ActionSpec{def.id, def.name, def.arg_types};
}

}  // namespace sc2
