#pragma once

#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace betarb {

// Money fields are written rounded to cents. Reading an opportunity back
// therefore yields cent-precision stakes.
void to_json(nlohmann::json& j, const StakeLeg& l);
void from_json(const nlohmann::json& j, StakeLeg& l);

void to_json(nlohmann::json& j, const Opportunity& o);
void from_json(const nlohmann::json& j, Opportunity& o);

} // namespace betarb
