#include "rospec.hpp"

#include <algorithm>

namespace llrp::model {

const char* RoSpecStateName(RoSpecState state) {
  switch (state) {
    case RoSpecState::kDisabled: return "Disabled";
    case RoSpecState::kInactive: return "Inactive";
    case RoSpecState::kActive: return "Active";
  }
  return "Unknown";
}

std::vector<std::uint16_t> AntennasOf(const RoSpec& spec) {
  std::vector<std::uint16_t> out;
  auto add = [&out](std::uint16_t id) {
    if (std::find(out.begin(), out.end(), id) == out.end()) {
      out.push_back(id);
    }
  };

  for (const auto& entry : spec.specs) {
    if (const auto* ai = std::get_if<AiSpec>(&entry)) {
      for (auto id : ai->antenna_ids) {
        add(id);
      }
    } else if (const auto* survey = std::get_if<RfSurveySpec>(&entry)) {
      add(survey->antenna_id);
    }
  }

  std::sort(out.begin(), out.end());
  return out;
}

} // namespace llrp::model
