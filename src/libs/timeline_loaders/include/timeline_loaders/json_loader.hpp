#pragma once

#include <timeline_layout/layout_config.hpp>
#include <timeline_model/types.hpp>
#include <optional>
#include <istream>
#include <string>

namespace timeline_loaders {

std::optional<timeline_model::TimelineData> load_timeline_from_json(std::istream& in);
std::optional<timeline_model::TimelineData> load_timeline_from_json_file(const std::string& path);

// Every key is optional; missing keys keep the defaults of LayoutConfig.
std::optional<timeline_layout::LayoutConfig> load_layout_config_from_json(std::istream& in);
std::optional<timeline_layout::LayoutConfig> load_layout_config_from_json_file(const std::string& path);

} // namespace timeline_loaders
