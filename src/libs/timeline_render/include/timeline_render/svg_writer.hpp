#pragma once

#include <timeline_render/draw_commands.hpp>
#include <timeline_layout/layout_config.hpp>
#include <timeline_layout/text_measure.hpp>
#include <timeline_model/types.hpp>
#include <ostream>
#include <string>

namespace timeline_render {

void write_svg(const DrawList& list, std::ostream& out);
std::string to_svg(const DrawList& list);

// Placement pass at scale 1 / offset 0 for a width x height image, written as SVG.
std::string export_svg(const timeline_model::TimelineData& data,
    double width, double height,
    const timeline_layout::LayoutConfig& config,
    const timeline_layout::TextMeasurer& measurer);

bool export_svg_file(const std::string& path,
    const timeline_model::TimelineData& data,
    double width, double height,
    const timeline_layout::LayoutConfig& config,
    const timeline_layout::TextMeasurer& measurer);

std::string escape_xml(const std::string& s);

} // namespace timeline_render
