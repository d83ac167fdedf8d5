#include <timeline_render/svg_writer.hpp>
#include <timeline_layout/scene.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>

namespace timeline_render {

namespace {

void write_color(std::ostream& out, const char* attr, const Color& c) {
    out << ' ' << attr << "=\"rgb(" << int(c.r) << ',' << int(c.g) << ',' << int(c.b) << ")\"";
    if (c.a != 255)
        out << ' ' << attr << "-opacity=\"" << (c.a / 255.0) << '"';
}

const char* text_anchor(TextAlign align) {
    switch (align) {
    case TextAlign::Left: return "start";
    case TextAlign::Center: return "middle";
    case TextAlign::Right: return "end";
    }
    return "start";
}

void write_command(std::ostream& out, const DrawCommand& cmd) {
    switch (cmd.kind) {
    case CommandKind::Line:
        out << "<line x1=\"" << cmd.p0.x << "\" y1=\"" << cmd.p0.y
            << "\" x2=\"" << cmd.p1.x << "\" y2=\"" << cmd.p1.y << '"';
        write_color(out, "stroke", cmd.color);
        out << " stroke-width=\"" << cmd.thickness << "\"/>\n";
        break;
    case CommandKind::FilledRect:
    case CommandKind::StrokedRect:
        out << "<rect x=\"" << cmd.p0.x << "\" y=\"" << cmd.p0.y
            << "\" width=\"" << (cmd.p1.x - cmd.p0.x) << "\" height=\"" << (cmd.p1.y - cmd.p0.y) << '"';
        if (cmd.kind == CommandKind::FilledRect) {
            write_color(out, "fill", cmd.color);
        } else {
            out << " fill=\"none\"";
            write_color(out, "stroke", cmd.color);
            out << " stroke-width=\"" << cmd.thickness << '"';
        }
        out << "/>\n";
        break;
    case CommandKind::Text:
        out << "<text x=\"" << cmd.p0.x << "\" y=\"" << cmd.p0.y << '"'
            << " font-size=\"" << cmd.font_size << '"'
            << " text-anchor=\"" << text_anchor(cmd.align) << '"'
            << " dominant-baseline=\"middle\"";
        if (cmd.bold) out << " font-weight=\"bold\"";
        write_color(out, "fill", cmd.color);
        out << '>' << escape_xml(cmd.text) << "</text>\n";
        break;
    case CommandKind::Curve:
        out << "<path d=\"M " << cmd.p0.x << ' ' << cmd.p0.y
            << " C " << cmd.p1.x << ' ' << cmd.p1.y
            << ", " << cmd.p2.x << ' ' << cmd.p2.y
            << ", " << cmd.p3.x << ' ' << cmd.p3.y << "\" fill=\"none\"";
        write_color(out, "stroke", cmd.color);
        out << " stroke-width=\"" << cmd.thickness << "\"/>\n";
        break;
    case CommandKind::FilledTriangle:
        out << "<polygon points=\"" << cmd.p0.x << ',' << cmd.p0.y << ' '
            << cmd.p1.x << ',' << cmd.p1.y << ' ' << cmd.p2.x << ',' << cmd.p2.y << '"';
        write_color(out, "fill", cmd.color);
        out << "/>\n";
        break;
    case CommandKind::FilledCircle:
        out << "<circle cx=\"" << cmd.p0.x << "\" cy=\"" << cmd.p0.y << "\" r=\"" << cmd.radius << '"';
        write_color(out, "fill", cmd.color);
        out << "/>\n";
        break;
    }
}

} // namespace

std::string escape_xml(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '"': out += "&quot;"; break;
        case '\'': out += "&apos;"; break;
        default: out += c;
        }
    }
    return out;
}

void write_svg(const DrawList& list, std::ostream& out) {
    out << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << list.width
        << "\" height=\"" << list.height << "\" viewBox=\"0 0 " << list.width << ' ' << list.height
        << "\" font-family=\"sans-serif\">\n";
    out << "<rect x=\"0\" y=\"0\" width=\"" << list.width << "\" height=\"" << list.height << '"';
    write_color(out, "fill", list.background);
    out << "/>\n";
    for (const auto& cmd : list.commands)
        write_command(out, cmd);
    out << "</svg>\n";
}

std::string to_svg(const DrawList& list) {
    std::ostringstream ss;
    write_svg(list, ss);
    return ss.str();
}

std::string export_svg(const timeline_model::TimelineData& data,
    double width, double height,
    const timeline_layout::LayoutConfig& config,
    const timeline_layout::TextMeasurer& measurer)
{
    const auto scene = timeline_layout::build_export_scene(data, width, height, config, measurer);
    if (scene.exhausted_placements > 0)
        spdlog::warn("export: {} labels could not be separated", scene.exhausted_placements);
    return to_svg(build_draw_commands(scene, {}, config, &measurer));
}

bool export_svg_file(const std::string& path,
    const timeline_model::TimelineData& data,
    double width, double height,
    const timeline_layout::LayoutConfig& config,
    const timeline_layout::TextMeasurer& measurer)
{
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        spdlog::error("export: cannot open {}", path);
        return false;
    }
    file << export_svg(data, width, height, config, measurer);
    if (!file) {
        spdlog::error("export: write to {} failed", path);
        return false;
    }
    spdlog::info("export: wrote {} ({}x{})", path, width, height);
    return true;
}

} // namespace timeline_render
