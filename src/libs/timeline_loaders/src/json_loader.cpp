#include <timeline_loaders/json_loader.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>

namespace timeline_loaders {

namespace {

std::optional<std::string> string_field(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return std::nullopt;
}

std::optional<double> number_field(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_number()) return j[key].get<double>();
    return std::nullopt;
}

// First of the given keys that holds a string.
std::optional<std::string> string_field(const nlohmann::json& j, const char* key, const char* alt) {
    if (auto v = string_field(j, key)) return v;
    return string_field(j, alt);
}

std::optional<timeline_model::TimelineData> parse_timeline(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    timeline_model::TimelineData d;
    if (auto name = string_field(j, "name")) d.name = *name;

    if (j.contains("lanes") && j["lanes"].is_array()) {
        for (const auto& l : j["lanes"]) {
            auto id = string_field(l, "id");
            if (!id) return std::nullopt;
            timeline_model::Lane lane;
            lane.id = *id;
            lane.name = string_field(l, "name").value_or(lane.id);
            lane.declared_start = number_field(l, "start_year");
            lane.declared_end = number_field(l, "end_year");
            d.lanes.push_back(std::move(lane));
        }
    }

    if (j.contains("thinkers") && j["thinkers"].is_array()) {
        for (const auto& t : j["thinkers"]) {
            auto id = string_field(t, "id");
            if (!id) return std::nullopt;
            timeline_model::PositionedEntity e;
            e.id = *id;
            e.lane_id = string_field(t, "timeline_id", "lane_id").value_or("");
            e.label = string_field(t, "name").value_or(e.id);
            e.birth_year = number_field(t, "birth_year");
            e.death_year = number_field(t, "death_year");
            e.anchor_year = timeline_model::resolve_anchor_year(number_field(t, "anchor_year"), e.birth_year, e.death_year);
            d.entities.push_back(std::move(e));
        }
    }

    if (j.contains("events") && j["events"].is_array()) {
        for (const auto& ev : j["events"]) {
            auto id = string_field(ev, "id");
            auto year = number_field(ev, "year");
            if (!id || !year) return std::nullopt;
            timeline_model::MarkerEvent m;
            m.id = *id;
            m.lane_id = string_field(ev, "timeline_id", "lane_id").value_or("");
            m.year = *year;
            m.label = string_field(ev, "name").value_or(m.id);
            m.kind = timeline_model::event_kind_from_string(string_field(ev, "event_type").value_or("other"));
            d.events.push_back(std::move(m));
        }
    }

    if (j.contains("connections") && j["connections"].is_array()) {
        for (const auto& c : j["connections"]) {
            auto from = string_field(c, "from_thinker_id", "from");
            auto to = string_field(c, "to_thinker_id", "to");
            if (!from || !to) return std::nullopt;
            timeline_model::Relation r;
            r.from_entity_id = *from;
            r.to_entity_id = *to;
            r.id = string_field(c, "id").value_or(*from + "->" + *to);
            r.label = string_field(c, "name", "label").value_or("");
            d.relations.push_back(std::move(r));
        }
    }

    return d;
}

void read_number(const nlohmann::json& j, const char* key, double& out) {
    if (auto v = number_field(j, key)) out = *v;
}

void read_int(const nlohmann::json& j, const char* key, int& out) {
    if (j.contains(key) && j[key].is_number_integer()) out = j[key].get<int>();
}

const nlohmann::json* section(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_object()) return &j[key];
    return nullptr;
}

void read_item_style(const nlohmann::json& j, timeline_layout::ItemStyle& s) {
    read_number(j, "font_size", s.font_size);
    read_number(j, "text_padding", s.text_padding);
    read_number(j, "height", s.height);
    read_number(j, "axis_offset", s.axis_offset);
    read_number(j, "top_inset", s.top_inset);
}

std::optional<timeline_layout::LayoutConfig> parse_config(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    timeline_layout::LayoutConfig c;

    if (auto s = section(j, "axis")) {
        read_number(*s, "padding", c.axis.padding);
        read_number(*s, "content_width_fraction", c.axis.content_width_fraction);
        read_number(*s, "min_scale", c.axis.min_scale);
        read_number(*s, "max_scale", c.axis.max_scale);
    }
    if (auto s = section(j, "range")) {
        read_number(*s, "default_start_year", c.range.default_start_year);
        read_number(*s, "default_end_year", c.range.default_end_year);
        read_number(*s, "min_padding_years", c.range.min_padding_years);
        read_number(*s, "padding_fraction", c.range.padding_fraction);
        read_number(*s, "rounding_years", c.range.rounding_years);
    }
    if (auto s = section(j, "ticks"))
        read_number(*s, "min_major_spacing", c.ticks.min_major_spacing);
    if (auto s = section(j, "placement")) {
        read_number(*s, "horizontal_margin_base", c.placement.horizontal_margin_base);
        read_number(*s, "horizontal_margin_min", c.placement.horizontal_margin_min);
        read_number(*s, "vertical_margin_base", c.placement.vertical_margin_base);
        read_number(*s, "vertical_margin_min", c.placement.vertical_margin_min);
        read_int(*s, "max_attempts", c.placement.max_attempts);
    }
    if (auto s = section(j, "entity")) read_item_style(*s, c.entity);
    if (auto s = section(j, "event")) read_item_style(*s, c.event);
    read_int(j, "event_label_max_chars", c.event_label_max_chars);
    read_int(j, "event_label_truncated_chars", c.event_label_truncated_chars);
    if (auto s = section(j, "lanes")) {
        read_number(*s, "top_scale_height", c.lanes.top_scale_height);
        read_number(*s, "axis_fraction", c.lanes.axis_fraction);
    }
    if (auto s = section(j, "relations")) {
        read_number(*s, "arrow_size", c.relations.arrow_size);
        read_number(*s, "same_lane_dip", c.relations.same_lane_dip);
        read_number(*s, "label_lift", c.relations.label_lift);
    }
    if (auto s = section(j, "minimap")) {
        read_number(*s, "width", c.minimap.width);
        read_number(*s, "height", c.minimap.height);
        read_number(*s, "padding", c.minimap.padding);
    }
    if (auto s = section(j, "wheel")) {
        read_number(*s, "pinch_delta_threshold", c.wheel.pinch_delta_threshold);
        read_number(*s, "pinch_zoom_sensitivity", c.wheel.pinch_zoom_sensitivity);
        read_number(*s, "wheel_zoom_sensitivity", c.wheel.wheel_zoom_sensitivity);
        read_number(*s, "pan_multiplier", c.wheel.pan_multiplier);
        read_number(*s, "button_zoom_step", c.wheel.button_zoom_step);
    }
    read_number(j, "cull_margin", c.cull_margin);
    read_number(j, "hit_slop", c.hit_slop);
    return c;
}

} // namespace

std::optional<timeline_model::TimelineData> load_timeline_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_timeline(j);
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("timeline json: {}", e.what());
        return std::nullopt;
    }
}

std::optional<timeline_model::TimelineData> load_timeline_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return std::nullopt;
    return load_timeline_from_json(f);
}

std::optional<timeline_layout::LayoutConfig> load_layout_config_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_config(j);
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("layout config json: {}", e.what());
        return std::nullopt;
    }
}

std::optional<timeline_layout::LayoutConfig> load_layout_config_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return std::nullopt;
    return load_layout_config_from_json(f);
}

} // namespace timeline_loaders
