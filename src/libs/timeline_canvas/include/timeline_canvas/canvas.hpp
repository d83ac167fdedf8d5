#pragma once

#include <timeline_layout/interaction.hpp>
#include <timeline_layout/layout_config.hpp>
#include <timeline_layout/scene.hpp>
#include <timeline_layout/text_measure.hpp>
#include <timeline_layout/types.hpp>
#include <timeline_model/types.hpp>
#include <timeline_render/draw_commands.hpp>
#include <functional>
#include <optional>
#include <string>
#include <unordered_set>

struct ImVec2;
struct ImDrawList;

namespace timeline_canvas {

// Widths from the current ImGui font, scaled to the requested size.
class ImGuiTextMeasurer : public timeline_layout::TextMeasurer {
public:
    double text_width(const std::string& text, double font_size) const override;
};

class TimelineCanvas {
public:
    using DragHandler = std::function<void(const timeline_layout::EntityDragResult&)>;
    using YearPickHandler = std::function<void(const std::string& lane_id, double year)>;

    TimelineCanvas();
    ~TimelineCanvas();

    void set_timeline(const timeline_model::TimelineData* data);
    const timeline_model::TimelineData* timeline() const { return data_; }

    void set_config(const timeline_layout::LayoutConfig& config);
    const timeline_layout::LayoutConfig& config() const { return config_; }

    // Shows one lane over its declared window; nullopt returns to the combined view.
    void set_focused_lane(const std::optional<std::string>& lane_id);
    const std::optional<std::string>& focused_lane() const { return focused_lane_; }

    const timeline_layout::ViewState& view() const { return view_; }
    timeline_layout::YearRange current_range() const;

    void zoom_in();
    void zoom_out();
    void reset_view();
    void jump_to_year(double year);

    void set_selected_entity(const std::string& id) { selected_id_ = id; }
    const std::string& selected_entity() const { return selected_id_; }
    void set_show_relation_labels(bool show) { show_relation_labels_ = show; }
    bool show_relation_labels() const { return show_relation_labels_; }
    void set_show_minimap(bool show) { show_minimap_ = show; }
    bool show_minimap() const { return show_minimap_; }

    void set_drag_handler(DragHandler handler) { on_drag_ = std::move(handler); }
    void set_year_pick_handler(YearPickHandler handler) { on_year_pick_ = std::move(handler); }

    timeline_layout::GestureMode gesture_mode() const { return gestures_.mode(); }
    std::size_t current_overlap_count() const { return active_overlap_pairs_.size(); }
    const timeline_layout::PlacedScene& scene() const { return scene_; }

    bool update_and_draw(float region_width, float region_height);

private:
    const timeline_model::TimelineData* data_ = nullptr;
    timeline_layout::LayoutConfig config_;
    ImGuiTextMeasurer measurer_;
    timeline_layout::GestureController gestures_;
    timeline_layout::ViewState view_;
    timeline_layout::PlacedScene scene_;
    std::optional<std::string> focused_lane_;
    std::string selected_id_;
    bool show_relation_labels_ = true;
    bool show_minimap_ = true;
    DragHandler on_drag_;
    YearPickHandler on_year_pick_;
    timeline_layout::GestureMode last_logged_mode_ = timeline_layout::GestureMode::Idle;
    std::unordered_set<std::string> active_overlap_pairs_;

    std::optional<timeline_layout::YearRange> focused_window() const;
    bool minimap_contains(float local_x, float local_y, float region_width, float region_height) const;
    void handle_input(ImVec2 region_min, float region_width, float region_height);
    void handle_keys();
    void report_completed_drag();
    void paint(ImDrawList* dl, ImVec2 origin, const timeline_render::DrawList& list) const;
    void log_gesture_transition();
    void log_visual_overlaps();
};

} // namespace timeline_canvas
