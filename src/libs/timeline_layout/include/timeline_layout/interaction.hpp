#pragma once

#include <timeline_layout/layout_config.hpp>
#include <timeline_layout/scene.hpp>
#include <timeline_layout/types.hpp>
#include <optional>
#include <string>

namespace timeline_layout {

struct WheelInput {
    double pointer_x = 0;
    double delta_x = 0;
    double delta_y = 0;
    bool ctrl = false; // also set by trackpad pinch on most platforms
    bool meta = false;
};

enum class WheelAction { Zoom, Pan };

struct WheelDecision {
    WheelAction action = WheelAction::Zoom;
    bool pinch = false;
    double zoom_delta = 1.0; // multiplicative
    double pan_dx = 0.0;
};

// Plain scroll zooms, ctrl/meta + scroll pans by delta_x (delta_y when delta_x is 0).
// A ctrl event with |delta_y| below the pinch threshold is a trackpad pinch and
// zooms with the higher sensitivity.
WheelDecision classify_wheel(const WheelInput& input, const WheelConfig& config = {});

enum class GestureMode {
    Idle,
    Panning,
    Zooming,
    DraggingEntity,
    NavigatingOverview
};

const char* gesture_mode_name(GestureMode mode);
// "gesture idle -> panning"
std::string describe_gesture_transition(GestureMode from, GestureMode to);

struct EntityDragResult {
    std::string entity_id;
    double x = 0;    // final item center
    double y = 0;
    double year = 0; // round(x_to_year(x))
};

// Transient per-gesture state. The view itself is passed in and returned by
// every handler; nothing here survives the end of a gesture, and abandoning a
// gesture (pointer leaves) needs no rollback.
class GestureController {
public:
    explicit GestureController(const LayoutConfig& config = {});

    GestureMode mode() const { return mode_; }
    const std::string& dragged_entity_id() const { return dragged_id_; }
    // Center of the dragged item while DraggingEntity.
    std::optional<Point> drag_position() const;

    ViewState wheel(const ViewState& view, const YearRange& range, const WheelInput& input);

    // Grabs the entity under the pointer, otherwise starts panning.
    ViewState pointer_down(const ViewState& view, const PlacedScene& scene, double px, double py);
    ViewState pointer_move(const ViewState& view, double px, double py);
    ViewState pointer_up(const ViewState& view, const YearRange& range, double px, double py);
    ViewState pointer_leave(const ViewState& view);

    // Overview (minimap) navigation: every down/move recenters the main view.
    ViewState overview_down(const ViewState& view, const YearRange& range, double overview_x);
    ViewState overview_move(const ViewState& view, const YearRange& range, double overview_x);
    void overview_up();

    // Result of the last completed entity drag, consumed once.
    std::optional<EntityDragResult> take_completed_drag();

private:
    void end_zoom();

    LayoutConfig config_;
    GestureMode mode_ = GestureMode::Idle;
    double last_x_ = 0;
    double last_y_ = 0;
    std::string dragged_id_;
    double grab_dx_ = 0;
    double grab_dy_ = 0;
    double drag_x_ = 0;
    double drag_y_ = 0;
    std::optional<EntityDragResult> completed_drag_;
};

} // namespace timeline_layout
