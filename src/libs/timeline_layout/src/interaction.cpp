#include <timeline_layout/interaction.hpp>
#include <timeline_layout/axis_transform.hpp>
#include <timeline_layout/viewport_mapper.hpp>
#include <cmath>
#include <utility>

namespace timeline_layout {

WheelDecision classify_wheel(const WheelInput& input, const WheelConfig& config) {
    WheelDecision d;
    const bool modified = input.ctrl || input.meta;
    const bool small_delta = std::abs(input.delta_y) < config.pinch_delta_threshold;
    d.pinch = small_delta && input.ctrl;
    if (!modified || d.pinch) {
        d.action = WheelAction::Zoom;
        const double sensitivity = small_delta ? config.pinch_zoom_sensitivity : config.wheel_zoom_sensitivity;
        d.zoom_delta = 1.0 - input.delta_y * sensitivity;
    } else {
        d.action = WheelAction::Pan;
        // Horizontal swipe pans; a plain vertical wheel still pans when there is no horizontal delta.
        const double delta = input.delta_x != 0 ? input.delta_x : input.delta_y;
        d.pan_dx = -delta * config.pan_multiplier;
    }
    return d;
}

const char* gesture_mode_name(GestureMode mode) {
    switch (mode) {
    case GestureMode::Idle: return "idle";
    case GestureMode::Panning: return "panning";
    case GestureMode::Zooming: return "zooming";
    case GestureMode::DraggingEntity: return "dragging_entity";
    case GestureMode::NavigatingOverview: return "navigating_overview";
    }
    return "unknown";
}

std::string describe_gesture_transition(GestureMode from, GestureMode to) {
    return std::string("gesture ") + gesture_mode_name(from) + " -> " + gesture_mode_name(to);
}

GestureController::GestureController(const LayoutConfig& config)
    : config_(config)
{
}

std::optional<Point> GestureController::drag_position() const {
    if (mode_ != GestureMode::DraggingEntity) return std::nullopt;
    return Point{ drag_x_, drag_y_ };
}

void GestureController::end_zoom() {
    if (mode_ == GestureMode::Zooming) mode_ = GestureMode::Idle;
}

ViewState GestureController::wheel(const ViewState& view, const YearRange& range, const WheelInput& input) {
    if (mode_ != GestureMode::Idle && mode_ != GestureMode::Zooming) return view;
    const AxisTransform transform(range, view, config_.axis);
    const WheelDecision d = classify_wheel(input, config_.wheel);
    if (d.action == WheelAction::Pan) {
        mode_ = GestureMode::Idle;
        return transform.panned(d.pan_dx);
    }
    mode_ = GestureMode::Zooming;
    return transform.zoomed_at(input.pointer_x, d.zoom_delta);
}

ViewState GestureController::pointer_down(const ViewState& view, const PlacedScene& scene, double px, double py) {
    end_zoom();
    if (mode_ != GestureMode::Idle) return view;
    last_x_ = px;
    last_y_ = py;
    for (auto it = scene.entities.rbegin(); it != scene.entities.rend(); ++it) {
        const PlacedItem& item = it->item;
        if (px >= item.left() && px <= item.right() && py >= item.top() && py <= item.bottom()) {
            mode_ = GestureMode::DraggingEntity;
            dragged_id_ = item.source_id;
            grab_dx_ = px - item.x;
            grab_dy_ = py - item.y;
            drag_x_ = item.x;
            drag_y_ = item.y;
            return view;
        }
    }
    mode_ = GestureMode::Panning;
    return view;
}

ViewState GestureController::pointer_move(const ViewState& view, double px, double py) {
    end_zoom();
    ViewState next = view;
    if (mode_ == GestureMode::Panning) {
        const double dx = px - last_x_;
        if (std::isfinite(dx)) next.offset_x += dx;
    } else if (mode_ == GestureMode::DraggingEntity) {
        drag_x_ = px - grab_dx_;
        drag_y_ = py - grab_dy_;
    }
    last_x_ = px;
    last_y_ = py;
    return next;
}

ViewState GestureController::pointer_up(const ViewState& view, const YearRange& range, double px, double py) {
    ViewState next = pointer_move(view, px, py);
    if (mode_ == GestureMode::DraggingEntity) {
        const AxisTransform transform(range, next, config_.axis);
        EntityDragResult r;
        r.entity_id = dragged_id_;
        r.x = drag_x_;
        r.y = drag_y_;
        r.year = std::round(transform.x_to_year(drag_x_));
        completed_drag_ = std::move(r);
        dragged_id_.clear();
    }
    if (mode_ == GestureMode::Panning || mode_ == GestureMode::DraggingEntity)
        mode_ = GestureMode::Idle;
    return next;
}

ViewState GestureController::pointer_leave(const ViewState& view) {
    mode_ = GestureMode::Idle;
    dragged_id_.clear();
    return view;
}

ViewState GestureController::overview_down(const ViewState& view, const YearRange& range, double overview_x) {
    end_zoom();
    if (mode_ != GestureMode::Idle) return view;
    mode_ = GestureMode::NavigatingOverview;
    const ViewportMapper mapper(AxisTransform(range, view, config_.axis), config_.minimap);
    return mapper.navigate_to(overview_x);
}

ViewState GestureController::overview_move(const ViewState& view, const YearRange& range, double overview_x) {
    if (mode_ != GestureMode::NavigatingOverview) return view;
    const ViewportMapper mapper(AxisTransform(range, view, config_.axis), config_.minimap);
    return mapper.navigate_to(overview_x);
}

void GestureController::overview_up() {
    if (mode_ == GestureMode::NavigatingOverview) mode_ = GestureMode::Idle;
}

std::optional<EntityDragResult> GestureController::take_completed_drag() {
    std::optional<EntityDragResult> out = std::move(completed_drag_);
    completed_drag_.reset();
    return out;
}

} // namespace timeline_layout
