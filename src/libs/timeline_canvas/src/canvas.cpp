#include <timeline_canvas/canvas.hpp>
#include <timeline_layout/axis_transform.hpp>
#include <timeline_layout/label_placer.hpp>
#include <timeline_layout/hit_test.hpp>
#include <timeline_layout/year_range.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>
#include "imgui.h"
#include <cfloat>
#include <cmath>
#include <filesystem>
#include <memory>
#include <vector>

namespace {

// Mouse wheel notches arrive in lines; the zoom and pan curves expect pixel deltas.
const double wheel_notch_pixels = 100.0;
const float minimap_margin = 10.0f;
const double drag_report_threshold = 0.5;

std::filesystem::path find_project_root() {
    std::filesystem::path p = std::filesystem::current_path();
    for (int i = 0; i < 8; ++i) {
        if (std::filesystem::exists(p / "CMakeLists.txt") && std::filesystem::exists(p / "src")) {
            return p;
        }
        if (!p.has_parent_path()) break;
        p = p.parent_path();
    }
    return std::filesystem::current_path();
}

std::shared_ptr<spdlog::logger> canvas_logger() {
    static std::shared_ptr<spdlog::logger> logger;
    if (logger) return logger;

    try {
        const std::filesystem::path logs_dir = find_project_root() / "logs";
        std::filesystem::create_directories(logs_dir);
        const std::filesystem::path log_file = logs_dir / "timeline_canvas_latest.log";
        logger = spdlog::basic_logger_mt("timeline_canvas_logger", log_file.string(), true);
        // Follows --log-level, which main applies to the default logger before any canvas exists.
        logger->set_level(spdlog::get_level());
        logger->flush_on(spdlog::level::info);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        logger->info("Canvas logger initialized. file={}", log_file.string());
    } catch (const spdlog::spdlog_ex&) {
        logger = spdlog::default_logger();
    } catch (const std::filesystem::filesystem_error&) {
        logger = spdlog::default_logger();
    }
    return logger;
}

std::string pair_key(const std::string& a, const std::string& b) {
    if (a < b) return a + "|" + b;
    return b + "|" + a;
}

ImU32 to_imgui(const timeline_render::Color& c) {
    return IM_COL32(c.r, c.g, c.b, c.a);
}

ImVec2 at(ImVec2 origin, const timeline_layout::Point& p) {
    return ImVec2(origin.x + static_cast<float>(p.x), origin.y + static_cast<float>(p.y));
}

} // namespace

namespace timeline_canvas {

double ImGuiTextMeasurer::text_width(const std::string& text, double font_size) const {
    ImFont* font = ImGui::GetFont();
    if (!font) return timeline_layout::ApproxTextMeasurer().text_width(text, font_size);
    return font->CalcTextSizeA(static_cast<float>(font_size), FLT_MAX, 0.0f, text.c_str()).x;
}

TimelineCanvas::TimelineCanvas() = default;

TimelineCanvas::~TimelineCanvas() = default;

void TimelineCanvas::set_timeline(const timeline_model::TimelineData* data) {
    data_ = data;
    gestures_ = timeline_layout::GestureController(config_);
    active_overlap_pairs_.clear();
    selected_id_.clear();
    focused_lane_.reset();
    reset_view();
}

void TimelineCanvas::set_config(const timeline_layout::LayoutConfig& config) {
    config_ = config;
    gestures_ = timeline_layout::GestureController(config_);
}

void TimelineCanvas::set_focused_lane(const std::optional<std::string>& lane_id) {
    focused_lane_ = lane_id;
    active_overlap_pairs_.clear();
    reset_view();
}

std::optional<timeline_layout::YearRange> TimelineCanvas::focused_window() const {
    if (!data_ || !focused_lane_) return std::nullopt;
    for (const auto& lane : data_->lanes) {
        if (lane.id == *focused_lane_)
            return timeline_layout::resolve_lane_window(lane, config_.range);
    }
    return std::nullopt;
}

timeline_layout::YearRange TimelineCanvas::current_range() const {
    if (auto window = focused_window()) return *window;
    if (data_) return timeline_layout::resolve_year_range(*data_, config_.range);
    return { config_.range.default_start_year, config_.range.default_end_year };
}

void TimelineCanvas::zoom_in() {
    view_ = timeline_layout::AxisTransform(current_range(), view_, config_.axis)
        .zoomed_at_center(config_.wheel.button_zoom_step);
}

void TimelineCanvas::zoom_out() {
    view_ = timeline_layout::AxisTransform(current_range(), view_, config_.axis)
        .zoomed_at_center(1.0 / config_.wheel.button_zoom_step);
}

void TimelineCanvas::reset_view() {
    view_ = timeline_layout::AxisTransform(current_range(), view_, config_.axis).reset();
}

void TimelineCanvas::jump_to_year(double year) {
    if (!std::isfinite(year)) return;
    view_ = timeline_layout::AxisTransform(current_range(), view_, config_.axis).centered_on(year);
    canvas_logger()->info("jump_to_year year={} offset_x={}", year, view_.offset_x);
}

bool TimelineCanvas::minimap_contains(float local_x, float local_y, float region_width, float region_height) const {
    if (!show_minimap_ || !data_) return false;
    const float left = region_width - static_cast<float>(config_.minimap.width) - minimap_margin;
    const float top = region_height - static_cast<float>(config_.minimap.height) - minimap_margin;
    return local_x >= left && local_x <= left + config_.minimap.width &&
           local_y >= top && local_y <= top + config_.minimap.height;
}

void TimelineCanvas::handle_keys() {
    if (!ImGui::IsWindowFocused()) return;
    if (ImGui::IsKeyPressed(ImGuiKey_Equal) || ImGui::IsKeyPressed(ImGuiKey_KeypadAdd)) zoom_in();
    if (ImGui::IsKeyPressed(ImGuiKey_Minus) || ImGui::IsKeyPressed(ImGuiKey_KeypadSubtract)) zoom_out();
    if (ImGui::IsKeyPressed(ImGuiKey_0) || ImGui::IsKeyPressed(ImGuiKey_Keypad0)) reset_view();
}

void TimelineCanvas::handle_input(ImVec2 region_min, float region_width, float region_height) {
    ImGuiIO& io = ImGui::GetIO();
    const ImVec2 mouse = io.MousePos;
    const float local_x = mouse.x - region_min.x;
    const float local_y = mouse.y - region_min.y;
    const bool in_region = local_x >= 0 && local_x <= region_width &&
                           local_y >= 0 && local_y <= region_height;
    const auto range = current_range();
    const double minimap_left = region_width - config_.minimap.width - minimap_margin;

    handle_keys();

    if (gestures_.mode() == timeline_layout::GestureMode::NavigatingOverview) {
        if (ImGui::IsMouseReleased(0)) {
            gestures_.overview_up();
        } else if (io.MouseDelta.x != 0.0f) {
            view_ = gestures_.overview_move(view_, range, local_x - minimap_left);
        }
        return;
    }

    if (!in_region) {
        const auto mode = gestures_.mode();
        if (mode == timeline_layout::GestureMode::Panning || mode == timeline_layout::GestureMode::DraggingEntity)
            view_ = gestures_.pointer_leave(view_);
        return;
    }

    if (ImGui::IsMouseClicked(0)) {
        if (minimap_contains(local_x, local_y, region_width, region_height)) {
            view_ = gestures_.overview_down(view_, range, local_x - minimap_left);
            return;
        }

        if (io.KeyShift && focused_lane_ && on_year_pick_) {
            const timeline_layout::AxisTransform transform(range, view_, config_.axis);
            const double year = timeline_layout::snap_year(transform, local_x);
            canvas_logger()->info("year_picked lane={} year={}", *focused_lane_, year);
            on_year_pick_(*focused_lane_, year);
            return;
        }

        if (auto hit = timeline_layout::hit_test_entity(scene_, local_x, local_y, config_.hit_slop))
            selected_id_ = *hit;
        view_ = gestures_.pointer_down(view_, scene_, local_x, local_y);
    } else if (ImGui::IsMouseReleased(0)) {
        view_ = gestures_.pointer_up(view_, range, local_x, local_y);
        report_completed_drag();
    } else if (io.MouseDelta.x != 0.0f || io.MouseDelta.y != 0.0f) {
        view_ = gestures_.pointer_move(view_, local_x, local_y);
    }

    if (io.MouseWheel != 0.0f || io.MouseWheelH != 0.0f) {
        timeline_layout::WheelInput input;
        input.pointer_x = local_x;
        input.delta_x = -io.MouseWheelH * wheel_notch_pixels;
        input.delta_y = -io.MouseWheel * wheel_notch_pixels;
        input.ctrl = io.KeyCtrl;
        input.meta = io.KeySuper;
        view_ = gestures_.wheel(view_, range, input);
    }
}

void TimelineCanvas::report_completed_drag() {
    auto result = gestures_.take_completed_drag();
    if (!result) return;

    for (const auto& e : scene_.entities) {
        if (e.item.source_id != result->entity_id) continue;
        if (std::abs(e.item.x - result->x) < drag_report_threshold &&
            std::abs(e.item.y - result->y) < drag_report_threshold)
            return;
        break;
    }

    canvas_logger()->info("entity_dragged id={} x={} y={} year={}",
        result->entity_id, result->x, result->y, result->year);
    if (on_drag_) on_drag_(*result);
}

void TimelineCanvas::log_gesture_transition() {
    const auto mode = gestures_.mode();
    if (mode == last_logged_mode_) return;
    canvas_logger()->info(timeline_layout::describe_gesture_transition(last_logged_mode_, mode));
    last_logged_mode_ = mode;
}

void TimelineCanvas::paint(ImDrawList* dl, ImVec2 origin, const timeline_render::DrawList& list) const {
    dl->AddRectFilled(origin, ImVec2(origin.x + static_cast<float>(list.width), origin.y + static_cast<float>(list.height)),
        to_imgui(list.background));

    ImFont* font = ImGui::GetFont();
    for (const auto& cmd : list.commands) {
        const ImU32 col = to_imgui(cmd.color);
        const float thickness = static_cast<float>(cmd.thickness);
        switch (cmd.kind) {
        case timeline_render::CommandKind::Line:
            dl->AddLine(at(origin, cmd.p0), at(origin, cmd.p1), col, thickness);
            break;
        case timeline_render::CommandKind::FilledRect:
            dl->AddRectFilled(at(origin, cmd.p0), at(origin, cmd.p1), col);
            break;
        case timeline_render::CommandKind::StrokedRect:
            dl->AddRect(at(origin, cmd.p0), at(origin, cmd.p1), col, 0.0f, 0, thickness);
            break;
        case timeline_render::CommandKind::Curve:
            dl->AddBezierCubic(at(origin, cmd.p0), at(origin, cmd.p1), at(origin, cmd.p2), at(origin, cmd.p3),
                col, thickness);
            break;
        case timeline_render::CommandKind::FilledTriangle:
            dl->AddTriangleFilled(at(origin, cmd.p0), at(origin, cmd.p1), at(origin, cmd.p2), col);
            break;
        case timeline_render::CommandKind::FilledCircle:
            dl->AddCircleFilled(at(origin, cmd.p0), static_cast<float>(cmd.radius), col);
            break;
        case timeline_render::CommandKind::Text: {
            if (!font || cmd.text.empty()) break;
            const float size = static_cast<float>(cmd.font_size);
            const ImVec2 extent = font->CalcTextSizeA(size, FLT_MAX, 0.0f, cmd.text.c_str());
            ImVec2 pos = at(origin, cmd.p0);
            if (cmd.align == timeline_render::TextAlign::Center) pos.x -= extent.x * 0.5f;
            else if (cmd.align == timeline_render::TextAlign::Right) pos.x -= extent.x;
            pos.y -= extent.y * 0.5f;
            dl->AddText(font, size, pos, col, cmd.text.c_str());
            if (cmd.bold) dl->AddText(font, size, ImVec2(pos.x + 1.0f, pos.y), col, cmd.text.c_str());
            break;
        }
        }
    }
}

bool TimelineCanvas::update_and_draw(float region_width, float region_height) {
    if (region_width <= 0 || region_height <= 0) return false;

    const ImVec2 region_min = ImGui::GetCursorScreenPos();
    const ImVec2 region_max = ImVec2(region_min.x + region_width, region_min.y + region_height);
    view_.pixel_width = region_width;
    view_.pixel_height = region_height;

    handle_input(region_min, region_width, region_height);
    log_gesture_transition();

    ImDrawList* draw_list = ImGui::GetWindowDrawList();
    if (!draw_list) return true;

    if (!data_) {
        draw_list->AddRectFilled(region_min, region_max, IM_COL32(255, 255, 255, 255));
        return true;
    }

    scene_ = timeline_layout::build_scene(*data_, view_, config_, measurer_, focused_window());
    log_visual_overlaps();

    timeline_render::RenderOptions options;
    options.selected_entity_id = selected_id_;
    options.show_relation_labels = show_relation_labels_;
    options.dragged_entity_id = gestures_.dragged_entity_id();
    options.drag_position = gestures_.drag_position();

    draw_list->PushClipRect(region_min, region_max, true);
    paint(draw_list, region_min, timeline_render::build_draw_commands(scene_, options, config_, &measurer_));

    if (show_minimap_) {
        const ImVec2 minimap_origin(
            region_max.x - static_cast<float>(config_.minimap.width) - minimap_margin,
            region_max.y - static_cast<float>(config_.minimap.height) - minimap_margin);
        paint(draw_list, minimap_origin,
            timeline_render::build_minimap_commands(*data_, scene_.range, view_, config_));
    }
    draw_list->PopClipRect();

    return true;
}

void TimelineCanvas::log_visual_overlaps() {
    auto logger = canvas_logger();
    std::unordered_set<std::string> current_pairs;

    for (std::size_t lane = 0; lane < scene_.lanes.size(); ++lane) {
        std::vector<timeline_layout::PlacedItem> items;
        for (const auto& ev : scene_.events)
            if (ev.lane_index == lane) items.push_back(ev.item);
        for (const auto& e : scene_.entities)
            if (e.lane_index == lane) items.push_back(e.item);

        for (const auto& [i, j] : timeline_layout::find_overlaps(items)) {
            const auto& a = items[i];
            const auto& b = items[j];
            const std::string key = pair_key(a.source_id, b.source_id);
            current_pairs.insert(key);
            if (active_overlap_pairs_.find(key) == active_overlap_pairs_.end()) {
                logger->warn(
                    "overlap_detected pair={} lane={} scale={} "
                    "a_rect=({}, {}, {}, {}) b_rect=({}, {}, {}, {})",
                    key, scene_.lanes[lane].lane_id, scene_.view.scale,
                    a.left(), a.top(), a.width, a.height,
                    b.left(), b.top(), b.width, b.height);
            }
        }
    }

    for (const auto& key : active_overlap_pairs_) {
        if (current_pairs.find(key) == current_pairs.end()) {
            logger->info("overlap_resolved pair={}", key);
        }
    }

    active_overlap_pairs_ = std::move(current_pairs);
}

} // namespace timeline_canvas
