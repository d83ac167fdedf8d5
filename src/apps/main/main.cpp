// Timeline viewer: ImGui + SDL3 + OpenGL3 (C++20)
#define SDL_MAIN_HANDLED

#include "imgui.h"
#include "imgui_impl_sdl3.h"
#include "imgui_impl_opengl3.h"
#include <timeline_canvas/canvas.hpp>
#include <timeline_layout/text_measure.hpp>
#include <timeline_loaders/demo_timeline.hpp>
#include <timeline_loaders/json_loader.hpp>
#include <timeline_render/svg_writer.hpp>
#include <spdlog/spdlog.h>
#include <SDL3/SDL.h>
#include <SDL3/SDL_main.h>
#include <SDL3/SDL_opengl.h>
#include <cstdio>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

struct Options {
    std::string data_path;
    std::string config_path;
    std::string export_path;
    double export_width = 1600;
    double export_height = 900;
    std::string log_level = "info";
    bool auto_overlap_test = false;
};

void print_usage() {
    (void)fprintf(stderr,
        "usage: timeline_viewer [--data <file.json>] [--config <layout.json>]\n"
        "                       [--export-svg <out.svg> [--width W] [--height H]]\n"
        "                       [--log-level trace|debug|info|warn|error|off]\n"
        "                       [--auto-overlap-test]\n");
}

std::optional<double> parse_dimension(const std::string& s) {
    try {
        const double v = std::stod(s);
        if (v > 0) return v;
    } catch (const std::invalid_argument&) {
    } catch (const std::out_of_range&) {
    }
    return std::nullopt;
}

std::optional<Options> parse_args(int argc, char* argv[]) {
    Options o;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "--auto-overlap-test") {
            o.auto_overlap_test = true;
        } else if (arg == "--data" && has_value) {
            o.data_path = argv[++i];
        } else if (arg == "--config" && has_value) {
            o.config_path = argv[++i];
        } else if (arg == "--export-svg" && has_value) {
            o.export_path = argv[++i];
        } else if ((arg == "--width" || arg == "--height") && has_value) {
            auto v = parse_dimension(argv[++i]);
            if (!v) {
                (void)fprintf(stderr, "invalid %s: %s\n", arg.c_str(), argv[i]);
                return std::nullopt;
            }
            (arg == "--width" ? o.export_width : o.export_height) = *v;
        } else if (arg == "--log-level" && has_value) {
            o.log_level = argv[++i];
        } else {
            (void)fprintf(stderr, "unknown or incomplete argument: %s\n", arg.c_str());
            return std::nullopt;
        }
    }
    return o;
}

bool configure_logging(const std::string& level) {
    const auto lvl = spdlog::level::from_str(level);
    if (lvl == spdlog::level::off && level != "off") return false;
    spdlog::set_level(lvl);
    return true;
}

timeline_model::TimelineData load_data(const Options& opts) {
    if (!opts.data_path.empty()) {
        if (auto loaded = timeline_loaders::load_timeline_from_json_file(opts.data_path)) {
            spdlog::info("loaded {}: {} lanes, {} thinkers, {} events, {} connections",
                opts.data_path, loaded->lanes.size(), loaded->entities.size(),
                loaded->events.size(), loaded->relations.size());
            return std::move(*loaded);
        }
        spdlog::error("could not load timeline data from {}; showing the demo timeline", opts.data_path);
    }
    return timeline_loaders::generate_demo_timeline();
}

timeline_layout::LayoutConfig load_config(const Options& opts) {
    if (opts.config_path.empty()) return {};
    if (auto loaded = timeline_loaders::load_layout_config_from_json_file(opts.config_path)) {
        spdlog::info("layout config loaded from {}", opts.config_path);
        return *loaded;
    }
    spdlog::error("could not load layout config from {}; using defaults", opts.config_path);
    return {};
}

void draw_toolbar(timeline_canvas::TimelineCanvas& canvas, const timeline_model::TimelineData& data,
    double& jump_year, const std::string& status)
{
    const auto& focused = canvas.focused_lane();
    const char* preview = "All lanes";
    for (const auto& lane : data.lanes)
        if (focused && lane.id == *focused) preview = lane.name.c_str();

    ImGui::SetNextItemWidth(180.0f);
    if (ImGui::BeginCombo("##lane", preview)) {
        if (ImGui::Selectable("All lanes", !focused)) canvas.set_focused_lane(std::nullopt);
        for (const auto& lane : data.lanes) {
            ImGui::PushID(lane.id.c_str());
            if (ImGui::Selectable(lane.name.c_str(), focused && *focused == lane.id))
                canvas.set_focused_lane(lane.id);
            ImGui::PopID();
        }
        ImGui::EndCombo();
    }
    ImGui::SameLine();
    if (ImGui::Button("-")) canvas.zoom_out();
    ImGui::SameLine();
    if (ImGui::Button("+")) canvas.zoom_in();
    ImGui::SameLine();
    if (ImGui::Button("Reset")) canvas.reset_view();
    ImGui::SameLine();
    ImGui::SetNextItemWidth(90.0f);
    ImGui::InputDouble("##year", &jump_year, 0.0, 0.0, "%.0f");
    ImGui::SameLine();
    if (ImGui::Button("Go to year")) canvas.jump_to_year(jump_year);
    ImGui::SameLine();
    bool labels = canvas.show_relation_labels();
    if (ImGui::Checkbox("Connection labels", &labels)) canvas.set_show_relation_labels(labels);
    ImGui::SameLine();
    bool minimap = canvas.show_minimap();
    if (ImGui::Checkbox("Overview", &minimap)) canvas.set_show_minimap(minimap);
    ImGui::SameLine();
    ImGui::TextUnformatted(status.c_str());
}

} // namespace

int main(int argc, char* argv[])
{
    auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage();
        return 1;
    }
    if (!configure_logging(opts->log_level)) {
        (void)fprintf(stderr, "unknown log level: %s\n", opts->log_level.c_str());
        return 1;
    }

    timeline_model::TimelineData data = load_data(*opts);
    const timeline_layout::LayoutConfig config = load_config(*opts);

    if (!opts->export_path.empty()) {
        const timeline_layout::ApproxTextMeasurer measurer;
        return timeline_render::export_svg_file(opts->export_path, data,
            opts->export_width, opts->export_height, config, measurer) ? 0 : 1;
    }

    SDL_SetMainReady();
    // SDL3: SDL_Init returns true on success, false on failure
    if (!SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS)) {
        spdlog::critical("SDL_Init failed: {}", SDL_GetError());
        return 1;
    }

    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 0);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);

    int window_width = 1280;
    int window_height = 720;
    {
        SDL_Rect bounds{};
        if (SDL_GetDisplayUsableBounds(SDL_GetPrimaryDisplay(), &bounds)) {
            window_width = bounds.w * 2 / 3;
            window_height = bounds.h * 2 / 3;
        }
    }
    const SDL_WindowFlags window_flags = SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE
        | SDL_WINDOW_HIGH_PIXEL_DENSITY;
    const std::string title = data.name.empty() ? std::string("Timeline") : data.name;
    SDL_Window* window = SDL_CreateWindow(title.c_str(), window_width, window_height, window_flags);
    if (!window) {
        spdlog::critical("SDL_CreateWindow failed: {}", SDL_GetError());
        SDL_Quit();
        return 1;
    }

    SDL_GLContext gl_context = SDL_GL_CreateContext(window);
    if (!gl_context) {
        spdlog::critical("SDL_GL_CreateContext failed: {}", SDL_GetError());
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.ConfigFlags |= ImGuiConfigFlags_DpiEnableScaleFonts;
    io.ConfigFlags |= ImGuiConfigFlags_DpiEnableScaleViewports;

    ImGui::StyleColorsLight();

    ImFontConfig font_cfg;
    font_cfg.OversampleH = 2;
    font_cfg.OversampleV = 2;
    font_cfg.PixelSnapH = true;
    const float font_size_px = 18.0f;
#ifdef _WIN32
    const char* font_paths[] = {
        "C:\\Windows\\Fonts\\segoeui.ttf",
        "C:\\Windows\\Fonts\\seguisym.ttf",
        "C:\\Windows\\Fonts\\arial.ttf",
    };
#else
    const char* font_paths[] = {
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
        "/usr/share/fonts/TTF/DejaVuSans.ttf",
    };
#endif
    // Event symbols live outside Latin-1; ask for the geometric shapes block too.
    static const ImWchar glyph_ranges[] = { 0x0020, 0x00FF, 0x25A0, 0x25FF, 0x2605, 0x2606, 0 };
    bool font_loaded = false;
    for (const char* path : font_paths) {
        if (io.Fonts->AddFontFromFileTTF(path, font_size_px, &font_cfg, glyph_ranges) != nullptr) {
            font_loaded = true;
            break;
        }
    }
    if (!font_loaded)
        spdlog::warn("no system TTF font found; event symbols may not render");

    ImGui_ImplSDL3_InitForOpenGL(window, gl_context);
    ImGui_ImplOpenGL3_Init("#version 130");

    timeline_canvas::TimelineCanvas viewer_canvas;
    viewer_canvas.set_config(config);
    viewer_canvas.set_timeline(&data);

    std::string status;
    viewer_canvas.set_drag_handler([&](const timeline_layout::EntityDragResult& r) {
        for (auto& e : data.entities) {
            if (e.id != r.entity_id) continue;
            e.anchor_year = r.year;
            status = e.label + " moved to " + std::to_string(static_cast<long long>(r.year));
            break;
        }
    });
    viewer_canvas.set_year_pick_handler([&](const std::string& lane_id, double year) {
        status = "picked " + std::to_string(static_cast<long long>(year)) + " on " + lane_id;
    });

    double jump_year = 1800;
    bool running = true;
    int frame = 0;
    // Automated check: step the zoom across its whole range and require every pass to end overlap-free.
    const int auto_zoom_frames = 20;
    const int max_test_frames = 600;
    int test_exit_code = 0;
    std::size_t worst_overlaps = 0;

    while (running) {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            ImGui_ImplSDL3_ProcessEvent(&event);
            if (event.type == SDL_EVENT_QUIT)
                running = false;
            if (event.type == SDL_EVENT_WINDOW_CLOSE_REQUESTED &&
                event.window.windowID == SDL_GetWindowID(window))
                running = false;
        }

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplSDL3_NewFrame();
        ImGui::NewFrame();

        ImGui::SetNextWindowPos(ImVec2(0, 0));
        ImGui::SetNextWindowSize(io.DisplaySize);
        ImGui::Begin("Timeline", nullptr,
            ImGuiWindowFlags_NoTitleBar | ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoMove
            | ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoBringToFrontOnFocus);
        draw_toolbar(viewer_canvas, data, jump_year, status);
        ImVec2 canvas_size = ImGui::GetContentRegionAvail();
        if (canvas_size.x > 0 && canvas_size.y > 0) {
            ImGui::BeginChild("canvas", canvas_size, false, ImGuiWindowFlags_NoScrollbar);
            viewer_canvas.update_and_draw(canvas_size.x, canvas_size.y);
            ImGui::EndChild();
        }
        ImGui::End();

        if (opts->auto_overlap_test && frame > 0) {
            const std::size_t overlaps = viewer_canvas.current_overlap_count();
            if (overlaps > worst_overlaps) worst_overlaps = overlaps;
            if (frame % auto_zoom_frames == 0) {
                if (viewer_canvas.view().scale >= config.axis.max_scale || frame >= max_test_frames) {
                    (void)fprintf(stderr,
                        "[auto-overlap-test] finished frame=%d scale=%.2f worst_overlap_count=%zu\n",
                        frame, viewer_canvas.view().scale, worst_overlaps);
                    test_exit_code = worst_overlaps == 0 ? 0 : 2;
                    running = false;
                } else {
                    viewer_canvas.zoom_in();
                }
            }
        }

        ImGui::Render();
        SDL_GL_MakeCurrent(window, gl_context);
        // HiDPI: use framebuffer size in pixels, not logical DisplaySize
        const int fb_w = (int)(io.DisplaySize.x * io.DisplayFramebufferScale.x);
        const int fb_h = (int)(io.DisplaySize.y * io.DisplayFramebufferScale.y);
        glViewport(0, 0, fb_w, fb_h);
        glClearColor(1.0f, 1.0f, 1.0f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        SDL_GL_SwapWindow(window);
        ++frame;
    }

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplSDL3_Shutdown();
    ImGui::DestroyContext();

    SDL_GL_DestroyContext(gl_context);
    SDL_DestroyWindow(window);
    SDL_Quit();
    if (opts->auto_overlap_test) {
        return test_exit_code;
    }
    return 0;
}
