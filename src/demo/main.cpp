// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"
#include "config.h"
#include "logging_init.h"
#include "navigator_config.h"
#include "ui_local_history.h"
#include "ui_modal_route.h"
#include "ui_nav_errors.h"
#include "ui_navigator.h"
#include "ui_update_queue.h"

#include "lvgl/lvgl.h"
#include <SDL.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <functional>
#include <memory>
#include <string>

using namespace strata;

namespace {

constexpr const char* DEMO_INITIAL_ROUTE = "/b/c";

Navigator* g_navigator = nullptr;
bool g_running = true;

using Action = std::function<void()>;

/// Button whose action runs from the update queue, outside the click event
lv_obj_t* add_button(lv_obj_t* parent, const char* text, Action action) {
    lv_obj_t* btn = lv_button_create(parent);
    lv_obj_t* label = lv_label_create(btn);
    lv_label_set_text(label, text);
    lv_obj_center(label);

    auto* stored = new Action(std::move(action));
    lv_obj_add_event_cb(
        btn,
        [](lv_event_t* e) {
            auto* fn = static_cast<Action*>(lv_event_get_user_data(e));
            ui::queue_update(*fn);
        },
        LV_EVENT_CLICKED, stored);
    lv_obj_add_event_cb(
        btn, [](lv_event_t* e) { delete static_cast<Action*>(lv_event_get_user_data(e)); },
        LV_EVENT_DELETE, stored);
    return btn;
}

lv_obj_t* build_page(lv_obj_t* parent, const char* title, lv_color_t color) {
    lv_obj_t* page = lv_obj_create(parent);
    lv_obj_set_size(page, LV_PCT(100), LV_PCT(100));
    lv_obj_set_style_bg_color(page, color, LV_PART_MAIN);
    lv_obj_set_style_bg_opa(page, LV_OPA_COVER, LV_PART_MAIN);
    lv_obj_set_style_radius(page, 0, LV_PART_MAIN);
    lv_obj_set_flex_flow(page, LV_FLEX_FLOW_COLUMN);
    lv_obj_set_flex_align(page, LV_FLEX_ALIGN_START, LV_FLEX_ALIGN_CENTER, LV_FLEX_ALIGN_CENTER);
    lv_obj_set_style_pad_row(page, 12, LV_PART_MAIN);

    lv_obj_t* label = lv_label_create(page);
    lv_label_set_text(label, title);

    std::string depth = "Depth: " + std::to_string(g_navigator ? g_navigator->history().size() + 1
                                                               : 1);
    lv_obj_t* depth_label = lv_label_create(page);
    lv_label_set_text(depth_label, depth.c_str());
    return page;
}

void go_back() {
    if (g_navigator->can_pop()) {
        g_navigator->maybe_pop().then([](const bool& handled) {
            if (!handled) {
                g_running = false;
            }
        });
        return;
    }
    spdlog::info("[Demo] Back on the first route, exiting");
    g_running = false;
}

/// Page with a search field that closes on back before the page itself does
class SearchPage : public PageRoute {
  public:
    explicit SearchPage(RouteSettings settings) : PageRoute(std::move(settings), nullptr) {}

  protected:
    lv_obj_t* build_content(lv_obj_t* parent) override {
        lv_obj_t* page = build_page(parent, "Page C", lv_palette_lighten(LV_PALETTE_GREEN, 3));

        lv_obj_t* search = lv_textarea_create(page);
        lv_textarea_set_placeholder_text(search, "Search...");
        lv_textarea_set_one_line(search, true);
        lv_obj_add_flag(search, LV_OBJ_FLAG_HIDDEN);

        add_button(page, "Search", [this, search]() {
            if (!lv_obj_has_flag(search, LV_OBJ_FLAG_HIDDEN)) {
                return;
            }
            lv_obj_remove_flag(search, LV_OBJ_FLAG_HIDDEN);
            add_local_history_entry(LocalHistoryEntry::create(
                [search]() { lv_obj_add_flag(search, LV_OBJ_FLAG_HIDDEN); }));
        });
        add_button(page, "Pop to /", []() { g_navigator->pop_until(ModalRoute::with_name("/")); });
        add_button(page, "Back", go_back);
        return page;
    }
};

RoutePtr generate_route(const RouteSettings& settings) {
    const std::string name = settings.name.value_or("");

    if (name == "/") {
        return std::make_shared<PageRoute>(settings, [](lv_obj_t* parent) {
            lv_obj_t* page = build_page(parent, "Page A", lv_palette_lighten(LV_PALETTE_BLUE, 3));
            add_button(page, "Open /b", []() { g_navigator->push_named("/b"); });
            add_button(page, "Open dialog", []() {
                g_navigator->push_named("/dialog").then([](const RouteResult& result) {
                    const auto* answer = route_result_as<std::string>(result);
                    spdlog::info("[Demo] Dialog closed with '{}'", answer ? *answer : "<none>");
                });
            });
            add_button(page, "Open missing route", []() { g_navigator->push_named("/nowhere"); });
            return page;
        });
    }
    if (name == "/b") {
        return std::make_shared<PageRoute>(settings, [](lv_obj_t* parent) {
            lv_obj_t* page =
                build_page(parent, "Page B", lv_palette_lighten(LV_PALETTE_ORANGE, 3));
            add_button(page, "Open /b/c", []() { g_navigator->push_named("/b/c"); });
            add_button(page, "Replace with /b/c",
                       []() { g_navigator->push_replacement_named("/b/c"); });
            add_button(page, "Back", go_back);
            return page;
        });
    }
    if (name == "/b/c") {
        return std::make_shared<SearchPage>(settings);
    }
    if (name == "/dialog") {
        return std::make_shared<PopupRoute>(settings, [](lv_obj_t* parent) {
            lv_obj_t* card = lv_obj_create(parent);
            lv_obj_set_size(card, LV_PCT(60), LV_SIZE_CONTENT);
            lv_obj_center(card);
            lv_obj_set_flex_flow(card, LV_FLEX_FLOW_COLUMN);
            lv_obj_set_flex_align(card, LV_FLEX_ALIGN_START, LV_FLEX_ALIGN_CENTER,
                                  LV_FLEX_ALIGN_CENTER);

            lv_obj_t* label = lv_label_create(card);
            lv_label_set_text(label, "Tap outside to dismiss");
            add_button(card, "OK", []() { g_navigator->pop(std::string("ok")); });
            return card;
        });
    }
    return nullptr;
}

RoutePtr unknown_route(const RouteSettings& settings) {
    std::string title = "Unknown route: " + settings.name.value_or("<anonymous>");
    return std::make_shared<PageRoute>(settings, [title](lv_obj_t* parent) {
        lv_obj_t* page = build_page(parent, title.c_str(), lv_palette_lighten(LV_PALETTE_RED, 3));
        add_button(page, "Back", go_back);
        return page;
    });
}

class LoggingObserver : public NavigatorObserver {
  public:
    void did_push(Route* route, Route* previous) override {
        spdlog::info("[Demo] push {} (over {})", route->debug_name(),
                     previous ? previous->debug_name() : "nothing");
    }
    void did_pop(Route* route, Route* previous) override {
        spdlog::info("[Demo] pop {} (back to {})", route->debug_name(), previous->debug_name());
    }
    void did_remove(Route* route, Route* /*previous*/) override {
        spdlog::info("[Demo] remove {}", route->debug_name());
    }
};

void key_event_cb(lv_event_t* e) {
    uint32_t key = lv_event_get_key(e);
    if (key == LV_KEY_ESC || key == LV_KEY_BACKSPACE) {
        ui::queue_update(go_back);
    }
}

} // namespace

int main(int argc, char** argv) {
    CliArgs args;
    if (!parse_cli_args(argc, argv, args)) {
        return args.help_requested ? 0 : 1;
    }

    std::error_code ec;
    bool first_run = !std::filesystem::exists(args.config_path, ec);

    Config* config = Config::get_instance();
    config->init(args.config_path);
    if (first_run) {
        config->set<std::string>("/navigator/initial_route", DEMO_INITIAL_ROUTE);
        if (!config->save()) {
            spdlog::warn("[Demo] Could not store initial route in {}", args.config_path);
        }
    }

    logging::LogConfig log_config;
    log_config.level = logging::resolve_log_level(
        args.verbosity, config->get<std::string>("/log_level", ""), false);
    log_config.target = logging::parse_log_target(
        args.log_dest.empty() ? config->get<std::string>("/log_target", "auto") : args.log_dest);
    log_config.file_path = args.log_file;
    logging::init(log_config);

    NavigatorConfig nav_config = NavigatorConfig::from_config(*config);
    if (args.initial_route) {
        nav_config.initial_route = *args.initial_route;
    }
    if (args.no_animations) {
        nav_config.animations_enabled = false;
    }
    if (args.transition_duration_ms) {
        nav_config.transition_duration_ms = static_cast<uint32_t>(*args.transition_duration_ms);
    }

    int width = args.screen_width > 0 ? args.screen_width : config->get<int>("/display/width", 800);
    int height =
        args.screen_height > 0 ? args.screen_height : config->get<int>("/display/height", 480);

    lv_init();
    lv_sdl_window_create(width, height);
    lv_sdl_mouse_create();
    lv_indev_t* keyboard = lv_sdl_keyboard_create();
    ui::update_queue_init();

    // Receives Esc/Backspace from the keyboard indev
    lv_group_t* group = lv_group_create();
    lv_indev_set_group(keyboard, group);
    lv_obj_t* key_catcher = lv_obj_create(lv_layer_top());
    lv_obj_remove_style_all(key_catcher);
    lv_obj_set_size(key_catcher, 0, 0);
    lv_obj_add_event_cb(key_catcher, key_event_cb, LV_EVENT_KEY, nullptr);
    lv_group_add_obj(group, key_catcher);

    spdlog::info("[Demo] {}x{}, initial route '{}', animations {}", width, height,
                 nav_config.initial_route, nav_config.animations_enabled ? "on" : "off");

    int exit_code = 0;
    {
        LoggingObserver observer;
        Navigator navigator(lv_screen_active(), nav_config);
        g_navigator = &navigator;
        navigator.set_route_factory(generate_route);
        navigator.set_unknown_route_factory(unknown_route);
        navigator.add_observer(&observer);

        try {
            navigator.realize();

            uint32_t start = SDL_GetTicks();
            while (g_running && lv_display_get_next(NULL)) {
                lv_timer_handler();
                SDL_Delay(5);
                if (args.timeout_sec > 0 &&
                    SDL_GetTicks() - start >= static_cast<uint32_t>(args.timeout_sec) * 1000) {
                    spdlog::info("[Demo] Timeout reached, exiting");
                    break;
                }
            }
        } catch (const RouteConfigurationError& e) {
            spdlog::critical("[Demo] Route configuration error: {}", e.what());
            exit_code = 1;
        } catch (const NavigationError& e) {
            spdlog::critical("[Demo] Navigation error: {}", e.what());
            spdlog::dump_backtrace();
            exit_code = 1;
        }

        navigator.clear_observers();
        g_navigator = nullptr;
    }

    ui::update_queue_shutdown();
    lv_deinit();
    return exit_code;
}
