#include "bulbtrace/platform/platform.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>

namespace bulbtrace::platform {

namespace {
constexpr SDL_WindowFlags build_window_flags(const WindowConfig& config) {
    SDL_WindowFlags flags = 0;
    if (config.resizable) {
        flags |= SDL_WINDOW_RESIZABLE;
    }
    return flags;
}

std::runtime_error make_sdl_error(const std::string& context) {
    return std::runtime_error(context + ": " + SDL_GetError());
}
} // namespace

struct SdlPlatform::Impl {
    WindowConfig config{};
    SDL_Window* window = nullptr;
    bool sdl_initialized = false;
};

SdlPlatform::SdlPlatform(const WindowConfig& config)
    : impl_(std::make_unique<Impl>()) {
    impl_->config = config;

    if (!SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS)) {
        throw make_sdl_error("SDL_Init");
    }

    impl_->sdl_initialized = true;

    impl_->window = SDL_CreateWindow(
        config.title.c_str(),
        config.width,
        config.height,
        build_window_flags(config));

    if (!impl_->window) {
        SDL_Quit();
        impl_->sdl_initialized = false;
        throw make_sdl_error("SDL_CreateWindow");
    }

    std::cout << "[platform] window " << config.width << "x" << config.height << " created\n";
}

SdlPlatform::~SdlPlatform() {
    if (!impl_) {
        return;
    }

    if (impl_->window) {
        SDL_DestroyWindow(impl_->window);
        impl_->window = nullptr;
    }

    if (impl_->sdl_initialized) {
        SDL_Quit();
        impl_->sdl_initialized = false;
    }
}

bool SdlPlatform::poll_event(Event& out_event) {
    SDL_Event event;
    while (SDL_PollEvent(&event)) {
        switch (event.type) {
        case SDL_EVENT_QUIT:
            out_event.type = EventType::Quit;
            return true;
        case SDL_EVENT_WINDOW_RESIZED:
            out_event.type = EventType::WindowResized;
            out_event.window_resized.width = event.window.data1;
            out_event.window_resized.height = event.window.data2;
            impl_->config.width = event.window.data1;
            impl_->config.height = event.window.data2;
            return true;
        case SDL_EVENT_KEY_DOWN:
            out_event.type = EventType::KeyDown;
            out_event.key.keycode = static_cast<int>(event.key.key);
            out_event.key.repeat = event.key.repeat;
            return true;
        case SDL_EVENT_KEY_UP:
            out_event.type = EventType::KeyUp;
            out_event.key.keycode = static_cast<int>(event.key.key);
            out_event.key.repeat = false;
            return true;
        case SDL_EVENT_MOUSE_MOTION:
            out_event.type = EventType::MouseMotion;
            out_event.mouse_motion.dx = event.motion.xrel;
            out_event.mouse_motion.dy = event.motion.yrel;
            return true;
        case SDL_EVENT_MOUSE_BUTTON_DOWN:
            out_event.type = EventType::MouseButtonDown;
            out_event.mouse_button.button = event.button.button;
            out_event.mouse_button.pressed = true;
            return true;
        case SDL_EVENT_MOUSE_BUTTON_UP:
            out_event.type = EventType::MouseButtonUp;
            out_event.mouse_button.button = event.button.button;
            out_event.mouse_button.pressed = false;
            return true;
        case SDL_EVENT_MOUSE_WHEEL:
            out_event.type = EventType::MouseWheel;
            out_event.mouse_wheel.dy = event.wheel.y;
            return true;
        default:
            break;
        }
    }

    out_event.type = EventType::None;
    return false;
}

void SdlPlatform::request_quit() {
    SDL_Event quit_event{};
    quit_event.type = SDL_EVENT_QUIT;
    if (!SDL_PushEvent(&quit_event)) {
        std::cerr << "[platform] SDL_PushEvent failed: " << SDL_GetError() << "\n";
    }
}

int SdlPlatform::width() const noexcept {
    return impl_->config.width;
}

int SdlPlatform::height() const noexcept {
    return impl_->config.height;
}

SDL_Window* SdlPlatform::window() const noexcept {
    return impl_->window;
}

} // namespace bulbtrace::platform

namespace bulbtrace::platform {

namespace {

struct LoopState {
    bool running = true;
    bool escape_down = false;
    bool resized_this_frame = false;
    bool quit_requested = false;
    int window_width = 0;
    int window_height = 0;
    bool key_w = false;
    bool key_s = false;
    bool key_space_pressed = false;
    bool key_f12_pressed = false;
    bool mouse_right_button = false;
    float mouse_dx = 0.0f;
    float mouse_dy = 0.0f;
    float wheel = 0.0f;
};

void handle_key(const KeyEvent& key, bool down, LoopState& state) {
    switch (key.keycode) {
    case SDLK_ESCAPE:
        state.escape_down = down;
        break;
    case SDLK_W:
    case SDLK_UP:
        state.key_w = down;
        break;
    case SDLK_S:
    case SDLK_DOWN:
        state.key_s = down;
        break;
    case SDLK_SPACE:
        if (down && !key.repeat) {
            state.key_space_pressed = true;
        }
        break;
    case SDLK_F12:
        if (down && !key.repeat) {
            state.key_f12_pressed = true;
        }
        break;
    default:
        break;
    }
}

void handle_event(const Event& event, LoopState& state) {
    switch (event.type) {
    case EventType::Quit:
        state.quit_requested = true;
        break;
    case EventType::WindowResized:
        state.window_width = event.window_resized.width;
        state.window_height = event.window_resized.height;
        state.resized_this_frame = true;
        break;
    case EventType::KeyDown:
        handle_key(event.key, true, state);
        break;
    case EventType::KeyUp:
        handle_key(event.key, false, state);
        break;
    case EventType::MouseMotion:
        state.mouse_dx += event.mouse_motion.dx;
        state.mouse_dy += event.mouse_motion.dy;
        break;
    case EventType::MouseButtonDown:
    case EventType::MouseButtonUp:
        if (event.mouse_button.button == SDL_BUTTON_RIGHT) {
            state.mouse_right_button = event.mouse_button.pressed;
        }
        break;
    case EventType::MouseWheel:
        state.wheel += event.mouse_wheel.dy;
        break;
    default:
        break;
    }
}

} // namespace

int run_app(IApp& app, const WindowConfig& cfg) {
    SdlPlatform platform(cfg);

    LoopState state{};
    state.window_width = platform.width();
    state.window_height = platform.height();

    AppInitContext init_ctx{
        .window_width = state.window_width,
        .window_height = state.window_height,
        .window = platform.window(),
    };

    app.on_init(init_ctx);

    using clock = std::chrono::steady_clock;
    const auto start = clock::now();
    auto last_tick = start;

    while (state.running) {
        state.resized_this_frame = false;
        state.quit_requested = false;
        state.mouse_dx = 0.0f;
        state.mouse_dy = 0.0f;
        state.wheel = 0.0f;
        state.key_space_pressed = false;
        state.key_f12_pressed = false;

        Event event;
        while (platform.poll_event(event)) {
            handle_event(event, state);
        }

        auto now = clock::now();
        float dt = std::chrono::duration<float>(now - last_tick).count();
        last_tick = now;

        FrameInput frame_input{};
        frame_input.quit_requested = state.quit_requested;
        frame_input.key_escape = state.escape_down;
        frame_input.window_resized = state.resized_this_frame;
        frame_input.key_w = state.key_w;
        frame_input.key_s = state.key_s;
        frame_input.key_space_pressed = state.key_space_pressed;
        frame_input.key_f12_pressed = state.key_f12_pressed;
        frame_input.mouse_right_button = state.mouse_right_button;
        frame_input.mouse_delta_x = state.mouse_dx;
        frame_input.mouse_delta_y = state.mouse_dy;
        frame_input.wheel_delta = state.wheel;

        FrameContext frame_ctx{};
        frame_ctx.dt_seconds = dt;
        frame_ctx.elapsed_seconds = std::chrono::duration<float>(now - start).count();
        frame_ctx.input = frame_input;
        frame_ctx.window_width = state.window_width;
        frame_ctx.window_height = state.window_height;
        frame_ctx.request_quit = [&state]() { state.running = false; };

        app.on_frame(frame_ctx);

        if (state.quit_requested) {
            state.running = false;
        }
    }

    app.on_shutdown();
    return 0;
}

} // namespace bulbtrace::platform
