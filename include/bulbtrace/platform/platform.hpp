#pragma once

#include <SDL3/SDL.h>

#include <functional>
#include <memory>
#include <string>

namespace bulbtrace::platform {

enum class EventType {
    None,
    Quit,
    WindowResized,
    KeyDown,
    KeyUp,
    MouseMotion,
    MouseButtonDown,
    MouseButtonUp,
    MouseWheel,
};

struct WindowResizedEvent {
    int width = 0;
    int height = 0;
};

struct KeyEvent {
    int keycode = 0;
    bool repeat = false;
};

struct MouseMotionEvent {
    float dx = 0.0f;
    float dy = 0.0f;
};

struct MouseButtonEvent {
    int button = 0;
    bool pressed = false;
};

struct MouseWheelEvent {
    float dy = 0.0f;
};

struct Event {
    EventType type = EventType::None;
    WindowResizedEvent window_resized{};
    KeyEvent key{};
    MouseMotionEvent mouse_motion{};
    MouseButtonEvent mouse_button{};
    MouseWheelEvent mouse_wheel{};
};

struct WindowConfig {
    int width = 960;
    int height = 540;
    bool resizable = true;
    std::string title = "bulbtrace";
};

// Input sampled once per frame. *_pressed flags are edge-triggered and only
// set on the frame the key went down.
struct FrameInput {
    bool quit_requested = false;
    bool key_escape = false;
    bool window_resized = false;
    bool key_w = false;
    bool key_s = false;
    bool key_space_pressed = false;
    bool key_f12_pressed = false;
    bool mouse_right_button = false;
    float mouse_delta_x = 0.0f;
    float mouse_delta_y = 0.0f;
    float wheel_delta = 0.0f;
};

struct FrameContext {
    float dt_seconds = 0.0f;
    float elapsed_seconds = 0.0f;
    FrameInput input{};
    int window_width = 0;
    int window_height = 0;
    std::function<void()> request_quit;
};

struct AppInitContext {
    int window_width = 0;
    int window_height = 0;
    SDL_Window* window = nullptr;
};

class IApp {
public:
    virtual ~IApp() = default;
    virtual void on_init(const AppInitContext& ctx) { (void)ctx; }
    virtual void on_frame(const FrameContext& ctx) = 0;
    virtual void on_shutdown() {}
};

// Owns the SDL window and drives on_init / on_frame / on_shutdown until a
// quit is requested. SDL failures surface as std::runtime_error.
int run_app(IApp& app, const WindowConfig& cfg);

class SdlPlatform {
public:
    explicit SdlPlatform(const WindowConfig& config);
    ~SdlPlatform();

    SdlPlatform(SdlPlatform&&) noexcept = default;
    SdlPlatform& operator=(SdlPlatform&&) noexcept = default;

    SdlPlatform(const SdlPlatform&) = delete;
    SdlPlatform& operator=(const SdlPlatform&) = delete;

    [[nodiscard]] bool poll_event(Event& out_event);
    void request_quit();

    [[nodiscard]] int width() const noexcept;
    [[nodiscard]] int height() const noexcept;
    [[nodiscard]] SDL_Window* window() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace bulbtrace::platform
