#include "bulbtrace/platform/platform.hpp"
#include "bulbtrace/platform/screenshot.hpp"
#include "bulbtrace/render/camera.hpp"
#include "bulbtrace/render/environment.hpp"
#include "bulbtrace/render/frame_buffer.hpp"
#include "bulbtrace/render/pipeline.hpp"

#include <SDL3/SDL.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <numbers>
#include <stdexcept>
#include <string>

namespace {

constexpr int kFrameWidth  = 480;
constexpr int kFrameHeight = 360;

constexpr float kOrbitRadiansPerPixel = 0.005f;
constexpr float kZoomPerSecond = 1.5f;
constexpr float kZoomPerWheelStep = 0.1f;
constexpr float kMinDistance = 1.3f;
constexpr float kMaxDistance = 6.0f;

using namespace bulbtrace;

class BulbViewer final : public platform::IApp {
public:
    explicit BulbViewer(render::RenderConfig config) : config_(config) {}

    void on_init(const platform::AppInitContext& ctx) override;
    void on_frame(const platform::FrameContext& ctx) override;
    void on_shutdown() override;

private:
    void update_camera(const platform::FrameContext& ctx);
    void render_frame();
    void save_screenshot();

    render::RenderConfig config_{};
    std::unique_ptr<render::Renderer> renderer_;
    render::FrameBuffer frame_{};

    SDL_Window* window_ = nullptr;
    SDL_Renderer* sdl_renderer_ = nullptr;
    SDL_Texture* texture_ = nullptr;

    render::OrbitParameters orbit_{};
    render::Camera camera_{};
    float animation_time_ = 0.0f;
    bool paused_ = false;
    int screenshot_index_ = 0;
};

void BulbViewer::on_init(const platform::AppInitContext& ctx) {
    auto environment = std::make_shared<const render::Environment>(
        render::build_environment(render::EnvironmentSettings{}));
    renderer_ = std::make_unique<render::Renderer>(config_, std::move(environment));
    std::cout << "[viewer] " << render::describe(renderer_->config()) << "\n";

    window_ = ctx.window;
    sdl_renderer_ = SDL_CreateRenderer(window_, nullptr);
    if (!sdl_renderer_) {
        throw std::runtime_error(std::string("SDL_CreateRenderer: ") + SDL_GetError());
    }
    texture_ = SDL_CreateTexture(sdl_renderer_, SDL_PIXELFORMAT_RGBA32, SDL_TEXTUREACCESS_STREAMING,
                                 kFrameWidth, kFrameHeight);
    if (!texture_) {
        throw std::runtime_error(std::string("SDL_CreateTexture: ") + SDL_GetError());
    }
    frame_.resize(kFrameWidth, kFrameHeight);

    orbit_.distance = 2.5f;
    orbit_.yaw_radians = 0.6f;
    orbit_.pitch_radians = 0.35f;
}

void BulbViewer::update_camera(const platform::FrameContext& ctx) {
    const platform::FrameInput& input = ctx.input;
    if (input.mouse_right_button) {
        orbit_.yaw_radians -= input.mouse_delta_x * kOrbitRadiansPerPixel;
        orbit_.pitch_radians += input.mouse_delta_y * kOrbitRadiansPerPixel;
        const float limit = std::numbers::pi_v<float> * 0.5f - 0.01f;
        orbit_.pitch_radians = std::clamp(orbit_.pitch_radians, -limit, limit);
    }

    float zoom = -input.wheel_delta * kZoomPerWheelStep;
    if (input.key_w) {
        zoom -= kZoomPerSecond * ctx.dt_seconds;
    }
    if (input.key_s) {
        zoom += kZoomPerSecond * ctx.dt_seconds;
    }
    orbit_.distance = std::clamp(orbit_.distance + zoom, kMinDistance, kMaxDistance);

    camera_ = render::make_orbit_camera(orbit_, {0.0f, 0.0f, 0.0f}, render::Perspective{60.0f});
}

void BulbViewer::render_frame() {
    const auto start = std::chrono::steady_clock::now();
    renderer_->render(frame_, camera_, animation_time_);
    const auto end = std::chrono::steady_clock::now();

    if (!SDL_UpdateTexture(texture_, nullptr, frame_.data(), frame_.pitch_bytes())) {
        throw std::runtime_error(std::string("SDL_UpdateTexture: ") + SDL_GetError());
    }
    SDL_RenderClear(sdl_renderer_);
    SDL_RenderTexture(sdl_renderer_, texture_, nullptr, nullptr);
    SDL_RenderPresent(sdl_renderer_);

    const double ms = std::chrono::duration<double, std::milli>(end - start).count();
    const std::string title = "bulbtrace - " + std::to_string(static_cast<int>(ms)) + " ms/frame" +
                              (paused_ ? " (paused)" : "");
    SDL_SetWindowTitle(window_, title.c_str());
}

void BulbViewer::save_screenshot() {
    const std::string path = "bulbtrace_" + std::to_string(screenshot_index_++) + ".bmp";
    try {
        platform::save_screenshot_bmp(frame_, path);
    } catch (const std::runtime_error& e) {
        std::cerr << "[viewer] screenshot failed: " << e.what() << "\n";
    }
}

void BulbViewer::on_frame(const platform::FrameContext& ctx) {
    if (ctx.input.key_escape || ctx.input.quit_requested) {
        ctx.request_quit();
        return;
    }

    if (ctx.input.key_space_pressed) {
        paused_ = !paused_;
        std::cout << "[viewer] animation " << (paused_ ? "paused" : "resumed") << " at t="
                  << animation_time_ << "s\n";
    }
    if (!paused_) {
        animation_time_ += ctx.dt_seconds;
    }

    update_camera(ctx);
    render_frame();

    if (ctx.input.key_f12_pressed) {
        save_screenshot();
    }
}

void BulbViewer::on_shutdown() {
    if (texture_) {
        SDL_DestroyTexture(texture_);
        texture_ = nullptr;
    }
    if (sdl_renderer_) {
        SDL_DestroyRenderer(sdl_renderer_);
        sdl_renderer_ = nullptr;
    }
    window_ = nullptr;
    renderer_.reset();
}

} // namespace

int main() {
    try {
        render::RenderConfig config;
        config.scene = sdf::SceneKind::Mandelbulb;
        config.power_mode = sdf::PowerMode::Animated;

        BulbViewer app(config);
        platform::WindowConfig window;
        window.width = kFrameWidth * 2;
        window.height = kFrameHeight * 2;
        window.title = "bulbtrace";
        return platform::run_app(app, window);
    } catch (const std::exception& e) {
        std::cerr << "[viewer] fatal: " << e.what() << "\n";
        return 1;
    }
}
