#include "bulbtrace/platform/screenshot.hpp"
#include "bulbtrace/render/camera.hpp"
#include "bulbtrace/render/environment.hpp"
#include "bulbtrace/render/frame_buffer.hpp"
#include "bulbtrace/render/pipeline.hpp"

#include <chrono>
#include <cstdio>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

namespace {

using namespace bulbtrace;

struct StillOptions {
    render::RenderConfig config{};
    int width = 640;
    int height = 480;
    float time_seconds = 0.0f;
    std::string output = "bulbtrace.bmp";
};

void print_usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [options]\n"
              << "  --scene csg|mandelbulb|boxmesh   scene variant (default mandelbulb)\n"
              << "  --power fixed|animated           fractal power mode (default fixed)\n"
              << "  --ao distance|steps              ambient occlusion method (default distance)\n"
              << "  --normals backward|central       normal estimator (default backward)\n"
              << "  --no-gamma                       write linear values\n"
              << "  --supersample                    adaptive supersampling on edges\n"
              << "  --downscale low|high             samples per pixel: 1 or 2x2 (default low)\n"
              << "  --size WxH                       output size (default 640x480)\n"
              << "  --time SECONDS                   animation time (default 0)\n"
              << "  --output PATH                    BMP path (default bulbtrace.bmp)\n";
}

sdf::SceneKind parse_scene(std::string_view value) {
    if (value == "csg") {
        return sdf::SceneKind::PrimitiveCsg;
    }
    if (value == "mandelbulb") {
        return sdf::SceneKind::Mandelbulb;
    }
    if (value == "boxmesh") {
        return sdf::SceneKind::BoxMesh;
    }
    throw std::invalid_argument("unknown scene '" + std::string(value) + "'");
}

void parse_size(std::string_view value, int& width, int& height) {
    int w = 0;
    int h = 0;
    const std::string text(value);
    if (std::sscanf(text.c_str(), "%dx%d", &w, &h) != 2 || w <= 0 || h <= 0) {
        throw std::invalid_argument("invalid size '" + text + "', expected WxH");
    }
    width = w;
    height = h;
}

StillOptions parse_options(int argc, char** argv) {
    StillOptions options;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        const auto next = [&]() -> std::string_view {
            if (i + 1 >= argc) {
                throw std::invalid_argument("missing value for " + std::string(arg));
            }
            return argv[++i];
        };

        if (arg == "--scene") {
            options.config.scene = parse_scene(next());
        } else if (arg == "--power") {
            const std::string_view value = next();
            if (value == "fixed") {
                options.config.power_mode = sdf::PowerMode::Fixed;
            } else if (value == "animated") {
                options.config.power_mode = sdf::PowerMode::Animated;
            } else {
                throw std::invalid_argument("unknown power mode '" + std::string(value) + "'");
            }
        } else if (arg == "--ao") {
            const std::string_view value = next();
            if (value == "distance") {
                options.config.ao_method = render::AoMethod::DistanceSampled;
            } else if (value == "steps") {
                options.config.ao_method = render::AoMethod::StepCount;
            } else {
                throw std::invalid_argument("unknown ao method '" + std::string(value) + "'");
            }
        } else if (arg == "--normals") {
            const std::string_view value = next();
            if (value == "backward") {
                options.config.normal_method = render::NormalMethod::BackwardDifference;
            } else if (value == "central") {
                options.config.normal_method = render::NormalMethod::CentralDifference;
            } else {
                throw std::invalid_argument("unknown normal method '" + std::string(value) + "'");
            }
        } else if (arg == "--no-gamma") {
            options.config.gamma_correction = false;
        } else if (arg == "--supersample") {
            options.config.adaptive_supersampling = true;
        } else if (arg == "--downscale") {
            const std::string_view value = next();
            if (value == "low") {
                options.config.downscaling = render::Downscaling::LowQuality;
            } else if (value == "high") {
                options.config.downscaling = render::Downscaling::HighQuality;
            } else {
                throw std::invalid_argument("unknown downscale mode '" + std::string(value) + "'");
            }
        } else if (arg == "--size") {
            parse_size(next(), options.width, options.height);
        } else if (arg == "--time") {
            options.time_seconds = std::stof(std::string(next()));
        } else if (arg == "--output") {
            options.output = std::string(next());
        } else {
            throw std::invalid_argument("unknown option '" + std::string(arg) + "'");
        }
    }
    return options;
}

} // namespace

int main(int argc, char** argv) {
    StillOptions options;
    try {
        options = parse_options(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[still] " << e.what() << "\n";
        print_usage(argv[0]);
        return 2;
    }

    try {
        auto environment = std::make_shared<const render::Environment>(
            render::build_environment(render::EnvironmentSettings{}));
        const render::Renderer renderer(options.config, std::move(environment));
        std::cout << "[still] " << render::describe(renderer.config()) << "\n";

        render::OrbitParameters orbit{};
        orbit.distance = 2.5f;
        orbit.yaw_radians = 0.6f;
        orbit.pitch_radians = 0.35f;
        const render::Camera camera =
            render::make_orbit_camera(orbit, {0.0f, 0.0f, 0.0f}, render::Perspective{60.0f});

        render::FrameBuffer frame(options.width, options.height);
        const auto start = std::chrono::steady_clock::now();
        renderer.render(frame, camera, options.time_seconds);
        const auto end = std::chrono::steady_clock::now();
        std::cout << "[still] rendered " << options.width << "x" << options.height << " in "
                  << std::chrono::duration<double, std::milli>(end - start).count() << " ms\n";

        platform::save_screenshot_bmp(frame, options.output);
    } catch (const std::exception& e) {
        std::cerr << "[still] fatal: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
