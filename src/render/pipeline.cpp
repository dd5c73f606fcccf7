#include "bulbtrace/render/pipeline.hpp"

#include "bulbtrace/core/task/task_pool.hpp"

#include <array>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace bulbtrace::render {

namespace {

constexpr std::array<Vec2, 1> kSingleSample{{{0.0f, 0.0f}}};

constexpr std::array<Vec2, 4> kOrderedGrid{{
    {-0.25f, -0.25f},
    {0.25f, -0.25f},
    {-0.25f, 0.25f},
    {0.25f, 0.25f},
}};

// Rotated grid used for the adaptive refinement samples.
constexpr std::array<Vec2, 4> kRotatedGrid{{
    {-0.375f, -0.125f},
    {0.125f, -0.375f},
    {0.375f, 0.125f},
    {-0.125f, 0.375f},
}};

std::span<const Vec2> base_offsets(Downscaling downscaling) noexcept {
    if (downscaling == Downscaling::HighQuality) {
        return kOrderedGrid;
    }
    return kSingleSample;
}

sdf::Scene make_configured_scene(const RenderConfig& config, std::span<const float> geometry) {
    switch (config.scene) {
    case sdf::SceneKind::PrimitiveCsg:
        return sdf::make_reference_csg_scene();
    case sdf::SceneKind::BoxMesh:
        return sdf::make_box_mesh_scene(geometry);
    case sdf::SceneKind::Mandelbulb:
        break;
    }
    return sdf::make_mandelbulb_scene(config.power_mode);
}

const char* to_string(AoMethod method) noexcept {
    return method == AoMethod::StepCount ? "steps" : "distance";
}

const char* to_string(NormalMethod method) noexcept {
    return method == NormalMethod::CentralDifference ? "central" : "backward";
}

} // namespace

std::string describe(const RenderConfig& config) {
    std::ostringstream out;
    out << "scene=" << sdf::to_string(config.scene)
        << " power=" << (config.power_mode == sdf::PowerMode::Animated ? "animated" : "fixed")
        << " ao=" << to_string(config.ao_method)
        << " normals=" << to_string(config.normal_method)
        << " gamma=" << (config.gamma_correction ? "on" : "off")
        << " supersample=" << (config.adaptive_supersampling ? "adaptive" : "off")
        << " downscale=" << (config.downscaling == Downscaling::HighQuality ? "high" : "low");
    return out.str();
}

Renderer::Renderer(const RenderConfig& config,
                   std::shared_ptr<const Environment> environment,
                   std::span<const float> geometry)
    : Renderer(config, make_configured_scene(config, geometry), std::move(environment)) {
}

Renderer::Renderer(const RenderConfig& config,
                   sdf::Scene scene,
                   std::shared_ptr<const Environment> environment)
    : config_(config),
      scene_(std::move(scene)),
      environment_(std::move(environment)) {
    if (!environment_) {
        throw std::invalid_argument("Renderer requires an environment");
    }
    config_.scene = sdf::scene_kind(scene_);
}

AoProfile Renderer::ao_profile() const noexcept {
    return std::holds_alternative<sdf::BoxMeshScene>(scene_) ? AoProfile::Alternate : AoProfile::Primary;
}

TraceSettings Renderer::trace_settings() const noexcept {
    TraceSettings settings;
    settings.bounding_radius = sdf::bounding_radius(scene_);
    return settings;
}

std::optional<SurfaceHit> Renderer::trace(const Ray& ray, float elapsed_seconds) const {
    return sdf::visit_field(scene_, elapsed_seconds, [&](const auto& field) -> std::optional<SurfaceHit> {
        const MarchResult march = march_ray(ray, field, trace_settings());
        if (!march.hit) {
            return std::nullopt;
        }
        return SurfaceHit{
            march.t,
            march.position,
            estimate_normal(field, march.position, ray.direction, config_.normal_method),
            march.step_gradient,
        };
    });
}

template <typename Field>
Vec3 Renderer::shade_ray(const Field& field, const Ray& ray) const {
    const MarchResult march = march_ray(ray, field, trace_settings());
    if (!march.hit) {
        return shade_miss(*environment_, ray.direction);
    }

    const Vec3 normal = estimate_normal(field, march.position, ray.direction, config_.normal_method);
    const float ao = config_.ao_method == AoMethod::StepCount
                         ? march.step_gradient
                         : ambient_occlusion(field, march.position, normal, ao_profile());
    return shade_hit(*environment_, material_, ray.direction, normal, ao);
}

Vec3 Renderer::shade_sample(const Camera& camera,
                            const Vec2& pixel,
                            const Vec2& sample_offset,
                            const Resolution& resolution,
                            float elapsed_seconds) const {
    const Ray ray = generate_ray(camera, pixel, sample_offset, resolution);
    return sdf::visit_field(scene_, elapsed_seconds, [&](const auto& field) {
        return shade_ray(field, ray);
    });
}

template <typename Field>
void Renderer::render_with(const Field& field, FrameBuffer& target, const Camera& camera) const {
    const int width = target.width();
    const int height = target.height();
    const Resolution resolution{width, height};
    const std::span<const Vec2> offsets = base_offsets(config_.downscaling);
    const float inv_count = 1.0f / static_cast<float>(offsets.size());

    const auto encode = [this](const Vec3& c) {
        return config_.gamma_correction ? gamma_encode(c) : c;
    };
    const auto linear_index = [width](int x, int row) {
        return static_cast<std::size_t>(row) * static_cast<std::size_t>(width) + static_cast<std::size_t>(x);
    };
    // Pixel centres, y up.
    const auto pixel_coord = [height](int x, int row) {
        return Vec2{static_cast<float>(x) + 0.5f, static_cast<float>(height - 1 - row) + 0.5f};
    };

    std::vector<Vec3> linear(static_cast<std::size_t>(width) * static_cast<std::size_t>(height));
    core::parallel_for(static_cast<std::size_t>(height), [&](std::size_t r) {
        const int row = static_cast<int>(r);
        for (int x = 0; x < width; ++x) {
            const Vec2 pixel = pixel_coord(x, row);
            Vec3 sum{};
            for (const Vec2& offset : offsets) {
                sum += shade_ray(field, generate_ray(camera, pixel, offset, resolution));
            }
            linear[linear_index(x, row)] = sum * inv_count;
        }
    });

    if (!config_.adaptive_supersampling) {
        core::parallel_for(static_cast<std::size_t>(height), [&](std::size_t r) {
            const int row = static_cast<int>(r);
            std::span<Pixel> out = target.row(row);
            for (int x = 0; x < width; ++x) {
                out[static_cast<std::size_t>(x)] = to_pixel(encode(linear[linear_index(x, row)]));
            }
        });
        return;
    }

    std::vector<float> display_luma(linear.size());
    for (std::size_t i = 0; i < linear.size(); ++i) {
        display_luma[i] = core::luminance(core::clamp01(encode(linear[i])));
    }

    const float threshold = config_.supersample_threshold;
    const float base_weight = static_cast<float>(offsets.size());
    const float refined_norm = 1.0f / (base_weight + static_cast<float>(kRotatedGrid.size()));

    // Second pass only reads the first pass results, so rows stay independent.
    core::parallel_for(static_cast<std::size_t>(height), [&](std::size_t r) {
        const int row = static_cast<int>(r);
        std::span<Pixel> out = target.row(row);
        for (int x = 0; x < width; ++x) {
            const std::size_t i = linear_index(x, row);
            const float luma = display_luma[i];
            const auto differs = [&](int nx, int nrow) {
                if (nx < 0 || nx >= width || nrow < 0 || nrow >= height) {
                    return false;
                }
                return std::abs(display_luma[linear_index(nx, nrow)] - luma) > threshold;
            };

            Vec3 color = linear[i];
            if (differs(x - 1, row) || differs(x + 1, row) || differs(x, row - 1) || differs(x, row + 1)) {
                Vec3 sum = color * base_weight;
                const Vec2 pixel = pixel_coord(x, row);
                for (const Vec2& offset : kRotatedGrid) {
                    sum += shade_ray(field, generate_ray(camera, pixel, offset, resolution));
                }
                color = sum * refined_norm;
            }
            out[static_cast<std::size_t>(x)] = to_pixel(encode(color));
        }
    });
}

void Renderer::render(FrameBuffer& target, const Camera& camera, float elapsed_seconds) const {
    if (target.empty()) {
        return;
    }
    sdf::visit_field(scene_, elapsed_seconds, [&](const auto& field) {
        render_with(field, target, camera);
    });
}

} // namespace bulbtrace::render
