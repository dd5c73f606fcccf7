#pragma once

#include "bulbtrace/core/vec.hpp"
#include "bulbtrace/render/ambient_occlusion.hpp"
#include "bulbtrace/render/camera.hpp"
#include "bulbtrace/render/environment.hpp"
#include "bulbtrace/render/frame_buffer.hpp"
#include "bulbtrace/render/normals.hpp"
#include "bulbtrace/render/shading.hpp"
#include "bulbtrace/render/sphere_tracer.hpp"
#include "bulbtrace/sdf/scene.hpp"

#include <memory>
#include <optional>
#include <span>
#include <string>

namespace bulbtrace::render {

enum class Downscaling {
    LowQuality,  // one sample per pixel
    HighQuality, // 2x2 ordered sub-samples box-filtered per pixel
};

// Choices resolved once when the renderer is created.
struct RenderConfig {
    sdf::SceneKind scene = sdf::SceneKind::Mandelbulb;
    sdf::PowerMode power_mode = sdf::PowerMode::Fixed;
    AoMethod ao_method = AoMethod::DistanceSampled;
    NormalMethod normal_method = NormalMethod::BackwardDifference;
    bool gamma_correction = true;
    bool adaptive_supersampling = false;
    Downscaling downscaling = Downscaling::LowQuality;
    // Luminance step between neighbours, in display space, that triggers
    // extra samples when adaptive supersampling is on.
    float supersample_threshold = 0.08f;
};

[[nodiscard]] std::string describe(const RenderConfig& config);

// Ray/surface intersection with the shading inputs derived from the field.
struct SurfaceHit {
    float t = 0.0f;
    Vec3 position{};
    Vec3 normal{};
    float step_gradient = 0.0f;
};

// Per-pixel kernel and its bulk dispatch. Scene, environment and material are
// immutable after construction, so render() may run any number of pixels in
// parallel without synchronization.
class Renderer {
public:
    // Builds the scene selected by config.scene. `geometry` feeds the box-mesh
    // scene (packed triangles; empty selects the default box).
    Renderer(const RenderConfig& config,
             std::shared_ptr<const Environment> environment,
             std::span<const float> geometry = {});

    Renderer(const RenderConfig& config,
             sdf::Scene scene,
             std::shared_ptr<const Environment> environment);

    [[nodiscard]] const RenderConfig& config() const noexcept { return config_; }
    [[nodiscard]] const sdf::Scene& scene() const noexcept { return scene_; }
    [[nodiscard]] const Material& material() const noexcept { return material_; }
    void set_material(const Material& material) noexcept { material_ = material; }

    [[nodiscard]] AoProfile ao_profile() const noexcept;
    [[nodiscard]] TraceSettings trace_settings() const noexcept;

    // Sphere traces one ray and estimates the normal on a hit.
    [[nodiscard]] std::optional<SurfaceHit> trace(const Ray& ray, float elapsed_seconds) const;

    // Linear radiance for one sample; gamma is applied when writing pixels.
    [[nodiscard]] Vec3 shade_sample(const Camera& camera,
                                    const Vec2& pixel,
                                    const Vec2& sample_offset,
                                    const Resolution& resolution,
                                    float elapsed_seconds) const;

    // Fills every pixel of `target`. Pixel (x, y) with y up maps to frame
    // buffer row height - 1 - y.
    void render(FrameBuffer& target, const Camera& camera, float elapsed_seconds) const;

private:
    template <typename Field>
    [[nodiscard]] Vec3 shade_ray(const Field& field, const Ray& ray) const;

    template <typename Field>
    void render_with(const Field& field, FrameBuffer& target, const Camera& camera) const;

    RenderConfig config_{};
    sdf::Scene scene_;
    std::shared_ptr<const Environment> environment_;
    Material material_{};
};

} // namespace bulbtrace::render
