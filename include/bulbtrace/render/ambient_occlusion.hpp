#pragma once

#include "bulbtrace/core/vec.hpp"

#include <algorithm>
#include <cstddef>
#include <span>

namespace bulbtrace::render {

using core::Vec3;

inline constexpr std::size_t kMaxAoSamples = 4;

enum class AoMethod {
    DistanceSampled, // samples the field along the normal
    StepCount,       // reuses the march step gradient
};

// Sample weights and offsets are tuned per scene family.
enum class AoProfile {
    Primary,
    Alternate,
};

struct AoSample {
    float weight = 0.0f;
    float delta = 0.0f;
};

[[nodiscard]] std::span<const AoSample> ao_samples(AoProfile profile) noexcept;

// Maps the summed occlusion to a visibility factor in [0, 1], 1 meaning
// unoccluded. The primary curve is (1 - sum - 0.29) * 3.5, squared.
[[nodiscard]] float remap_occlusion(AoProfile profile, float occlusion_sum) noexcept;

template <typename Field>
[[nodiscard]] float ambient_occlusion(const Field& field,
                                      const Vec3& position,
                                      const Vec3& normal,
                                      AoProfile profile) {
    float sum = 0.0f;
    for (const AoSample& sample : ao_samples(profile)) {
        const float d = field(position + normal * sample.delta);
        sum += sample.weight * std::clamp(1.0f - d / sample.delta, 0.0f, 1.0f);
    }
    return remap_occlusion(profile, sum);
}

} // namespace bulbtrace::render
