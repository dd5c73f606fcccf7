#include "bulbtrace/render/ambient_occlusion.hpp"

#include <array>

namespace bulbtrace::render {

namespace {

constexpr std::array<AoSample, 2> kPrimarySamples{{
    {0.5f, 0.016f},
    {0.25f, 0.081f},
}};

constexpr std::array<AoSample, 4> kAlternateSamples{{
    {0.1f, 0.1f},
    {0.2f, 0.2f},
    {0.125f, 0.4f},
    {0.0625f, 0.5f},
}};

static_assert(kAlternateSamples.size() <= kMaxAoSamples);

// Empirical; keep as is.
constexpr float kPrimaryBias = 0.29f;
constexpr float kPrimaryGain = 3.5f;

} // namespace

std::span<const AoSample> ao_samples(AoProfile profile) noexcept {
    if (profile == AoProfile::Alternate) {
        return kAlternateSamples;
    }
    return kPrimarySamples;
}

float remap_occlusion(AoProfile profile, float occlusion_sum) noexcept {
    float occl = 1.0f - occlusion_sum;
    if (profile == AoProfile::Primary) {
        occl = (occl - kPrimaryBias) * kPrimaryGain;
        occl = occl * occl;
    }
    return std::clamp(occl, 0.0f, 1.0f);
}

} // namespace bulbtrace::render
