#include "gameplay/EnemyConfig.hpp"

#include <array>

namespace spectral {

namespace {

const std::array<SubtypeProfile, 3> kSubtypes = {{
    {EnemySubtype::Standard, "standard", 60.0f, 1.0f, 1.0f, 1.0f,          1.0f, 50.0f},
    {EnemySubtype::Heavy,    "heavy",    15.0f, 3.0f, 2.0f, 400.0f / 700.0f, 1.5f, 75.0f},
    {EnemySubtype::Swift,    "swift",    25.0f, 0.6f, 0.8f, 1000.0f / 700.0f, 0.8f, 40.0f},
}};

struct VariantWeight {
    VisualVariant variant;
    float weight;
};

const std::array<VariantWeight, 4> kVariantWeights = {{
    {VisualVariant::Standard,    70.0f},
    {VisualVariant::Damaged,     15.0f},
    {VisualVariant::Elite,       10.0f},
    {VisualVariant::Overcharged,  5.0f},
}};

} // namespace

const SubtypeProfile& subtypeProfile(EnemySubtype subtype) {
    for (const auto& profile : kSubtypes) {
        if (profile.subtype == subtype) return profile;
    }
    return kSubtypes[0];
}

EnemySubtype selectSubtype(std::mt19937& rng) {
    float total = 0.0f;
    for (const auto& profile : kSubtypes) total += profile.spawnWeight;

    std::uniform_real_distribution<float> dist(0.0f, total);
    float roll = dist(rng);
    for (const auto& profile : kSubtypes) {
        roll -= profile.spawnWeight;
        if (roll <= 0.0f) return profile.subtype;
    }
    return EnemySubtype::Standard;
}

VisualVariant rollVariant(std::mt19937& rng) {
    float total = 0.0f;
    for (const auto& entry : kVariantWeights) total += entry.weight;

    std::uniform_real_distribution<float> dist(0.0f, total);
    float roll = dist(rng);
    for (const auto& entry : kVariantWeights) {
        roll -= entry.weight;
        if (roll <= 0.0f) return entry.variant;
    }
    return VisualVariant::Standard;
}

const char* variantName(VisualVariant variant) {
    switch (variant) {
        case VisualVariant::Standard:    return "standard";
        case VisualVariant::Damaged:     return "damaged";
        case VisualVariant::Elite:       return "elite";
        case VisualVariant::Overcharged: return "overcharged";
    }
    return "unknown";
}

} // namespace spectral
