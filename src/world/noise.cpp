// TileWorld World System
// noise.cpp - Seeded uniform sampling and FastNoise2-backed fields

#include <FastNoise/FastNoise.h>
#include <algorithm>
#include <tileworld/world/noise.hpp>

namespace tileworld::world {

// ============================================================================
// Seeded Uniform Sampling
// ============================================================================

uint64_t mix_seed(uint64_t a, uint64_t b) {
    uint64_t z = a + 0x9e3779b97f4a7c15ULL + (b * 0xbf58476d1ce4e5b9ULL);
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
    z ^= z >> 31;
    // Second round so adjacent salts decorrelate
    z += 0x9e3779b97f4a7c15ULL;
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
    return z ^ (z >> 31);
}

double random_unit(int64_t seed, int64_t salt) {
    uint64_t h = mix_seed(static_cast<uint64_t>(seed), static_cast<uint64_t>(salt));
    // Top 53 bits give an exactly representable double in [0, 1)
    return static_cast<double>(h >> 11) * (1.0 / 9007199254740992.0);
}

double random_between(int64_t seed, int64_t salt, double min_value, double max_value) {
    return min_value + random_unit(seed, salt) * (max_value - min_value);
}

int32_t random_int(int64_t seed, int64_t salt, int32_t min_value, int32_t max_value) {
    if (max_value <= min_value) {
        return min_value;
    }
    int64_t span = static_cast<int64_t>(max_value) - min_value + 1;
    auto offset = static_cast<int64_t>(random_unit(seed, salt) * static_cast<double>(span));
    return static_cast<int32_t>(min_value + std::min(offset, span - 1));
}

double random_at(int64_t seed, uint32_t channel, int32_t x, int32_t y) {
    uint64_t position = (static_cast<uint64_t>(static_cast<uint32_t>(x)) << 32) | static_cast<uint32_t>(y);
    return random_unit(static_cast<int64_t>(mix_seed(static_cast<uint64_t>(seed), channel)),
                       static_cast<int64_t>(position));
}

int32_t noise_seed(int64_t seed, int64_t salt) {
    return static_cast<int32_t>(mix_seed(static_cast<uint64_t>(seed), static_cast<uint64_t>(salt)) & 0x7fffffffULL);
}

// ============================================================================
// Noise Field
// ============================================================================

struct NoiseField::Impl {
    NoiseFieldConfig config;
    int32_t seed = 0;

    // Thread-safe for GenSingle calls
    FastNoise::SmartNode<FastNoise::Generator> node;

    void build_node() {
        auto simplex = FastNoise::New<FastNoise::Simplex>();
        if (config.octaves <= 1) {
            node = simplex;
            return;
        }

        auto fractal = FastNoise::New<FastNoise::FractalFBm>();
        fractal->SetSource(simplex);
        fractal->SetOctaveCount(config.octaves);
        fractal->SetGain(config.gain);
        fractal->SetLacunarity(config.lacunarity);
        node = fractal;
    }
};

NoiseField::NoiseField(int64_t seed, int64_t salt, const NoiseFieldConfig& config)
    : impl_(std::make_unique<Impl>()) {
    impl_->config = config;
    impl_->seed = noise_seed(seed, salt);
    impl_->build_node();
}

NoiseField::~NoiseField() = default;

NoiseField::NoiseField(NoiseField&&) noexcept = default;
NoiseField& NoiseField::operator=(NoiseField&&) noexcept = default;

bool NoiseField::is_valid() const {
    return impl_ && impl_->node;
}

float NoiseField::sample(double x, double y) const {
    if (!is_valid()) {
        return 0.5f;
    }

    float raw = impl_->node->GenSingle2D(static_cast<float>(x * impl_->config.frequency),
                                         static_cast<float>(y * impl_->config.frequency), impl_->seed);

    // Map from [-1, 1] to [0, 1]; fractal sums can slightly overshoot
    return std::clamp((raw + 1.0f) * 0.5f, 0.0f, 1.0f);
}

int32_t NoiseField::get_seed() const {
    return impl_ ? impl_->seed : 0;
}

const NoiseFieldConfig& NoiseField::get_config() const {
    static const NoiseFieldConfig empty{};
    return impl_ ? impl_->config : empty;
}

}  // namespace tileworld::world
