// TileWorld World System
// noise.hpp - Seeded uniform sampling and continuous 2D noise fields

#pragma once

#include <cstdint>
#include <memory>

namespace tileworld::world {

// ============================================================================
// Seeded Uniform Sampling
// ============================================================================

// 64-bit avalanche mix of two words (splitmix64 finaliser)
[[nodiscard]] uint64_t mix_seed(uint64_t a, uint64_t b);

/// Deterministic uniform sample in [0, 1) for (seed, salt).
/// Identical on every platform; no state is carried between calls.
[[nodiscard]] double random_unit(int64_t seed, int64_t salt = 0);

// Uniform real in [min_value, max_value)
[[nodiscard]] double random_between(int64_t seed, int64_t salt, double min_value, double max_value);

// Uniform integer in [min_value, max_value]
[[nodiscard]] int32_t random_int(int64_t seed, int64_t salt, int32_t min_value, int32_t max_value);

// Independent per-position sample; `channel` separates uses at the same position
[[nodiscard]] double random_at(int64_t seed, uint32_t channel, int32_t x, int32_t y);

// Fold a 64-bit world seed into the 32-bit seed FastNoise expects
[[nodiscard]] int32_t noise_seed(int64_t seed, int64_t salt);

// ============================================================================
// Noise Field
// ============================================================================

struct NoiseFieldConfig {
    float frequency = 0.02f;  // Input coordinates are scaled by this
    int octaves = 1;          // 1 = plain simplex, >1 = fractal Brownian motion
    float gain = 0.5f;
    float lacunarity = 2.0f;
};

// Continuous simplex/fBm field normalised to [0, 1]
class NoiseField {
public:
    // `salt` separates independent fields drawn from the same world seed
    NoiseField(int64_t seed, int64_t salt, const NoiseFieldConfig& config = {});
    ~NoiseField();

    NoiseField(const NoiseField&) = delete;
    NoiseField& operator=(const NoiseField&) = delete;
    NoiseField(NoiseField&&) noexcept;
    NoiseField& operator=(NoiseField&&) noexcept;

    // False once moved from; sampling an invalid field yields the midpoint 0.5
    [[nodiscard]] bool is_valid() const;

    [[nodiscard]] float sample(double x, double y) const;

    [[nodiscard]] int32_t get_seed() const;
    [[nodiscard]] const NoiseFieldConfig& get_config() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace tileworld::world
