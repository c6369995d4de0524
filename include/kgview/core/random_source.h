#pragma once

#include <cstdint>
#include <random>

namespace kgview {
namespace core {

/*
 * Source of pseudo-random numbers for layout seeding and decorative effects.
 * Production code uses an entropy-seeded generator; tests inject a fixed seed.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Uniform float in [min, max).
    virtual float NextFloat(float min, float max) = 0;
};

class Mt19937RandomSource : public RandomSource {
public:
    // Seeds from std::random_device.
    Mt19937RandomSource();
    explicit Mt19937RandomSource(std::uint32_t seed);

    float NextFloat(float min, float max) override;

    std::uint32_t GetSeed() const { return seed_; }

private:
    std::uint32_t seed_;
    std::mt19937 engine_;
};

} // namespace core
} // namespace kgview
