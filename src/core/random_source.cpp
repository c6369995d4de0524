#include <kgview/core/random_source.h>

namespace kgview {
namespace core {

namespace {
std::uint32_t EntropySeed() {
    std::random_device device;
    return device();
}
} // anonymous namespace

Mt19937RandomSource::Mt19937RandomSource() : Mt19937RandomSource(EntropySeed()) {}

Mt19937RandomSource::Mt19937RandomSource(std::uint32_t seed) : seed_(seed), engine_(seed) {}

float Mt19937RandomSource::NextFloat(float min, float max) {
    if (!(max > min)) return min;
    std::uniform_real_distribution<float> dist(min, max);
    return dist(engine_);
}

} // namespace core
} // namespace kgview
