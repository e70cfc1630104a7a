#pragma once

#include <cstddef>
#include <cstdint>

namespace lc {

// xorshift64* PRNG. Explicitly seeded and passed by reference to whatever
// draws from it, so a fixed seed reproduces a run exactly.
class Random {
public:
    explicit Random(uint64_t s) { seed(s); }

    Random(const Random&) = delete;
    Random& operator=(const Random&) = delete;

    // xorshift can't have zero state
    void seed(uint64_t s) {
        state_ = s;
        if (state_ == 0) state_ = 1;
    }

    // Uniform index in [0, max)
    std::size_t randInt(std::size_t max) {
        if (max == 0) return 0;
        return static_cast<std::size_t>(next() % static_cast<uint64_t>(max));
    }

    // Uniform double in [0.0, 1.0)
    double randDouble() {
        return static_cast<double>(next() >> 11) * (1.0 / 9007199254740992.0);
    }

    double randDouble(double min, double max) {
        return min + randDouble() * (max - min);
    }

private:
    uint64_t next() {
        uint64_t x = state_;
        x ^= x >> 12;
        x ^= x << 25;
        x ^= x >> 27;
        state_ = x;
        return x * 0x2545F4914F6CDD1DULL;
    }

    uint64_t state_ = 1;
};

}  // namespace lc
