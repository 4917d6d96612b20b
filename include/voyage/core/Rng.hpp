#pragma once
// include/voyage/core/Rng.hpp
//
// Dice for the weather engine. Every roll the engine makes goes through a
// RandomSource passed in by the caller, so a journey's weather is reproducible
// from its seed and tests can script exact roll sequences.

#include <cstdint>

namespace voyage::rng {

using Seed = std::uint64_t;

// 64-bit mixing (turns small seeds and journey ids into well-scrambled seeds)
inline std::uint64_t mix64(std::uint64_t x) {
    x += 0x9E3779B97F4A7C15ull;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ull;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBull;
    return x ^ (x >> 31);
}

// Derive a child seed from a parent seed and a stable numeric ID
inline Seed derive(Seed parent, std::uint64_t id) {
    return mix64(parent ^ mix64(id));
}

// Minimal PCG32 (XSH-RR). One 64-bit state + 64-bit stream/sequence.
struct Pcg32 {
    std::uint64_t state = 0;
    std::uint64_t inc   = 0; // must be odd

    Pcg32() = default;
    explicit Pcg32(Seed initstate, Seed sequence = 0) { seed(initstate, sequence); }

    void seed(Seed initstate, Seed sequence = 0) {
        state = 0;
        inc   = (mix64(sequence) << 1u) | 1u;
        next_u32();
        state += mix64(initstate);
        next_u32();
    }

    std::uint32_t next_u32() {
        std::uint64_t old = state;
        state = old * 6364136223846793005ull + inc;
        std::uint32_t xorshifted = static_cast<std::uint32_t>(((old >> 18u) ^ old) >> 27u);
        std::uint32_t rot        = static_cast<std::uint32_t>(old >> 59u);
        return (xorshifted >> rot) | (xorshifted << ((-static_cast<int>(rot)) & 31));
    }

    // Uniform on [0, bound) without modulo bias (rejection method)
    std::uint32_t next_bounded(std::uint32_t bound) {
        std::uint32_t threshold = static_cast<std::uint32_t>(-bound) % bound;
        for (;;) {
            std::uint32_t r = next_u32();
            if (r >= threshold) return r % bound;
        }
    }
};

// Source of uniform integer rolls. Implementations must return a value in
// [lo, hi] for any lo <= hi.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    virtual int uniform(int lo, int hi) = 0;

    // Called before the rolls for a journey day. Sources that key their dice
    // by day reseed here; the default keeps one continuous sequence.
    virtual void beginDay(int /*day*/) {}

    int d10()  { return uniform(1, 10); }
    int d100() { return uniform(1, 100); }
    int coin() { return uniform(1, 2); }
};

class PcgRandomSource final : public RandomSource {
public:
    explicit PcgRandomSource(Seed seed, Seed stream = 0) : m_pcg(seed, stream) {}

    int uniform(int lo, int hi) override {
        if (hi <= lo) return lo;
        const auto span = static_cast<std::uint32_t>(hi - lo) + 1u;
        return lo + static_cast<int>(m_pcg.next_bounded(span));
    }

private:
    Pcg32 m_pcg;
};

// Reseeds from (seed, day) at every beginDay, so day N rolls the same dice
// whether it is generated alone or as part of a stage.
class DayKeyedRandomSource final : public RandomSource {
public:
    explicit DayKeyedRandomSource(Seed seed, Seed stream = 0)
        : m_seed(seed), m_stream(stream), m_pcg(seed, stream) {}

    void beginDay(int day) override {
        m_pcg.seed(derive(m_seed, static_cast<std::uint64_t>(day)), m_stream);
    }

    int uniform(int lo, int hi) override {
        if (hi <= lo) return lo;
        const auto span = static_cast<std::uint32_t>(hi - lo) + 1u;
        return lo + static_cast<int>(m_pcg.next_bounded(span));
    }

private:
    Seed  m_seed;
    Seed  m_stream;
    Pcg32 m_pcg;
};

} // namespace voyage::rng
