#include <sequence/seed.hpp>
#include <core/errors.hpp>

namespace chromaseq::sequence {

namespace {

// SplitMix64 finalizer (Steele, Lea & Flood)
uint64_t mix64(uint64_t z) {
    z += 0x9e3779b97f4a7c15ULL;
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
    return z ^ (z >> 31);
}

// Top 53 bits → [0, 1)
constexpr double UNIT_53 = 1.0 / static_cast<double>(1ULL << 53);

} // namespace

std::string to_string(SeedMode mode) {
    return mode == SeedMode::Scrambled ? "scrambled" : "additive";
}

SeedMode parse_seed_mode(const std::string& tag) {
    if (tag == "additive") return SeedMode::Additive;
    if (tag == "scrambled") return SeedMode::Scrambled;
    throw Chromaseq::ChromaseqError(Chromaseq::ErrorKind::InvalidParameter,
                                    "Unknown seed mode: " + tag);
}

double Seed::offset() const {
    if (mode == SeedMode::Additive) {
        return static_cast<double>(value);
    }
    return static_cast<double>(mix64(static_cast<uint64_t>(value)) >> 11) * UNIT_53;
}

} // namespace chromaseq::sequence
