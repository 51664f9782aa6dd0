#pragma once
#include "random_source.hpp"
#include <array>
#include <atomic>
#include <cstdint>
#include <memory>

namespace fastuuid::uuid {

using uuid = std::array<std::uint8_t, 24>;
using uuid128 = std::array<std::uint8_t, 16>;

// Generates 192 bit identifiers in sequence from a random starting point.
//
// The seed is read once at construction. Every identifier carries the current counter value
// (little-endian) in its first 8 bytes and seed bytes 8..23 unchanged, so consecutive identifiers
// are adjacent and therefore guessable. Only the first 8 bytes vary, which makes the leading
// 16 bytes usable as a weaker 128 bit identifier.
//
// next() may be called concurrently from any number of threads.
class generator {
public:
    // Seeds from the system entropy source. Throws random_source_error.
    generator();
    // Throws random_source_error if source cannot supply the seed.
    explicit generator(random_source &source);

    generator(const generator &) = delete;
    generator &operator=(const generator &) = delete;

    uuid next() noexcept;
    uuid128 next128() noexcept;

private:
    // seed_[0..7] is copied into counter_ and ignored thereafter
    uuid seed_{};
    std::atomic<std::uint64_t> counter_{0};
};


uuid128 truncate128(const uuid &id) noexcept;

std::unique_ptr<generator> make_generator();
std::unique_ptr<generator> make_generator(random_source &source);

// Like make_generator(), but logs and aborts the process if the seed cannot be read.
std::unique_ptr<generator> must_make_generator();
std::unique_ptr<generator> must_make_generator(random_source &source);

} // namespace fastuuid::uuid
