#include "generator.hpp"
#include <algorithm>
#include <cstdlib>
#include <spdlog/spdlog.h>

namespace fastuuid::uuid {

namespace {

std::uint64_t load_le64(const std::uint8_t *src)
{
    std::uint64_t v = 0;
    for (int i = 7; i >= 0; --i)
        v = (v << 8) | src[i];
    return v;
}


void store_le64(std::uint8_t *dst, std::uint64_t v)
{
    for (int i = 0; i < 8; ++i) {
        dst[i] = static_cast<std::uint8_t>(v);
        v >>= 8;
    }
}


// stateless, so one instance serves every thread
random_source &system_source()
{
    static system_random_source source;
    return source;
}

} // namespace


generator::generator()
    : generator(system_source())
{ }


generator::generator(random_source &source)
{
    source.read(seed_.data(), seed_.size());
    counter_.store(load_le64(seed_.data()), std::memory_order_relaxed);
    spdlog::debug("uuid generator seeded");
}


uuid generator::next() noexcept
{
    // wraps silently after 2^64 calls
    std::uint64_t x = counter_.fetch_add(1, std::memory_order_relaxed) + 1;
    uuid id = seed_;
    store_le64(id.data(), x);
    return id;
}


uuid128 generator::next128() noexcept
{
    return truncate128(next());
}


uuid128 truncate128(const uuid &id) noexcept
{
    uuid128 out;
    std::copy_n(id.begin(), out.size(), out.begin());
    return out;
}


std::unique_ptr<generator> make_generator()
{
    return std::make_unique<generator>();
}


std::unique_ptr<generator> make_generator(random_source &source)
{
    return std::make_unique<generator>(source);
}


std::unique_ptr<generator> must_make_generator()
{
    return must_make_generator(system_source());
}


std::unique_ptr<generator> must_make_generator(random_source &source)
{
    try {
        return make_generator(source);
    } catch (const random_source_error &e) {
        spdlog::critical("{}", e.what());
        spdlog::shutdown();
        std::abort();
    }
}

} // namespace fastuuid::uuid
