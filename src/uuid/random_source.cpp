#include "random_source.hpp"
#include "utils/string.hpp"
#include <algorithm>
#include <cerrno>
#include <fmt/core.h>
#include <sys/random.h>
#include <utility>

namespace fastuuid::uuid {

void system_random_source::read(std::uint8_t *buf, std::size_t len)
{
    std::size_t filled = 0;
    while (filled < len) {
        ssize_t rc = getrandom(buf + filled, len - filled, 0);
        if (rc < 0) {
            if (errno == EINTR)
                continue;
            throw random_source_error(fmt::format("getrandom() failed: {}", utils::string::str_err(errno)));
        }
        // short reads are possible for requests above 256 bytes or when interrupted
        filled += static_cast<std::size_t>(rc);
    }
}


fixed_random_source::fixed_random_source(std::vector<std::uint8_t> bytes)
    : bytes_(std::move(bytes))
{ }


void fixed_random_source::read(std::uint8_t *buf, std::size_t len)
{
    if (len > remaining())
        throw random_source_error(fmt::format("unexpected EOF: wanted {} bytes, {} available", len, remaining()));

    std::copy_n(bytes_.begin() + static_cast<std::ptrdiff_t>(pos_), len, buf);
    pos_ += len;
}

} // namespace fastuuid::uuid
