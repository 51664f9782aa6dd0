#pragma once
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace fastuuid::uuid {

// Thrown when a random source cannot supply the requested bytes.
class random_source_error : public std::runtime_error {
public:
    explicit random_source_error(const std::string &desc)
        : runtime_error{"cannot generate random seed: " + desc}
    { }
};


class random_source {
public:
    virtual ~random_source() = default;

    // Fills exactly len bytes or throws random_source_error.
    virtual void read(std::uint8_t *buf, std::size_t len) = 0;
};


// Kernel CSPRNG via getrandom(2). Stateless, safe to share between threads.
class system_random_source final : public random_source {
public:
    void read(std::uint8_t *buf, std::size_t len) override;
};


// Serves a fixed byte sequence in order; throws once the sequence is exhausted.
class fixed_random_source final : public random_source {
public:
    explicit fixed_random_source(std::vector<std::uint8_t> bytes);

    void read(std::uint8_t *buf, std::size_t len) override;
    std::size_t remaining() const { return bytes_.size() - pos_; }

private:
    std::vector<std::uint8_t> bytes_;
    std::size_t pos_{0};
};

} // namespace fastuuid::uuid
