#pragma once
#include "generator.hpp"
#include <string>
#include <string_view>

namespace fastuuid::uuid {

// Renders the first 16 bytes as xxxxxxxx-xxxx-4xxx-8xxx-xxxxxxxxxxxx (lowercase).
// Bytes 6 and 9 are swapped first so that no counter byte is hidden behind the
// version/variant markers. The markers are constants and carry no meaning.
std::string hex128(const uuid &id);
std::string hex128(const uuid128 &id);

// All 24 bytes as 48 lowercase hex digits, without separators or markers.
std::string hex192(const uuid &id);

// True iff s has the 8-4-4-4-12 layout with only lowercase hex digits.
bool valid_hex128(std::string_view s) noexcept;

} // namespace fastuuid::uuid
