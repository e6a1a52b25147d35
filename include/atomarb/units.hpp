// AtomArb - Unit Conversion
// Human decimal strings <-> atomic integer units

#pragma once

#include <atomarb/types.hpp>
#include <string>
#include <string_view>

namespace atomarb::units {

// "1.5" with 6 decimals -> 1500000. Extra fractional digits are truncated.
// Throws std::invalid_argument on malformed text.
Amount parse(std::string_view text, int decimals);

// 1500000 with 6 decimals -> "1.5"
std::string format(Amount amount, int decimals);

// 10^decimals, decimals in [0, 18]
Amount scale(int decimals);

}  // namespace atomarb::units
