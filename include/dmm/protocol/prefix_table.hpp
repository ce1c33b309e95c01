#pragma once

#include <array>
#include <cstddef>

namespace dmm {

// Metric prefixes the LCD can light next to the unit.
enum class Prefix { None = 0, Nano, Micro, Milli, Kilo, Mega };

// Factor applied to a parsed reading for each prefix. Callers may inject their
// own table; the default is plain SI.
struct PrefixTable {
    std::array<double, 6> factors{1.0, 1e-9, 1e-6, 1e-3, 1e3, 1e6};

    [[nodiscard]] double factor(Prefix prefix) const {
        return factors[static_cast<std::size_t>(prefix)];
    }
};

inline const char *prefix_symbol(Prefix prefix) {
    switch (prefix) {
        case Prefix::None: return "";
        case Prefix::Nano: return "n";
        case Prefix::Micro: return "u";
        case Prefix::Milli: return "m";
        case Prefix::Kilo: return "k";
        case Prefix::Mega: return "M";
    }
    return "";
}

} // namespace dmm
