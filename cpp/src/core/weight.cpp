#include "otree/weight.hpp"

#include <cmath>

namespace otree {

Weight Weight::from_fraction(double fraction) noexcept {
    if (!(fraction > 0.0)) return MinValue;
    if (fraction >= 1.0) return MaxValue;
    double scaled = std::floor(fraction * RANGE + static_cast<double>(MIN_INT));
    if (scaled >= static_cast<double>(MAX_INT)) return MaxValue;
    return Weight(static_cast<int32_t>(scaled));
}

} // namespace otree
