// ==============================================================================
// Layer 0: Core Utilities
// range_mapping.h - Clamped affine mapping from a continuous range to integers
// ==============================================================================
// Real-time safe: no allocation, no locks, no exceptions, no I/O.
// Layer 0: no dependencies on higher layers.
// ==============================================================================

#pragma once

#include <algorithm>
#include <cmath>

namespace Cntrl::DSP {

/// @brief Describes how a continuous control value maps onto an integer range.
///
/// The defaults map a normalised gesture value [0, 1] onto the full 7-bit
/// controller range [0, 127]. The output bounds may be reversed
/// (outputLow > outputHigh) to invert a control.
///
/// inputLow < inputHigh is a convention and is not enforced. When the bounds
/// are swapped, the clamp in map() collapses onto a single point. That is the
/// established behaviour and is kept.
struct RangeMapping {
    double inputLow = 0.0;
    double inputHigh = 1.0;
    int outputLow = 0;
    int outputHigh = 127;

    /// @brief Map an input value onto the output range.
    ///
    /// 1. Clamp input to [inputLow, inputHigh]
    /// 2. Normalise; a zero-width input range returns outputLow
    /// 3. Scale into [outputLow, outputHigh] and round half away from zero
    ///
    /// NaN input is treated as inputLow, so the result is always defined.
    ///
    /// @example RangeMapping{}.map(0.5)   -> 64
    /// @example RangeMapping{}.map(-3.0)  -> 0
    /// @example RangeMapping{0.0, 1.0, 127, 0}.map(0.25) -> 95
    [[nodiscard]] int map(double input) const noexcept {
        if (std::isnan(input)) {
            input = inputLow;
        }

        const double clamped = std::min(std::max(input, inputLow), inputHigh);
        const double inputRange = inputHigh - inputLow;
        if (inputRange == 0.0) {
            return outputLow;
        }

        // Widen before subtracting: the full int range overflows in int
        const double low = static_cast<double>(outputLow);
        const double high = static_cast<double>(outputHigh);
        const double normalized = (clamped - inputLow) / inputRange;
        const double mapped = std::clamp(normalized * (high - low) + low,
                                         std::min(low, high), std::max(low, high));
        return static_cast<int>(std::lround(mapped));
    }

    /// @return true when the input range has zero width
    [[nodiscard]] bool isDegenerate() const noexcept {
        return inputHigh == inputLow;
    }

    [[nodiscard]] bool operator==(const RangeMapping&) const noexcept = default;
};

/// Free-function form of RangeMapping::map().
[[nodiscard]] inline int mapValue(const RangeMapping& mapping, double input) noexcept {
    return mapping.map(input);
}

}  // namespace Cntrl::DSP
