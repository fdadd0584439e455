// ==============================================================================
// Layer 0: Core Utilities
// db_utils.h - Float sanitising and level metering helpers
// ==============================================================================
// Real-time safe: no allocation, no locks, no exceptions, no I/O.
// Layer 0: no dependencies on higher layers.
// ==============================================================================

#pragma once

#include <bit>
#include <cmath>
#include <cstdint>

namespace Cntrl::DSP {

// ==============================================================================
// Constants
// ==============================================================================

/// Floor value for silence in decibels (~24-bit dynamic range).
inline constexpr float kSilenceFloorDb = -144.0f;

/// Threshold below which values are flushed to zero (denormal prevention)
inline constexpr float kDenormalThreshold = 1e-15f;

namespace detail {

/// Constexpr-safe NaN check using the IEEE 754 bit pattern.
///
/// The VST3 SDK enables -ffast-math globally, which lets the compiler assume
/// NaN never occurs and optimise std::isnan() away. Inspecting the bits keeps
/// the check alive. Translation units relying on it are built with
/// -fno-fast-math (see CMakeLists.txt).
[[nodiscard]] constexpr bool isNaN(float x) noexcept {
    const auto bits = std::bit_cast<std::uint32_t>(x);
    return ((bits & 0x7F800000u) == 0x7F800000u) && ((bits & 0x007FFFFFu) != 0);
}

/// Infinity check (either sign) using the IEEE 754 bit pattern.
[[nodiscard]] constexpr bool isInf(float x) noexcept {
    const auto bits = std::bit_cast<std::uint32_t>(x);
    return (bits & 0x7FFFFFFFu) == 0x7F800000u;
}

/// @return true if x is neither NaN nor infinite
[[nodiscard]] constexpr bool isFinite(float x) noexcept {
    const auto bits = std::bit_cast<std::uint32_t>(x);
    return (bits & 0x7F800000u) != 0x7F800000u;
}

/// Flush denormal values to zero.
[[nodiscard]] inline float flushDenormal(float x) noexcept {
    return (std::abs(x) < kDenormalThreshold) ? 0.0f : x;
}

} // namespace detail

// ==============================================================================
// Functions
// ==============================================================================

/// Convert a linear level to decibels for metering.
///
/// @param gain  Linear level
/// @return      Level in dB, never below kSilenceFloorDb
///
/// @note Zero, negative and NaN input return kSilenceFloorDb
///
/// @example gainToDb(1.0f)  -> 0.0f
/// @example gainToDb(0.5f)  -> ~-6.02f
/// @example gainToDb(0.0f)  -> -144.0f
[[nodiscard]] inline float gainToDb(float gain) noexcept {
    if (detail::isNaN(gain) || gain <= 0.0f) {
        return kSilenceFloorDb;
    }
    const float result = 20.0f * std::log10(gain);
    return (result < kSilenceFloorDb) ? kSilenceFloorDb : result;
}

} // namespace Cntrl::DSP
