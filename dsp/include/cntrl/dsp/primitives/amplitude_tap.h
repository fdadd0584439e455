// ==============================================================================
// Layer 1: DSP Primitive - Amplitude Tap
// ==============================================================================
// Reduces a block of audio to a single amplitude reading that the envelope
// follower consumes. The capture layer delivers fixed blocks (256 samples by
// default) on the audio thread; each block yields one reading.
//
// Real-time safe: noexcept, no allocation.
// Layer 1: depends only on Layer 0.
// ==============================================================================

#pragma once

#include <cntrl/dsp/core/db_utils.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>

namespace Cntrl::DSP {

// =============================================================================
// AmplitudeMode Enumeration
// =============================================================================

/// @brief Block reduction used by AmplitudeTap
enum class AmplitudeMode : uint8_t {
    RMS = 0,   ///< sqrt(mean(x^2)) - tracks perceived loudness
    Peak = 1   ///< max(|x|) - tracks transients
};

// =============================================================================
// AmplitudeTap Class
// =============================================================================

/// @brief Layer 1 primitive - block amplitude detector
///
/// @par Usage
/// @code
/// AmplitudeTap tap;
/// tap.setMode(AmplitudeMode::RMS);
/// float amplitude = tap.analyze(buffer, 256);
/// @endcode
class AmplitudeTap {
public:
    static constexpr size_t kDefaultBlockSize = 256;

    /// @brief Compute the amplitude of a block.
    /// @param buffer     Audio samples (may be nullptr when numSamples == 0)
    /// @param numSamples Number of samples
    /// @return Amplitude >= 0 (0 for an empty block). NaN samples count as
    ///         silence and infinities as full scale.
    [[nodiscard]] float analyze(const float* buffer, size_t numSamples) noexcept {
        if (buffer == nullptr || numSamples == 0) {
            lastValue_ = 0.0f;
            return lastValue_;
        }

        float result = 0.0f;
        if (mode_ == AmplitudeMode::RMS) {
            double sumSquares = 0.0;
            for (size_t i = 0; i < numSamples; ++i) {
                const float s = sanitize(buffer[i]);
                sumSquares += static_cast<double>(s) * static_cast<double>(s);
            }
            result = static_cast<float>(std::sqrt(sumSquares / static_cast<double>(numSamples)));
        } else {
            for (size_t i = 0; i < numSamples; ++i) {
                result = std::max(result, std::abs(sanitize(buffer[i])));
            }
        }

        lastValue_ = detail::flushDenormal(result);
        return lastValue_;
    }

    void setMode(AmplitudeMode mode) noexcept { mode_ = mode; }

    [[nodiscard]] AmplitudeMode getMode() const noexcept { return mode_; }

    /// @brief Reading produced by the most recent analyze() call
    [[nodiscard]] float getLastValue() const noexcept { return lastValue_; }

    void reset() noexcept { lastValue_ = 0.0f; }

private:
    [[nodiscard]] static float sanitize(float x) noexcept {
        if (detail::isNaN(x)) {
            return 0.0f;
        }
        if (detail::isInf(x)) {
            return (x > 0.0f) ? 1.0f : -1.0f;
        }
        return x;
    }

    AmplitudeMode mode_ = AmplitudeMode::RMS;
    float lastValue_ = 0.0f;
};

}  // namespace Cntrl::DSP
