// ==============================================================================
// Layer 2: DSP Processor - CC Envelope Follower
// ==============================================================================
// Turns a stream of amplitude readings into a 7-bit MIDI controller value:
//
//   smoothed  = smoothed * smoothing + amplitude * (1 - smoothing)
//   processed = max(0, (smoothed - threshold) * gain)
//   ccValue   = clamp(round(processed * 127), 0, 127)
//
// and, while active, a Control Change event carrying that value.
//
// Real-time safe: noexcept, O(1), no allocation, no locking, no logging.
// Layer 2: depends only on Layer 0.
// ==============================================================================

#pragma once

#include <cntrl/dsp/core/db_utils.h>
#include <cntrl/dsp/core/midi_event.h>
#include <cntrl/dsp/core/midi_utils.h>

#include <algorithm>
#include <cmath>
#include <optional>

namespace Cntrl::DSP {

// =============================================================================
// EnvelopeFollowerState
// =============================================================================

/// @brief Running state of one envelope-to-CC follower.
///
/// Owned exclusively by the audio thread. Readers on other threads must go
/// through a hand-off (see CcFollower's published display values).
///
/// smoothedAmplitude is never reset by stopping or starting the pipeline:
/// a restart resumes from the last smoothed value.
struct EnvelopeFollowerState {
    float smoothedAmplitude = 0.0f;
    float threshold = 0.1f;   ///< [0, 0.5]
    float gain = 1.0f;        ///< [0.1, 10]
    float smoothing = 0.8f;   ///< [0, 0.99]
    int ccValue = 0;          ///< Last quantised value [0, 127]
    bool isActive = false;    ///< Gates event emission only

    int ccNumber = kDefaultCcNumber;        ///< Destination controller
    int midiChannel = kDefaultMidiChannel;  ///< Destination channel, 1-indexed
};

/// @brief Advance the follower by one amplitude reading.
///
/// Finite amplitudes are not clamped; callers deliver [0, 1]. Values above
/// 1 overdrive the smoother, and the quantiser saturates at 127. NaN and
/// infinite readings are treated as silence so the running state stays
/// finite.
///
/// ccValue is updated whether or not the follower is active.
///
/// @return A Control Change event when state.isActive, std::nullopt otherwise
[[nodiscard]] inline std::optional<MidiEvent> processEnvelopeSample(
    EnvelopeFollowerState& state, float amplitude) noexcept {
    if (!detail::isFinite(amplitude)) {
        amplitude = 0.0f;
    }

    // One-pole low-pass
    state.smoothedAmplitude = detail::flushDenormal(
        state.smoothedAmplitude * state.smoothing + amplitude * (1.0f - state.smoothing));

    // Noise gate, then gain
    const float processed = std::max(0.0f, (state.smoothedAmplitude - state.threshold) * state.gain);

    // Saturate before rounding so overdrive never wraps or overflows
    const float scaled = std::min(processed * static_cast<float>(kMaxMidiDataValue),
                                  static_cast<float>(kMaxMidiDataValue));
    state.ccValue = clampToDataRange(static_cast<int>(std::lround(scaled)));

    if (!state.isActive) {
        return std::nullopt;
    }
    return encodeCC(state.ccNumber, state.ccValue, state.midiChannel);
}

// =============================================================================
// CcEnvelopeFollower Class
// =============================================================================

/// @brief Layer 2 DSP Processor - envelope follower with a CC output stage
///
/// Wraps EnvelopeFollowerState with range-checked parameter setters.
///
/// @par Usage
/// @code
/// CcEnvelopeFollower follower;
/// follower.setThreshold(0.2f);
/// follower.setGain(2.0f);
/// follower.setActive(true);
///
/// // Per amplitude reading, on the audio thread
/// if (auto event = follower.processSample(amplitude)) {
///     output.send(*event);
/// }
/// @endcode
class CcEnvelopeFollower {
public:
    // =========================================================================
    // Constants
    // =========================================================================

    static constexpr float kMinThreshold = 0.0f;
    static constexpr float kMaxThreshold = 0.5f;
    static constexpr float kDefaultThreshold = 0.1f;
    static constexpr float kMinGain = 0.1f;
    static constexpr float kMaxGain = 10.0f;
    static constexpr float kDefaultGain = 1.0f;
    static constexpr float kMinSmoothing = 0.0f;
    static constexpr float kMaxSmoothing = 0.99f;
    static constexpr float kDefaultSmoothing = 0.8f;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// @brief Clear the smoothed amplitude and the last CC value.
    /// @note Parameters and the active flag are kept. Stopping the pipeline
    ///       does not call this; only a host re-activation does.
    void reset() noexcept {
        state_.smoothedAmplitude = 0.0f;
        state_.ccValue = 0;
    }

    // =========================================================================
    // Processing
    // =========================================================================

    /// @brief Process one amplitude reading
    /// @return CC event while active, std::nullopt otherwise
    [[nodiscard]] std::optional<MidiEvent> processSample(float amplitude) noexcept {
        return processEnvelopeSample(state_, amplitude);
    }

    // =========================================================================
    // Parameter Setters
    // =========================================================================

    /// @param threshold Noise gate level, clamped to [0, 0.5]
    void setThreshold(float threshold) noexcept {
        state_.threshold = std::clamp(sanitize(threshold, kDefaultThreshold), kMinThreshold, kMaxThreshold);
    }

    /// @param gain Post-gate gain, clamped to [0.1, 10]
    void setGain(float gain) noexcept {
        state_.gain = std::clamp(sanitize(gain, kDefaultGain), kMinGain, kMaxGain);
    }

    /// @param smoothing Smoothing coefficient, clamped to [0, 0.99]
    void setSmoothing(float smoothing) noexcept {
        state_.smoothing = std::clamp(sanitize(smoothing, kDefaultSmoothing), kMinSmoothing, kMaxSmoothing);
    }

    /// @param ccNumber Destination controller; masked at encode time
    void setCcNumber(int ccNumber) noexcept { state_.ccNumber = ccNumber; }

    /// @param channel Destination channel, 1-indexed; masked at encode time
    void setMidiChannel(int channel) noexcept { state_.midiChannel = channel; }

    void setActive(bool active) noexcept { state_.isActive = active; }

    // =========================================================================
    // Parameter Getters
    // =========================================================================

    [[nodiscard]] float getThreshold() const noexcept { return state_.threshold; }
    [[nodiscard]] float getGain() const noexcept { return state_.gain; }
    [[nodiscard]] float getSmoothing() const noexcept { return state_.smoothing; }
    [[nodiscard]] int getCcNumber() const noexcept { return state_.ccNumber; }
    [[nodiscard]] int getMidiChannel() const noexcept { return state_.midiChannel; }
    [[nodiscard]] bool isActive() const noexcept { return state_.isActive; }

    // =========================================================================
    // Output
    // =========================================================================

    /// @brief Last quantised controller value [0, 127]
    [[nodiscard]] int getCcValue() const noexcept { return state_.ccValue; }

    /// @brief Current smoothed amplitude (before threshold and gain)
    [[nodiscard]] float getCurrentAmplitude() const noexcept { return state_.smoothedAmplitude; }

    [[nodiscard]] const EnvelopeFollowerState& getState() const noexcept { return state_; }

private:
    [[nodiscard]] static float sanitize(float value, float fallback) noexcept {
        return detail::isFinite(value) ? value : fallback;
    }

    EnvelopeFollowerState state_;
};

}  // namespace Cntrl::DSP
