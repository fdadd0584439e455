// ==============================================================================
// Layer 3: System - CC Follower
// ==============================================================================
// Runs the audio → amplitude → envelope → MIDI CC pipeline and owns its
// run state:
//
//   Stopped ──start()──> Running/Active <──toggleActive()──> Running/Inactive
//      ^                        │                                   │
//      └──────────── stop() ────┴───────────────────────────────────┘
//
// start() needs input access (granted by the capture collaborator). Without
// it start() is a silent no-op. While stopped, incoming samples are ignored.
// While running and inactive, samples keep feeding the smoother but no events
// are emitted.
//
// Threading: start/stop/toggle and processing must all be called from the
// same (audio) thread. Display values are published via relaxed atomics for
// lock-free reads from any thread.
// ==============================================================================

#pragma once

#include <cntrl/dsp/core/midi_event.h>
#include <cntrl/dsp/core/midi_output.h>
#include <cntrl/dsp/primitives/amplitude_tap.h>
#include <cntrl/dsp/processors/cc_envelope_follower.h>

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace Cntrl::DSP {

/// @brief Run state of the follower pipeline
enum class FollowerRunState : uint8_t {
    Stopped = 0,
    RunningInactive = 1,
    RunningActive = 2
};

class CcFollower {
public:
    // =========================================================================
    // Wiring
    // =========================================================================

    /// @brief Bind the transport events are sent to (nullptr to unbind).
    /// @note Non-owning. The output must outlive its binding.
    void setOutput(MidiOutput* output) noexcept { output_ = output; }

    [[nodiscard]] MidiOutput* getOutput() const noexcept { return output_; }

    /// @brief Record whether audio capture is permitted/available.
    /// Revoking access does not stop a running pipeline; it only blocks the
    /// next start().
    void setInputAccess(bool granted) noexcept { inputAccess_ = granted; }

    [[nodiscard]] bool hasInputAccess() const noexcept { return inputAccess_; }

    // =========================================================================
    // Run State
    // =========================================================================

    /// @brief Stopped -> Running/Active. No-op without input access or when
    ///        already running.
    void start() noexcept {
        if (!inputAccess_ || running_) {
            return;
        }
        running_ = true;
        follower_.setActive(true);
    }

    /// @brief Running(*) -> Stopped. The smoothed amplitude is kept.
    void stop() noexcept {
        running_ = false;
        follower_.setActive(false);
    }

    /// @brief Start when stopped, otherwise flip Active/Inactive.
    void toggleActive() noexcept {
        if (!running_) {
            start();
            return;
        }
        follower_.setActive(!follower_.isActive());
    }

    [[nodiscard]] bool isRunning() const noexcept { return running_; }
    [[nodiscard]] bool isActive() const noexcept { return running_ && follower_.isActive(); }

    [[nodiscard]] FollowerRunState getRunState() const noexcept {
        if (!running_) {
            return FollowerRunState::Stopped;
        }
        return follower_.isActive() ? FollowerRunState::RunningActive
                                    : FollowerRunState::RunningInactive;
    }

    // =========================================================================
    // Processing
    // =========================================================================

    /// @brief Feed one amplitude reading.
    /// @return The CC event emitted for this reading, if any. The event is
    ///         also forwarded to the bound output.
    std::optional<MidiEvent> processAmplitude(float amplitude) noexcept {
        if (!running_) {
            return std::nullopt;
        }

        auto event = follower_.processSample(amplitude);
        publish();

        if (event && output_ != nullptr) {
            output_->send(*event);
        }
        return event;
    }

    /// @brief Reduce an audio block through the amplitude tap and feed the
    ///        resulting reading.
    std::optional<MidiEvent> processBlock(const float* buffer, size_t numSamples) noexcept {
        if (!running_ || numSamples == 0) {
            return std::nullopt;
        }
        return processAmplitude(tap_.analyze(buffer, numSamples));
    }

    /// @brief Clear the envelope and the published display values.
    void reset() noexcept {
        follower_.reset();
        tap_.reset();
        publish();
    }

    // =========================================================================
    // Components
    // =========================================================================

    [[nodiscard]] CcEnvelopeFollower& follower() noexcept { return follower_; }
    [[nodiscard]] const CcEnvelopeFollower& follower() const noexcept { return follower_; }

    [[nodiscard]] AmplitudeTap& amplitudeTap() noexcept { return tap_; }

    // =========================================================================
    // Display Values (any thread)
    // =========================================================================

    [[nodiscard]] int getDisplayCcValue() const noexcept {
        return displayCcValue_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] float getDisplayAmplitude() const noexcept {
        return displayAmplitude_.load(std::memory_order_relaxed);
    }

private:
    void publish() noexcept {
        displayCcValue_.store(follower_.getCcValue(), std::memory_order_relaxed);
        displayAmplitude_.store(follower_.getCurrentAmplitude(), std::memory_order_relaxed);
    }

    CcEnvelopeFollower follower_;
    AmplitudeTap tap_;
    MidiOutput* output_ = nullptr;

    bool inputAccess_ = false;
    bool running_ = false;

    std::atomic<int> displayCcValue_{0};
    std::atomic<float> displayAmplitude_{0.0f};
};

}  // namespace Cntrl::DSP
