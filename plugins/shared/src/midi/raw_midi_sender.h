#pragma once

// ==============================================================================
// RawMidiSender - Boundary entry point for raw MIDI byte buffers
// ==============================================================================
// Decodes raw buffers (Mackie Control triples, SysEx) and forwards the result
// to a MidiOutput. Buffers that do not decode are reported through the SDK
// debug log and dropped.
//
// Thread Safety: not thread-safe. Call from the thread that owns the output.
// Logging is compiled out of release builds; in development builds it writes
// to the debugger, so do not call from the audio thread there.
// ==============================================================================

#include <cntrl/dsp/core/mackie_control.h>
#include <cntrl/dsp/core/midi_event.h>
#include <cntrl/dsp/core/midi_output.h>

#include <cstdint>
#include <span>

namespace Cntrl::Plugins {

class RawMidiSender {
public:
    explicit RawMidiSender(Cntrl::DSP::MidiOutput* output = nullptr) noexcept
        : output_(output) {}

    void setOutput(Cntrl::DSP::MidiOutput* output) noexcept { output_ = output; }
    [[nodiscard]] Cntrl::DSP::MidiOutput* getOutput() const noexcept { return output_; }

    /// @brief Decode and forward one raw buffer.
    /// @return Decode status. Ok is returned even when no output is bound.
    Cntrl::DSP::MidiDecodeStatus send(std::span<const uint8_t> bytes);

    /// Send the Note On for a transport button.
    Cntrl::DSP::MidiDecodeStatus sendMackiePress(Cntrl::DSP::MackieCommand command);

    /// Send the Note Off for a transport button. The caller schedules it
    /// kMackieReleaseDelayMs after the press.
    Cntrl::DSP::MidiDecodeStatus sendMackieRelease(Cntrl::DSP::MackieCommand command);

    /// Buffers dropped because they were too short or unsupported
    [[nodiscard]] uint32_t getRejectedCount() const noexcept { return rejectedCount_; }

private:
    Cntrl::DSP::MidiOutput* output_ = nullptr;
    uint32_t rejectedCount_ = 0;
};

} // namespace Cntrl::Plugins
