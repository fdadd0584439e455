// ==============================================================================
// Layer 0: Core Interface - MIDI Output
// ==============================================================================
// Send capability injected into event producers (CcFollower, RawMidiSender).
//
// Producers hold a non-owning pointer: the transport's lifetime is managed by
// whoever created it, and a producer with no output bound still computes and
// returns its events.
//
// Implementations: Cntrl::Plugins::VstEventOutput (VST3 event bus).
// ==============================================================================

#pragma once

#include <cntrl/dsp/core/midi_event.h>

namespace Cntrl::DSP {

/// @brief Abstract sink for outgoing MIDI events.
class MidiOutput {
public:
    virtual ~MidiOutput() = default;

    /// @brief Hand one event to the transport.
    /// @note Called from the audio thread by CcFollower; implementations must
    ///       not block or allocate.
    virtual void send(const MidiEvent& event) noexcept = 0;
};

}  // namespace Cntrl::DSP
