#pragma once

// ==============================================================================
// VstEventOutput - MidiOutput adapter onto a VST3 event list
// ==============================================================================
// Converts engine MidiEvents into Steinberg::Vst::Event records and appends
// them to the processor's output event list:
//
//   ControlChange   -> kLegacyMIDICCOutEvent
//   NoteOn/NoteOff  -> kNoteOnEvent / kNoteOffEvent (velocity / 127)
//   SystemExclusive -> kDataEvent (DataEvent::kMidiSysEx)
//
// Thread Safety: audio thread only. bind() is called per process() chunk.
//
// SysEx events point at the engine's buffer. That buffer must stay alive
// until the end of the process() call that emitted it.
// ==============================================================================

#include <cntrl/dsp/core/midi_event.h>
#include <cntrl/dsp/core/midi_output.h>

#include "pluginterfaces/vst/ivstevents.h"

namespace Cntrl::Plugins {

class VstEventOutput : public Cntrl::DSP::MidiOutput {
public:
    VstEventOutput() = default;

    /// @brief Direct subsequent sends to an event list.
    /// @param events       Output event list (nullptr drops events)
    /// @param sampleOffset Position inside the current block
    /// @param busIndex     Event output bus
    void bind(Steinberg::Vst::IEventList* events,
              Steinberg::int32 sampleOffset = 0,
              Steinberg::int32 busIndex = 0) noexcept;

    void unbind() noexcept;

    void setSampleOffset(Steinberg::int32 sampleOffset) noexcept { sampleOffset_ = sampleOffset; }

    [[nodiscard]] bool isBound() const noexcept { return events_ != nullptr; }

    void send(const Cntrl::DSP::MidiEvent& event) noexcept override;

    /// Events successfully added since the last resetCounters()
    [[nodiscard]] Steinberg::int32 getSentCount() const noexcept { return sentCount_; }

    /// Events lost because no list was bound or the host refused them
    [[nodiscard]] Steinberg::int32 getDroppedCount() const noexcept { return droppedCount_; }

    void resetCounters() noexcept {
        sentCount_ = 0;
        droppedCount_ = 0;
    }

    /// @brief Fill a VST3 event from an engine event.
    /// busIndex, sampleOffset and ppqPosition are left untouched.
    /// @return false if the event has no VST3 representation
    static bool toVstEvent(const Cntrl::DSP::MidiEvent& event, Steinberg::Vst::Event& out) noexcept;

private:
    Steinberg::Vst::IEventList* events_ = nullptr;
    Steinberg::int32 sampleOffset_ = 0;
    Steinberg::int32 busIndex_ = 0;
    Steinberg::int32 sentCount_ = 0;
    Steinberg::int32 droppedCount_ = 0;
};

} // namespace Cntrl::Plugins
