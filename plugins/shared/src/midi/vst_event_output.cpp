// ==============================================================================
// VstEventOutput Implementation
// ==============================================================================

#include "midi/vst_event_output.h"

#include <cntrl/dsp/core/midi_utils.h>

namespace Cntrl::Plugins {

using Cntrl::DSP::MidiEvent;
using Cntrl::DSP::MidiEventType;

// =============================================================================
// Binding
// =============================================================================

void VstEventOutput::bind(Steinberg::Vst::IEventList* events,
                          Steinberg::int32 sampleOffset,
                          Steinberg::int32 busIndex) noexcept {
    events_ = events;
    sampleOffset_ = sampleOffset;
    busIndex_ = busIndex;
}

void VstEventOutput::unbind() noexcept {
    events_ = nullptr;
    sampleOffset_ = 0;
}

// =============================================================================
// Conversion
// =============================================================================

bool VstEventOutput::toVstEvent(const MidiEvent& event, Steinberg::Vst::Event& out) noexcept {
    using Steinberg::Vst::Event;
    constexpr float kVelocityScale = 1.0f / static_cast<float>(Cntrl::DSP::kMaxMidiDataValue);

    switch (event.type) {
        case MidiEventType::ControlChange:
            out.type = Event::kLegacyMIDICCOutEvent;
            out.midiCCOut.controlNumber = event.controller();
            out.midiCCOut.channel = static_cast<Steinberg::int8>(event.channel);
            out.midiCCOut.value = static_cast<Steinberg::int8>(event.value());
            out.midiCCOut.value2 = 0;
            return true;

        case MidiEventType::NoteOn:
            out.type = Event::kNoteOnEvent;
            out.noteOn.channel = static_cast<Steinberg::int16>(event.channel);
            out.noteOn.pitch = static_cast<Steinberg::int16>(event.note());
            out.noteOn.tuning = 0.0f;
            out.noteOn.velocity = static_cast<float>(event.velocity()) * kVelocityScale;
            out.noteOn.length = 0;
            out.noteOn.noteId = -1;
            return true;

        case MidiEventType::NoteOff:
            out.type = Event::kNoteOffEvent;
            out.noteOff.channel = static_cast<Steinberg::int16>(event.channel);
            out.noteOff.pitch = static_cast<Steinberg::int16>(event.note());
            out.noteOff.velocity = static_cast<float>(event.velocity()) * kVelocityScale;
            out.noteOff.noteId = -1;
            out.noteOff.tuning = 0.0f;
            return true;

        case MidiEventType::SystemExclusive:
            if (event.sysex.empty()) {
                return false;
            }
            out.type = Event::kDataEvent;
            out.data.type = Steinberg::Vst::DataEvent::kMidiSysEx;
            out.data.size = static_cast<Steinberg::uint32>(event.sysex.size());
            out.data.bytes = event.sysex.data();
            return true;
    }
    return false;
}

// =============================================================================
// MidiOutput
// =============================================================================

void VstEventOutput::send(const MidiEvent& event) noexcept {
    if (events_ == nullptr) {
        ++droppedCount_;
        return;
    }

    Steinberg::Vst::Event vstEvent{};
    vstEvent.busIndex = busIndex_;
    vstEvent.sampleOffset = sampleOffset_;
    vstEvent.ppqPosition = 0.0;
    vstEvent.flags = Steinberg::Vst::Event::kIsLive;

    if (!toVstEvent(event, vstEvent)) {
        ++droppedCount_;
        return;
    }

    if (events_->addEvent(vstEvent) == Steinberg::kResultTrue) {
        ++sentCount_;
    } else {
        ++droppedCount_;
    }
}

} // namespace Cntrl::Plugins
