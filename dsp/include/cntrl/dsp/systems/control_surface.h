// ==============================================================================
// Layer 3: System - Control Surface
// ==============================================================================
// Translates gesture values from on-screen controls into MIDI events using
// each control's MidiMapping. Called once per value change on the UI side.
// Results come back in a fixed-capacity ControlEvents, so nothing is
// allocated.
// ==============================================================================

#pragma once

#include <cntrl/dsp/core/midi_event.h>
#include <cntrl/dsp/core/midi_utils.h>
#include <cntrl/dsp/core/range_mapping.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace Cntrl::DSP {

// =============================================================================
// Data Types
// =============================================================================

/// @brief Kinds of on-screen controller. Values are persisted; never reorder.
enum class ControlType : uint8_t {
    Knob = 0,
    Slider = 1,
    XYPad = 2,
    DrumPad = 3,
    ToggleButton = 4,
    Gyro = 5
};

inline constexpr int kNumControlTypes = 6;

/// @brief Binds one control to a MIDI destination.
///
/// ccNumber and midiChannel are stored as entered and masked when encoded.
struct MidiMapping {
    int ccNumber = kDefaultCcNumber;
    int midiChannel = kDefaultMidiChannel;  ///< 1-indexed
    std::optional<int> noteNumber;          ///< Drum pads send notes when set
    RangeMapping rangeMapping;

    [[nodiscard]] bool operator==(const MidiMapping&) const noexcept = default;
};

/// @brief Up to two events produced by one gesture (XY pads send both axes).
struct ControlEvents {
    static constexpr size_t kCapacity = 2;

    std::array<MidiEvent, kCapacity> events{};
    size_t count{0};

    void push(const MidiEvent& event) noexcept {
        if (count < kCapacity) {
            events[count++] = event;
        }
    }

    [[nodiscard]] bool empty() const noexcept { return count == 0; }
    [[nodiscard]] size_t size() const noexcept { return count; }
    [[nodiscard]] const MidiEvent& operator[](size_t i) const noexcept { return events[i]; }
    [[nodiscard]] const MidiEvent* begin() const noexcept { return events.data(); }
    [[nodiscard]] const MidiEvent* end() const noexcept { return events.data() + count; }
};

// =============================================================================
// Control Type Info
// =============================================================================

/// Name shown in the palette and used as the default component label.
[[nodiscard]] constexpr std::string_view controlTypeDisplayName(ControlType type) noexcept {
    switch (type) {
        case ControlType::Knob:         return "Minimal Knob";
        case ControlType::Slider:       return "Minimal Slider";
        case ControlType::XYPad:        return "XY Pad";
        case ControlType::DrumPad:      return "Drum Pad";
        case ControlType::ToggleButton: return "Toggle Button";
        case ControlType::Gyro:         return "Gyroscope";
    }
    return "";
}

/// @return true if the raw value names a known control type
[[nodiscard]] constexpr bool isValidControlType(int raw) noexcept {
    return raw >= 0 && raw < kNumControlTypes;
}

// =============================================================================
// Translation
// =============================================================================

/// @brief CC event for a single-axis value through the mapping's range.
[[nodiscard]] inline MidiEvent mapToControlChange(const MidiMapping& mapping, double value) noexcept {
    return encodeCC(mapping.ccNumber, mapping.rangeMapping.map(value), mapping.midiChannel);
}

/// @brief Toggle buttons snap to fully on or fully off before mapping.
[[nodiscard]] constexpr double toggleValue(double value) noexcept {
    return (value > 0.5) ? 1.0 : 0.0;
}

/// @brief Events for an XY pad: X on ccNumber, Y on ccNumber + 1.
[[nodiscard]] inline ControlEvents translateXYPad(const MidiMapping& mapping, double x, double y) noexcept {
    ControlEvents out;
    out.push(mapToControlChange(mapping, x));
    out.push(encodeCC(toDataByte(mapping.ccNumber) + 1, mapping.rangeMapping.map(y), mapping.midiChannel));
    return out;
}

/// @brief Events for a drum pad hit or release.
///
/// With a note number: press -> NoteOn(note, mapped velocity),
/// release -> NoteOff(note, 0). Without one the pad is a momentary CC:
/// press -> mapped velocity, release -> outputLow.
[[nodiscard]] inline ControlEvents translateDrumPad(
    const MidiMapping& mapping, bool pressed, double velocity) noexcept {
    ControlEvents out;
    if (mapping.noteNumber.has_value()) {
        const int note = *mapping.noteNumber;
        if (pressed) {
            out.push(encodeNoteOn(note, mapping.rangeMapping.map(velocity), mapping.midiChannel));
        } else {
            out.push(encodeNoteOff(note, 0, mapping.midiChannel));
        }
        return out;
    }

    const int ccValue = pressed ? mapping.rangeMapping.map(velocity) : mapping.rangeMapping.outputLow;
    out.push(encodeCC(mapping.ccNumber, ccValue, mapping.midiChannel));
    return out;
}

/// @brief Events for a knob, slider or toggle value change.
///
/// XY pads are treated as their X axis here (use translateXYPad for both).
/// Drum pads are treated as a press at the given velocity value.
[[nodiscard]] inline ControlEvents translateValue(
    ControlType type, const MidiMapping& mapping, double value) noexcept {
    ControlEvents out;
    switch (type) {
        case ControlType::Knob:
        case ControlType::Slider:
        case ControlType::XYPad:
            out.push(mapToControlChange(mapping, value));
            break;
        case ControlType::ToggleButton:
            out.push(mapToControlChange(mapping, toggleValue(value)));
            break;
        case ControlType::DrumPad:
            return translateDrumPad(mapping, true, value);
        case ControlType::Gyro:
            // Orientation input is not wired to MIDI
            break;
    }
    return out;
}

}  // namespace Cntrl::DSP
