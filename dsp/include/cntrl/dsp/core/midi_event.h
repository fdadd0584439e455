// ==============================================================================
// Layer 0: Core Utilities
// midi_event.h - MIDI 1.0 event value type, encoder and raw-byte decoder
// ==============================================================================
// Real-time safe: no allocation, no locks, no exceptions, no I/O.
// Layer 0: depends only on midi_utils.h.
//
// Events are transient values: produced on demand and handed to a transport,
// never stored. A SysEx event does not own its payload; it views the buffer
// it was decoded from and is only valid while that buffer is alive.
// ==============================================================================

#pragma once

#include <cntrl/dsp/core/midi_utils.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace Cntrl::DSP {

// =============================================================================
// Data Types
// =============================================================================

/// @brief MIDI message kinds produced and understood by the engine.
enum class MidiEventType : uint8_t {
    NoteOn = 0,
    NoteOff = 1,
    ControlChange = 2,
    SystemExclusive = 3
};

/// @brief Outcome of classifying a raw MIDI byte buffer.
enum class MidiDecodeStatus : uint8_t {
    Ok = 0,           ///< Buffer decodes to an event
    TooShort = 1,     ///< Fewer bytes than a channel voice message needs
    Unsupported = 2   ///< Status byte is not NoteOn/NoteOff/CC/SysEx start
};

/// @brief A single MIDI event.
///
/// Channel voice messages use channel/data1/data2:
/// - NoteOn / NoteOff: data1 = note, data2 = velocity
/// - ControlChange:    data1 = controller number, data2 = value
///
/// SystemExclusive uses sysex only (the complete F0 ... F7 buffer).
struct MidiEvent {
    MidiEventType type{MidiEventType::ControlChange};
    uint8_t channel{0};   ///< Wire channel, 0-15
    uint8_t data1{0};     ///< 7-bit
    uint8_t data2{0};     ///< 7-bit
    std::span<const uint8_t> sysex{};

    [[nodiscard]] constexpr bool isChannelMessage() const noexcept {
        return type != MidiEventType::SystemExclusive;
    }

    [[nodiscard]] constexpr uint8_t controller() const noexcept { return data1; }
    [[nodiscard]] constexpr uint8_t value() const noexcept { return data2; }
    [[nodiscard]] constexpr uint8_t note() const noexcept { return data1; }
    [[nodiscard]] constexpr uint8_t velocity() const noexcept { return data2; }

    /// Status byte this event is sent with (0xF0 for SysEx)
    [[nodiscard]] constexpr uint8_t statusByte() const noexcept {
        switch (type) {
            case MidiEventType::NoteOn:
                return makeStatus(kMidiNoteOnStatus, channel);
            case MidiEventType::NoteOff:
                return makeStatus(kMidiNoteOffStatus, channel);
            case MidiEventType::ControlChange:
                return makeStatus(kMidiControlChangeStatus, channel);
            case MidiEventType::SystemExclusive:
                return kMidiSysExStart;
        }
        return kMidiSysExStart;
    }
};

// =============================================================================
// Encoding
// =============================================================================

/// Build a channel voice event from wire-ready fields, masking each one.
[[nodiscard]] constexpr MidiEvent makeChannelEvent(
    MidiEventType type, uint8_t channel, uint8_t data1, uint8_t data2) noexcept {
    MidiEvent event;
    event.type = type;
    event.channel = static_cast<uint8_t>(channel & kMidiChannelMask);
    event.data1 = static_cast<uint8_t>(data1 & kMidiDataMask);
    event.data2 = static_cast<uint8_t>(data2 & kMidiDataMask);
    return event;
}

/// Encode a Control Change from domain values.
///
/// Inputs are masked, never rejected: ccNumber & 0x7F, value & 0x7F,
/// (channel1Indexed - 1) & 0x0F.
///
/// @example encodeCC(200, 300, 17) -> CC 72, value 44, channel 0
[[nodiscard]] constexpr MidiEvent encodeCC(int ccNumber, int value, int channel1Indexed) noexcept {
    return makeChannelEvent(MidiEventType::ControlChange,
                            toChannelNibble(channel1Indexed),
                            toDataByte(ccNumber),
                            toDataByte(value));
}

/// Encode a Note On from domain values (same masking policy as encodeCC).
[[nodiscard]] constexpr MidiEvent encodeNoteOn(int note, int velocity, int channel1Indexed) noexcept {
    return makeChannelEvent(MidiEventType::NoteOn,
                            toChannelNibble(channel1Indexed),
                            toDataByte(note),
                            toDataByte(velocity));
}

/// Encode a Note Off from domain values (same masking policy as encodeCC).
[[nodiscard]] constexpr MidiEvent encodeNoteOff(int note, int velocity, int channel1Indexed) noexcept {
    return makeChannelEvent(MidiEventType::NoteOff,
                            toChannelNibble(channel1Indexed),
                            toDataByte(note),
                            toDataByte(velocity));
}

/// Write the wire form of an event.
///
/// @param event Event to serialise
/// @param out   Destination buffer
/// @return Bytes written: 3 for channel voice messages, the payload size for
///         SysEx, 0 if out is too small
[[nodiscard]] inline size_t toRawBytes(const MidiEvent& event, std::span<uint8_t> out) noexcept {
    if (event.type == MidiEventType::SystemExclusive) {
        if (out.size() < event.sysex.size()) {
            return 0;
        }
        std::copy(event.sysex.begin(), event.sysex.end(), out.begin());
        return event.sysex.size();
    }

    if (out.size() < static_cast<size_t>(kMidiChannelMessageSize)) {
        return 0;
    }
    out[0] = event.statusByte();
    out[1] = event.data1;
    out[2] = event.data2;
    return static_cast<size_t>(kMidiChannelMessageSize);
}

// =============================================================================
// Decoding
// =============================================================================

/// Classify a raw byte buffer without decoding it.
///
/// Used by transport boundaries to report why a buffer produced no event.
[[nodiscard]] constexpr MidiDecodeStatus classifyRawMidi(std::span<const uint8_t> bytes) noexcept {
    if (bytes.size() < static_cast<size_t>(kMidiChannelMessageSize)) {
        return MidiDecodeStatus::TooShort;
    }

    const uint8_t status = bytes[0];
    switch (statusType(status)) {
        case kMidiNoteOnStatus:
        case kMidiNoteOffStatus:
        case kMidiControlChangeStatus:
            return MidiDecodeStatus::Ok;
        default:
            break;
    }

    // System messages: only the exact SysEx start byte is understood
    return (status == kMidiSysExStart) ? MidiDecodeStatus::Ok : MidiDecodeStatus::Unsupported;
}

/// Decode a raw MIDI buffer (Mackie Control style byte triples or SysEx).
///
/// - 0x9n -> NoteOn(data1 & 0x7F, data2 & 0x7F, n)
/// - 0x8n -> NoteOff
/// - 0xBn -> ControlChange
/// - 0xF0 -> SystemExclusive viewing the whole buffer (framing is the
///   transport's concern)
///
/// Buffers shorter than 3 bytes and any other status produce no event.
/// Never throws.
[[nodiscard]] constexpr std::optional<MidiEvent> decodeRawMidi(std::span<const uint8_t> bytes) noexcept {
    if (classifyRawMidi(bytes) != MidiDecodeStatus::Ok) {
        return std::nullopt;
    }

    const uint8_t status = bytes[0];
    if (status == kMidiSysExStart) {
        MidiEvent event;
        event.type = MidiEventType::SystemExclusive;
        event.sysex = bytes;
        return event;
    }

    MidiEventType type = MidiEventType::ControlChange;
    switch (statusType(status)) {
        case kMidiNoteOnStatus:  type = MidiEventType::NoteOn; break;
        case kMidiNoteOffStatus: type = MidiEventType::NoteOff; break;
        default:                 type = MidiEventType::ControlChange; break;
    }
    return makeChannelEvent(type, statusChannel(status), bytes[1], bytes[2]);
}

}  // namespace Cntrl::DSP
