// ==============================================================================
// Layer 0: Core Utilities
// midi_utils.h - MIDI 1.0 wire constants and 7-bit / 4-bit masking
// ==============================================================================
// Real-time safe: no allocation, no locks, no exceptions, no I/O.
// Layer 0: no dependencies on higher layers.
//
// Masking policy: values headed for the wire are masked, never rejected.
// A controller surface must keep running on a bad value, so 200 becomes
// 200 & 0x7F = 72 rather than an error.
// ==============================================================================

#pragma once

#include <cstdint>

namespace Cntrl::DSP {

// ==============================================================================
// Constants
// ==============================================================================

/// Mask for a 7-bit MIDI data byte (note, velocity, CC number, CC value)
inline constexpr uint8_t kMidiDataMask = 0x7F;

/// Mask for the 4-bit channel nibble of a status byte
inline constexpr uint8_t kMidiChannelMask = 0x0F;

/// Mask for the message-type nibble of a status byte
inline constexpr uint8_t kMidiStatusTypeMask = 0xF0;

/// Status byte types (channel nibble cleared)
inline constexpr uint8_t kMidiNoteOffStatus = 0x80;
inline constexpr uint8_t kMidiNoteOnStatus = 0x90;
inline constexpr uint8_t kMidiControlChangeStatus = 0xB0;

/// System Exclusive framing bytes
inline constexpr uint8_t kMidiSysExStart = 0xF0;
inline constexpr uint8_t kMidiSysExEnd = 0xF7;

/// Size of a channel voice message on the wire (status + 2 data bytes)
inline constexpr int kMidiChannelMessageSize = 3;

/// Minimum / maximum 7-bit data value
inline constexpr int kMinMidiDataValue = 0;
inline constexpr int kMaxMidiDataValue = 127;

/// Channels are 1-indexed in the domain model (1-16)
inline constexpr int kMinMidiChannel = 1;
inline constexpr int kMaxMidiChannel = 16;

/// Defaults for a freshly created control binding
inline constexpr int kDefaultCcNumber = 1;
inline constexpr int kDefaultMidiChannel = 1;

// ==============================================================================
// Functions
// ==============================================================================

/// Mask an integer to a 7-bit MIDI data byte.
///
/// @example toDataByte(64)  -> 64
/// @example toDataByte(200) -> 72
/// @example toDataByte(300) -> 44
[[nodiscard]] constexpr uint8_t toDataByte(int value) noexcept {
    return static_cast<uint8_t>(static_cast<unsigned>(value) & kMidiDataMask);
}

/// Convert a 1-indexed domain channel (1-16) to the wire nibble (0-15).
///
/// The subtraction happens before masking, so channel 17 wraps to 0 and
/// channel 0 wraps to 15.
///
/// @example toChannelNibble(1)  -> 0
/// @example toChannelNibble(16) -> 15
/// @example toChannelNibble(17) -> 0
[[nodiscard]] constexpr uint8_t toChannelNibble(int channel1Indexed) noexcept {
    return static_cast<uint8_t>(static_cast<unsigned>(channel1Indexed - 1) & kMidiChannelMask);
}

/// Extract the channel nibble (0-15) from a status byte.
[[nodiscard]] constexpr uint8_t statusChannel(uint8_t status) noexcept {
    return static_cast<uint8_t>(status & kMidiChannelMask);
}

/// Extract the message-type nibble from a status byte.
[[nodiscard]] constexpr uint8_t statusType(uint8_t status) noexcept {
    return static_cast<uint8_t>(status & kMidiStatusTypeMask);
}

/// Build a channel voice status byte from a type nibble and a 0-15 channel.
[[nodiscard]] constexpr uint8_t makeStatus(uint8_t type, uint8_t channel) noexcept {
    return static_cast<uint8_t>((type & kMidiStatusTypeMask) | (channel & kMidiChannelMask));
}

/// Clamp an integer into the 7-bit data range without wrapping.
///
/// Used where overdrive must saturate (quantised controller values),
/// as opposed to toDataByte() which wraps.
[[nodiscard]] constexpr int clampToDataRange(int value) noexcept {
    return (value < kMinMidiDataValue) ? kMinMidiDataValue
         : (value > kMaxMidiDataValue) ? kMaxMidiDataValue
         : value;
}

}  // namespace Cntrl::DSP
