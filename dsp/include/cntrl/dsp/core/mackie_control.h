// ==============================================================================
// Layer 0: Core Utilities
// mackie_control.h - Mackie Control transport button messages
// ==============================================================================
// Mackie Control surfaces send each transport button as a Note On on a fixed
// note number (velocity 127) followed by a Note Off (velocity 0) when the
// button is released. Always on wire channel 0.
// ==============================================================================

#pragma once

#include <cntrl/dsp/core/midi_utils.h>

#include <array>
#include <cstdint>
#include <string_view>

namespace Cntrl::DSP {

// =============================================================================
// Constants
// =============================================================================

/// Delay between the press and release messages of a momentary button
inline constexpr int kMackieReleaseDelayMs = 100;

/// Velocity sent with a button press
inline constexpr uint8_t kMackiePressVelocity = 0x7F;

// =============================================================================
// MackieCommand Enumeration
// =============================================================================

/// @brief Transport commands and their Mackie Control note numbers.
enum class MackieCommand : uint8_t {
    Rewind = 0x5B,
    FastForward = 0x5C,
    Stop = 0x5D,
    Play = 0x5E,
    Record = 0x5F,
    CursorUp = 0x60,
    CursorDown = 0x61,
    CursorLeft = 0x62,
    CursorRight = 0x63,
    Zoom = 0x64,
    Scrub = 0x65,
    Loop = 0x66,
    Click = 0x67
};

/// Every transport command, in note-number order
inline constexpr std::array<MackieCommand, 13> kAllMackieCommands = {
    MackieCommand::Rewind,     MackieCommand::FastForward, MackieCommand::Stop,
    MackieCommand::Play,       MackieCommand::Record,      MackieCommand::CursorUp,
    MackieCommand::CursorDown, MackieCommand::CursorLeft,  MackieCommand::CursorRight,
    MackieCommand::Zoom,       MackieCommand::Scrub,       MackieCommand::Loop,
    MackieCommand::Click
};

using MackieMessage = std::array<uint8_t, kMidiChannelMessageSize>;

// =============================================================================
// Functions
// =============================================================================

/// @return Note On triple sent when the button goes down
[[nodiscard]] constexpr MackieMessage mackiePressBytes(MackieCommand command) noexcept {
    return {kMidiNoteOnStatus, static_cast<uint8_t>(command), kMackiePressVelocity};
}

/// @return Note Off triple sent when the button is released
[[nodiscard]] constexpr MackieMessage mackieReleaseBytes(MackieCommand command) noexcept {
    return {kMidiNoteOffStatus, static_cast<uint8_t>(command), 0x00};
}

/// Short upper-case label for a transport button.
[[nodiscard]] constexpr std::string_view mackieCommandName(MackieCommand command) noexcept {
    switch (command) {
        case MackieCommand::Rewind:      return "REW";
        case MackieCommand::FastForward: return "FF";
        case MackieCommand::Stop:        return "STOP";
        case MackieCommand::Play:        return "PLAY";
        case MackieCommand::Record:      return "REC";
        case MackieCommand::CursorUp:    return "UP";
        case MackieCommand::CursorDown:  return "DOWN";
        case MackieCommand::CursorLeft:  return "LEFT";
        case MackieCommand::CursorRight: return "RIGHT";
        case MackieCommand::Zoom:        return "ZOOM";
        case MackieCommand::Scrub:       return "SCRUB";
        case MackieCommand::Loop:        return "LOOP";
        case MackieCommand::Click:       return "CLICK";
    }
    return "";
}

}  // namespace Cntrl::DSP
