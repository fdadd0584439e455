// ==============================================================================
// MIDI Utilities - Unit Tests
// ==============================================================================
// Layer 0: Core Utilities
// Tests for: dsp/include/cntrl/dsp/core/midi_utils.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>

#include <cntrl/dsp/core/midi_utils.h>

using namespace Cntrl::DSP;

// ==============================================================================
// toDataByte
// ==============================================================================

TEST_CASE("toDataByte masks to 7 bits", "[dsp][core][midi_utils][toDataByte]") {
    SECTION("in-range values pass through") {
        REQUIRE(toDataByte(0) == 0);
        REQUIRE(toDataByte(64) == 64);
        REQUIRE(toDataByte(127) == 127);
    }

    SECTION("out-of-range values wrap") {
        REQUIRE(toDataByte(128) == 0);
        REQUIRE(toDataByte(200) == 72);
        REQUIRE(toDataByte(300) == 44);
    }

    SECTION("negative values wrap through two's complement") {
        REQUIRE(toDataByte(-1) == 127);
        REQUIRE(toDataByte(-128) == 0);
    }

    static_assert(toDataByte(255) == 127);
}

// ==============================================================================
// toChannelNibble
// ==============================================================================

TEST_CASE("toChannelNibble converts 1-indexed channels to wire nibbles",
          "[dsp][core][midi_utils][toChannelNibble]") {
    REQUIRE(toChannelNibble(1) == 0);
    REQUIRE(toChannelNibble(10) == 9);
    REQUIRE(toChannelNibble(16) == 15);

    SECTION("out-of-range channels wrap after the subtraction") {
        REQUIRE(toChannelNibble(17) == 0);
        REQUIRE(toChannelNibble(0) == 15);
        REQUIRE(toChannelNibble(33) == 0);
    }
}

// ==============================================================================
// Status byte helpers
// ==============================================================================

TEST_CASE("status byte helpers split and join type and channel",
          "[dsp][core][midi_utils][status]") {
    REQUIRE(statusType(0xB7) == kMidiControlChangeStatus);
    REQUIRE(statusChannel(0xB7) == 7);
    REQUIRE(statusType(0x9F) == kMidiNoteOnStatus);
    REQUIRE(statusChannel(0x80) == 0);

    REQUIRE(makeStatus(kMidiNoteOffStatus, 3) == 0x83);
    REQUIRE(makeStatus(kMidiControlChangeStatus, 0x1F) == 0xBF);  // channel masked
    REQUIRE(makeStatus(0x9A, 2) == 0x92);                         // type masked
}

// ==============================================================================
// clampToDataRange
// ==============================================================================

TEST_CASE("clampToDataRange saturates instead of wrapping",
          "[dsp][core][midi_utils][clampToDataRange]") {
    REQUIRE(clampToDataRange(-5) == 0);
    REQUIRE(clampToDataRange(0) == 0);
    REQUIRE(clampToDataRange(100) == 100);
    REQUIRE(clampToDataRange(127) == 127);
    REQUIRE(clampToDataRange(128) == 127);
    REQUIRE(clampToDataRange(10000) == 127);
}
