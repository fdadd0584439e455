#pragma once

// ==============================================================================
// Plugin Identifiers
// ==============================================================================
// These GUIDs uniquely identify the plugin components.
//
// IMPORTANT: Once published, NEVER change these IDs or hosts will not
// recognize saved projects using your plugin.
// ==============================================================================

#include "pluginterfaces/base/funknown.h"
#include "pluginterfaces/vst/vsttypes.h"

namespace CntrlFollower {

// Processor Component ID
// The audio processing component (runs on audio thread)
static const Steinberg::FUID kProcessorUID(0x6C1E2F4B, 0x93A04D8E, 0xB7C25F10, 0x4E8D3A27);

// Controller Component ID
// The edit controller component (runs on UI thread)
static const Steinberg::FUID kControllerUID(0x2A7D4E91, 0x5F3B4C60, 0x8E19D7A2, 0xC04B6F35);

// ==============================================================================
// Parameter IDs
// ==============================================================================
// All parameter values are normalized (0.0 to 1.0) at the host boundary.
//
// ID Range Allocation:
//   0-99:    Follower (Enabled, Active, Threshold, Gain, Smoothing, CC, Channel, Detector)
//   100-199: Meters (read-only output parameters written by the processor)
// ==============================================================================

enum ParameterIDs : Steinberg::Vst::ParamID {
    // ==========================================================================
    // Follower Parameters (0-99)
    // ==========================================================================
    kFollowerBaseId = 0,
    kEnabledId = 0,            // on/off: pipeline running
    kActiveId = 1,             // on/off: CC emission while running
    kThresholdId = 2,          // 0-0.5
    kGainId = 3,               // 0.1-10 (logarithmic)
    kSmoothingId = 4,          // 0-0.99
    kCcNumberId = 5,           // 0-127
    kMidiChannelId = 6,        // 1-16
    kDetectorModeId = 7,       // 0=RMS, 1=Peak
    kFollowerEndId = 99,

    // ==========================================================================
    // Meters (100-199)
    // ==========================================================================
    kMeterBaseId = 100,
    kCcValueMeterId = 100,     // last CC value / 127
    kAmplitudeMeterId = 101,   // smoothed amplitude, clamped to [0, 1]
    kMeterEndId = 199
};

// ==============================================================================
// Plugin Metadata
// ==============================================================================

// Effect with an event output bus
constexpr const char* kSubCategories = "Fx|Analyzer";

} // namespace CntrlFollower
