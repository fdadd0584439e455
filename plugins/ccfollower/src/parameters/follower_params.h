#pragma once

// ==============================================================================
// CC Follower Parameters
// ==============================================================================
// Atomic parameter pack shared by the processor and the controller.
// ==============================================================================

#include "plugin_ids.h"
#include "controller/parameter_helpers.h"
#include "pluginterfaces/base/ustring.h"
#include "public.sdk/source/vst/vstparameters.h"
#include "public.sdk/source/vst/vsteditcontroller.h"
#include "base/source/fstreamer.h"

#include <cntrl/dsp/core/db_utils.h>
#include <cntrl/dsp/core/midi_utils.h>
#include <cntrl/dsp/primitives/amplitude_tap.h>
#include <cntrl/dsp/processors/cc_envelope_follower.h>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdio>

namespace CntrlFollower {

// =============================================================================
// FollowerParams: atomic parameter storage for real-time safety
// =============================================================================

struct FollowerParams {
    std::atomic<bool> enabled{true};        // pipeline running
    std::atomic<bool> active{true};         // CC emission while running
    std::atomic<float> threshold{0.1f};     // [0, 0.5]
    std::atomic<float> gain{1.0f};          // [0.1, 10]
    std::atomic<float> smoothing{0.8f};     // [0, 0.99]
    std::atomic<int> ccNumber{1};           // 0-127
    std::atomic<int> midiChannel{1};        // 1-16
    std::atomic<int> detectorMode{0};       // 0=RMS, 1=Peak
};

using Follower = Cntrl::DSP::CcEnvelopeFollower;

// =============================================================================
// Threshold mapping: normalized [0,1] <-> [0, 0.5] (linear)
// =============================================================================

inline float followerThresholdFromNormalized(double normalized) {
    return static_cast<float>(std::clamp(normalized, 0.0, 1.0)
                              * static_cast<double>(Follower::kMaxThreshold));
}

inline double followerThresholdToNormalized(float threshold) {
    return std::clamp(static_cast<double>(threshold) / static_cast<double>(Follower::kMaxThreshold),
                      0.0, 1.0);
}

// =============================================================================
// Gain mapping: normalized [0,1] <-> [0.1, 10] (logarithmic)
// gain = 0.1 * pow(100.0, normalized)
// Default 1.0: norm = log(1.0/0.1) / log(100) = 0.5
// =============================================================================

inline float followerGainFromNormalized(double normalized) {
    double clamped = std::clamp(normalized, 0.0, 1.0);
    return static_cast<float>(std::clamp(0.1 * std::pow(100.0, clamped), 0.1, 10.0));
}

inline double followerGainToNormalized(float gain) {
    double clampedGain = std::clamp(static_cast<double>(gain), 0.1, 10.0);
    return std::clamp(std::log(clampedGain / 0.1) / std::log(100.0), 0.0, 1.0);
}

// =============================================================================
// Smoothing mapping: normalized [0,1] <-> [0, 0.99] (linear)
// =============================================================================

inline float followerSmoothingFromNormalized(double normalized) {
    return static_cast<float>(std::clamp(normalized, 0.0, 1.0)
                              * static_cast<double>(Follower::kMaxSmoothing));
}

inline double followerSmoothingToNormalized(float smoothing) {
    return std::clamp(static_cast<double>(smoothing) / static_cast<double>(Follower::kMaxSmoothing),
                      0.0, 1.0);
}

// =============================================================================
// Discrete mappings
// =============================================================================

inline int followerCcNumberFromNormalized(double normalized) {
    return std::clamp(static_cast<int>(normalized * 127.0 + 0.5),
                      Cntrl::DSP::kMinMidiDataValue, Cntrl::DSP::kMaxMidiDataValue);
}

inline double followerCcNumberToNormalized(int ccNumber) {
    return static_cast<double>(std::clamp(ccNumber, 0, 127)) / 127.0;
}

inline int followerChannelFromNormalized(double normalized) {
    return std::clamp(static_cast<int>(normalized * 15.0 + 1.0 + 0.5),
                      Cntrl::DSP::kMinMidiChannel, Cntrl::DSP::kMaxMidiChannel);
}

inline double followerChannelToNormalized(int channel) {
    return static_cast<double>(std::clamp(channel, 1, 16) - 1) / 15.0;
}

inline Cntrl::DSP::AmplitudeMode followerDetectorMode(int index) {
    return (index == 1) ? Cntrl::DSP::AmplitudeMode::Peak : Cntrl::DSP::AmplitudeMode::RMS;
}

// =============================================================================
// Parameter change handler (processor side)
// =============================================================================

inline void handleFollowerParamChange(
    FollowerParams& params, Steinberg::Vst::ParamID id,
    Steinberg::Vst::ParamValue value) {
    switch (id) {
        case kEnabledId:
            params.enabled.store(value >= 0.5, std::memory_order_relaxed);
            break;
        case kActiveId:
            params.active.store(value >= 0.5, std::memory_order_relaxed);
            break;
        case kThresholdId:
            params.threshold.store(
                followerThresholdFromNormalized(value), std::memory_order_relaxed);
            break;
        case kGainId:
            params.gain.store(
                followerGainFromNormalized(value), std::memory_order_relaxed);
            break;
        case kSmoothingId:
            params.smoothing.store(
                followerSmoothingFromNormalized(value), std::memory_order_relaxed);
            break;
        case kCcNumberId:
            params.ccNumber.store(
                followerCcNumberFromNormalized(value), std::memory_order_relaxed);
            break;
        case kMidiChannelId:
            params.midiChannel.store(
                followerChannelFromNormalized(value), std::memory_order_relaxed);
            break;
        case kDetectorModeId:
            params.detectorMode.store(value >= 0.5 ? 1 : 0, std::memory_order_relaxed);
            break;
        default: break;
    }
}

// =============================================================================
// Parameter registration (controller side)
// =============================================================================

inline void registerFollowerParams(Steinberg::Vst::ParameterContainer& parameters) {
    using namespace Steinberg::Vst;

    parameters.addParameter(STR16("Enabled"), STR16(""), 1, 1.0,
        ParameterInfo::kCanAutomate, kEnabledId);
    parameters.addParameter(STR16("Send CC"), STR16(""), 1, 1.0,
        ParameterInfo::kCanAutomate, kActiveId);
    // Threshold: [0, 0.5], default 0.1 (norm 0.2)
    parameters.addParameter(STR16("Threshold"), STR16(""), 0, 0.2,
        ParameterInfo::kCanAutomate, kThresholdId);
    // Gain: log mapping [0.1, 10], default 1.0 (norm 0.5)
    parameters.addParameter(STR16("Gain"), STR16("x"), 0, 0.5,
        ParameterInfo::kCanAutomate, kGainId);
    // Smoothing: [0, 0.99], default 0.8
    parameters.addParameter(STR16("Smoothing"), STR16(""), 0,
        followerSmoothingToNormalized(Follower::kDefaultSmoothing),
        ParameterInfo::kCanAutomate, kSmoothingId);
    // CC Number: 0-127, default 1
    parameters.addParameter(STR16("CC Number"), STR16(""), 127,
        followerCcNumberToNormalized(Cntrl::DSP::kDefaultCcNumber),
        ParameterInfo::kCanAutomate, kCcNumberId);
    // MIDI Channel: 1-16, default 1 (index 0)
    parameters.addParameter(createIndexedDropdownParameter(
        STR16("MIDI Channel"), kMidiChannelId, 1, 16));
    parameters.addParameter(createDropdownParameter(
        STR16("Detector"), kDetectorModeId,
        {STR16("RMS"), STR16("Peak")}
    ));
}

/// Read-only meters written by the processor through outputParameterChanges
inline void registerFollowerMeters(Steinberg::Vst::ParameterContainer& parameters) {
    using namespace Steinberg::Vst;

    parameters.addParameter(STR16("CC Value"), nullptr, 127, 0.0,
        ParameterInfo::kIsReadOnly, kCcValueMeterId);
    parameters.addParameter(STR16("Amplitude"), STR16("dB"), 0, 0.0,
        ParameterInfo::kIsReadOnly, kAmplitudeMeterId);
}

// =============================================================================
// Display formatting
// =============================================================================

inline Steinberg::tresult formatFollowerParam(
    Steinberg::Vst::ParamID id, Steinberg::Vst::ParamValue value,
    Steinberg::Vst::String128 string) {
    using namespace Steinberg;
    char8 text[32];
    switch (id) {
        case kThresholdId:
            snprintf(text, sizeof(text), "%.3f",
                     static_cast<double>(followerThresholdFromNormalized(value)));
            UString(string, 128).fromAscii(text);
            return kResultOk;
        case kGainId: {
            float gain = followerGainFromNormalized(value);
            snprintf(text, sizeof(text), "%.2fx", static_cast<double>(gain));
            UString(string, 128).fromAscii(text);
            return kResultOk;
        }
        case kSmoothingId:
            snprintf(text, sizeof(text), "%.2f",
                     static_cast<double>(followerSmoothingFromNormalized(value)));
            UString(string, 128).fromAscii(text);
            return kResultOk;
        case kCcNumberId:
            snprintf(text, sizeof(text), "CC %d", followerCcNumberFromNormalized(value));
            UString(string, 128).fromAscii(text);
            return kResultOk;
        case kCcValueMeterId:
            snprintf(text, sizeof(text), "%d",
                     static_cast<int>(std::clamp(value, 0.0, 1.0) * 127.0 + 0.5));
            UString(string, 128).fromAscii(text);
            return kResultOk;
        case kAmplitudeMeterId: {
            float dB = Cntrl::DSP::gainToDb(static_cast<float>(value));
            if (dB <= Cntrl::DSP::kSilenceFloorDb) {
                snprintf(text, sizeof(text), "-inf dB");
            } else {
                snprintf(text, sizeof(text), "%.1f dB", static_cast<double>(dB));
            }
            UString(string, 128).fromAscii(text);
            return kResultOk;
        }
        // Enabled/Active use the default on/off display, lists format themselves
        default:
            return kResultFalse;
    }
}

// =============================================================================
// State persistence
// =============================================================================

inline void saveFollowerParams(const FollowerParams& params,
                               Steinberg::IBStreamer& streamer) {
    streamer.writeInt32(params.enabled.load(std::memory_order_relaxed) ? 1 : 0);
    streamer.writeInt32(params.active.load(std::memory_order_relaxed) ? 1 : 0);
    streamer.writeFloat(params.threshold.load(std::memory_order_relaxed));
    streamer.writeFloat(params.gain.load(std::memory_order_relaxed));
    streamer.writeFloat(params.smoothing.load(std::memory_order_relaxed));
    streamer.writeInt32(params.ccNumber.load(std::memory_order_relaxed));
    streamer.writeInt32(params.midiChannel.load(std::memory_order_relaxed));
    streamer.writeInt32(params.detectorMode.load(std::memory_order_relaxed));
}

inline bool loadFollowerParams(FollowerParams& params,
                               Steinberg::IBStreamer& streamer) {
    Steinberg::int32 iv = 0;
    float fv = 0.0f;

    if (!streamer.readInt32(iv)) { return false; }
    params.enabled.store(iv != 0, std::memory_order_relaxed);

    if (!streamer.readInt32(iv)) { return false; }
    params.active.store(iv != 0, std::memory_order_relaxed);

    if (!streamer.readFloat(fv)) { return false; }
    params.threshold.store(std::clamp(fv, Follower::kMinThreshold, Follower::kMaxThreshold),
                           std::memory_order_relaxed);

    if (!streamer.readFloat(fv)) { return false; }
    params.gain.store(std::clamp(fv, Follower::kMinGain, Follower::kMaxGain),
                      std::memory_order_relaxed);

    if (!streamer.readFloat(fv)) { return false; }
    params.smoothing.store(std::clamp(fv, Follower::kMinSmoothing, Follower::kMaxSmoothing),
                           std::memory_order_relaxed);

    if (!streamer.readInt32(iv)) { return false; }
    params.ccNumber.store(std::clamp(iv, 0, 127), std::memory_order_relaxed);

    if (!streamer.readInt32(iv)) { return false; }
    params.midiChannel.store(std::clamp(iv, 1, 16), std::memory_order_relaxed);

    if (!streamer.readInt32(iv)) { return false; }
    params.detectorMode.store(iv == 1 ? 1 : 0, std::memory_order_relaxed);

    return true;
}

template<typename SetParamFunc>
inline void loadFollowerParamsToController(
    Steinberg::IBStreamer& streamer, SetParamFunc setParam) {
    Steinberg::int32 iv = 0;
    float fv = 0.0f;

    if (streamer.readInt32(iv))
        setParam(kEnabledId, iv != 0 ? 1.0 : 0.0);
    if (streamer.readInt32(iv))
        setParam(kActiveId, iv != 0 ? 1.0 : 0.0);
    if (streamer.readFloat(fv))
        setParam(kThresholdId, followerThresholdToNormalized(fv));
    if (streamer.readFloat(fv))
        setParam(kGainId, followerGainToNormalized(fv));
    if (streamer.readFloat(fv))
        setParam(kSmoothingId, followerSmoothingToNormalized(fv));
    if (streamer.readInt32(iv))
        setParam(kCcNumberId, followerCcNumberToNormalized(iv));
    if (streamer.readInt32(iv))
        setParam(kMidiChannelId, followerChannelToNormalized(iv));
    if (streamer.readInt32(iv))
        setParam(kDetectorModeId, iv == 1 ? 1.0 : 0.0);
}

} // namespace CntrlFollower
