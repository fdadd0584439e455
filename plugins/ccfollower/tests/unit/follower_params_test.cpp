// ==============================================================================
// Unit Test: Follower Parameter Pack
// ==============================================================================
// Verifies normalized <-> plain mappings, atomic updates from host changes,
// display strings and the binary save/load format.
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "parameters/follower_params.h"
#include "plugin_ids.h"

#include "public.sdk/source/common/memorystream.h"
#include "base/source/fstreamer.h"

#include <map>
#include <string>

using Catch::Approx;
using namespace CntrlFollower;

static std::string toAscii(const Steinberg::Vst::String128 str) {
    std::string result;
    for (int i = 0; i < 128 && str[i] != 0; ++i) {
        result += static_cast<char>(str[i]);
    }
    return result;
}

static std::string format(Steinberg::Vst::ParamID id, double value) {
    Steinberg::Vst::String128 str{};
    REQUIRE(formatFollowerParam(id, value, str) == Steinberg::kResultOk);
    return toAscii(str);
}

// =============================================================================
// Mappings
// =============================================================================

TEST_CASE("Follower mappings cover the engine ranges", "[params][follower]") {
    SECTION("threshold is linear over [0, 0.5]") {
        REQUIRE(followerThresholdFromNormalized(0.0) == 0.0f);
        REQUIRE(followerThresholdFromNormalized(1.0) == Approx(0.5f));
        REQUIRE(followerThresholdFromNormalized(0.2) == Approx(0.1f));
        REQUIRE(followerThresholdToNormalized(0.1f) == Approx(0.2));
    }

    SECTION("gain is logarithmic over [0.1, 10] with unity at the centre") {
        REQUIRE(followerGainFromNormalized(0.0) == Approx(0.1f));
        REQUIRE(followerGainFromNormalized(0.5) == Approx(1.0f));
        REQUIRE(followerGainFromNormalized(1.0) == Approx(10.0f));
        REQUIRE(followerGainToNormalized(1.0f) == Approx(0.5).margin(1e-6));
    }

    SECTION("smoothing tops out at 0.99") {
        REQUIRE(followerSmoothingFromNormalized(1.0) == Approx(0.99f));
        REQUIRE(followerSmoothingFromNormalized(0.0) == 0.0f);
        REQUIRE(followerSmoothingToNormalized(0.99f) == Approx(1.0));
    }

    SECTION("controller number and channel round to the nearest step") {
        REQUIRE(followerCcNumberFromNormalized(0.0) == 0);
        REQUIRE(followerCcNumberFromNormalized(1.0) == 127);
        REQUIRE(followerCcNumberFromNormalized(followerCcNumberToNormalized(74)) == 74);

        REQUIRE(followerChannelFromNormalized(0.0) == 1);
        REQUIRE(followerChannelFromNormalized(1.0) == 16);
        REQUIRE(followerChannelFromNormalized(followerChannelToNormalized(10)) == 10);
    }

    SECTION("detector index selects the tap mode") {
        REQUIRE(followerDetectorMode(0) == Cntrl::DSP::AmplitudeMode::RMS);
        REQUIRE(followerDetectorMode(1) == Cntrl::DSP::AmplitudeMode::Peak);
    }
}

// =============================================================================
// Host changes
// =============================================================================

TEST_CASE("handleFollowerParamChange stores plain values", "[params][follower]") {
    FollowerParams params;

    handleFollowerParamChange(params, kEnabledId, 0.0);
    handleFollowerParamChange(params, kActiveId, 0.0);
    handleFollowerParamChange(params, kThresholdId, 1.0);
    handleFollowerParamChange(params, kGainId, 1.0);
    handleFollowerParamChange(params, kSmoothingId, 0.0);
    handleFollowerParamChange(params, kCcNumberId, followerCcNumberToNormalized(11));
    handleFollowerParamChange(params, kMidiChannelId, followerChannelToNormalized(16));
    handleFollowerParamChange(params, kDetectorModeId, 1.0);

    REQUIRE_FALSE(params.enabled.load());
    REQUIRE_FALSE(params.active.load());
    REQUIRE(params.threshold.load() == Approx(0.5f));
    REQUIRE(params.gain.load() == Approx(10.0f));
    REQUIRE(params.smoothing.load() == 0.0f);
    REQUIRE(params.ccNumber.load() == 11);
    REQUIRE(params.midiChannel.load() == 16);
    REQUIRE(params.detectorMode.load() == 1);
}

TEST_CASE("handleFollowerParamChange ignores meter IDs", "[params][follower]") {
    FollowerParams params;
    handleFollowerParamChange(params, kCcValueMeterId, 1.0);
    handleFollowerParamChange(params, kAmplitudeMeterId, 1.0);

    REQUIRE(params.ccNumber.load() == 1);
    REQUIRE(params.threshold.load() == Approx(0.1f));
}

// =============================================================================
// Display
// =============================================================================

TEST_CASE("formatFollowerParam produces readable strings", "[params][follower][display]") {
    REQUIRE(format(kThresholdId, 0.2) == "0.100");
    REQUIRE(format(kGainId, 0.5) == "1.00x");
    REQUIRE(format(kCcNumberId, followerCcNumberToNormalized(74)) == "CC 74");
    REQUIRE(format(kCcValueMeterId, 64.0 / 127.0) == "64");
    REQUIRE(format(kAmplitudeMeterId, 1.0) == "0.0 dB");
    REQUIRE(format(kAmplitudeMeterId, 0.0) == "-inf dB");
}

TEST_CASE("formatFollowerParam leaves toggles and lists to the host", "[params][follower][display]") {
    Steinberg::Vst::String128 str{};
    REQUIRE(formatFollowerParam(kEnabledId, 1.0, str) == Steinberg::kResultFalse);
    REQUIRE(formatFollowerParam(kMidiChannelId, 0.0, str) == Steinberg::kResultFalse);
}

// =============================================================================
// Persistence
// =============================================================================

TEST_CASE("Follower params save and load", "[params][follower][state]") {
    FollowerParams original;
    original.enabled.store(false);
    original.active.store(false);
    original.threshold.store(0.25f);
    original.gain.store(3.0f);
    original.smoothing.store(0.5f);
    original.ccNumber.store(74);
    original.midiChannel.store(10);
    original.detectorMode.store(1);

    auto* stream = new Steinberg::MemoryStream();
    {
        Steinberg::IBStreamer writer(stream, kLittleEndian);
        saveFollowerParams(original, writer);
    }
    stream->seek(0, Steinberg::IBStream::kIBSeekSet, nullptr);

    SECTION("into the processor pack") {
        FollowerParams loaded;
        Steinberg::IBStreamer reader(stream, kLittleEndian);
        REQUIRE(loadFollowerParams(loaded, reader));

        REQUIRE_FALSE(loaded.enabled.load());
        REQUIRE_FALSE(loaded.active.load());
        REQUIRE(loaded.threshold.load() == Approx(0.25f));
        REQUIRE(loaded.gain.load() == Approx(3.0f));
        REQUIRE(loaded.smoothing.load() == Approx(0.5f));
        REQUIRE(loaded.ccNumber.load() == 74);
        REQUIRE(loaded.midiChannel.load() == 10);
        REQUIRE(loaded.detectorMode.load() == 1);
    }

    SECTION("into controller normalized values") {
        std::map<Steinberg::Vst::ParamID, double> values;
        Steinberg::IBStreamer reader(stream, kLittleEndian);
        loadFollowerParamsToController(reader,
            [&values](Steinberg::Vst::ParamID id, double value) { values[id] = value; });

        REQUIRE(values.size() == 8);
        REQUIRE(values[kEnabledId] == 0.0);
        REQUIRE(values[kThresholdId] == Approx(0.5));
        REQUIRE(followerCcNumberFromNormalized(values[kCcNumberId]) == 74);
        REQUIRE(followerChannelFromNormalized(values[kMidiChannelId]) == 10);
        REQUIRE(values[kDetectorModeId] == 1.0);
    }

    stream->release();
}

TEST_CASE("loadFollowerParams clamps out-of-range values", "[params][follower][state]") {
    auto* stream = new Steinberg::MemoryStream();
    {
        Steinberg::IBStreamer writer(stream, kLittleEndian);
        writer.writeInt32(1);
        writer.writeInt32(1);
        writer.writeFloat(5.0f);    // threshold
        writer.writeFloat(100.0f);  // gain
        writer.writeFloat(2.0f);    // smoothing
        writer.writeInt32(300);     // cc number
        writer.writeInt32(0);       // channel
        writer.writeInt32(7);       // detector
    }
    stream->seek(0, Steinberg::IBStream::kIBSeekSet, nullptr);

    FollowerParams loaded;
    Steinberg::IBStreamer reader(stream, kLittleEndian);
    REQUIRE(loadFollowerParams(loaded, reader));

    REQUIRE(loaded.threshold.load() == Approx(0.5f));
    REQUIRE(loaded.gain.load() == Approx(10.0f));
    REQUIRE(loaded.smoothing.load() == Approx(0.99f));
    REQUIRE(loaded.ccNumber.load() == 127);
    REQUIRE(loaded.midiChannel.load() == 1);
    REQUIRE(loaded.detectorMode.load() == 0);

    stream->release();
}

TEST_CASE("loadFollowerParams on a truncated stream keeps defaults", "[params][follower][state]") {
    auto* stream = new Steinberg::MemoryStream();
    {
        Steinberg::IBStreamer writer(stream, kLittleEndian);
        writer.writeInt32(0);  // enabled only
    }
    stream->seek(0, Steinberg::IBStream::kIBSeekSet, nullptr);

    FollowerParams loaded;
    Steinberg::IBStreamer reader(stream, kLittleEndian);
    REQUIRE_FALSE(loadFollowerParams(loaded, reader));

    REQUIRE_FALSE(loaded.enabled.load());
    REQUIRE(loaded.active.load());
    REQUIRE(loaded.ccNumber.load() == 1);

    stream->release();
}
