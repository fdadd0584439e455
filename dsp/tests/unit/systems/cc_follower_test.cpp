// ==============================================================================
// CC Follower Pipeline - Unit Tests
// ==============================================================================
// Layer 3: System
// Tests for: dsp/include/cntrl/dsp/systems/cc_follower.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <cntrl/dsp/systems/cc_follower.h>

#include <vector>

using namespace Cntrl::DSP;
using Catch::Approx;

namespace {

/// Records every event it is handed
class RecordingOutput : public MidiOutput {
public:
    RecordingOutput() { events.reserve(256); }

    void send(const MidiEvent& event) noexcept override { events.push_back(event); }

    std::vector<MidiEvent> events;
};

} // namespace

// ==============================================================================
// Run state
// ==============================================================================

TEST_CASE("CcFollower starts stopped", "[dsp][systems][cc_follower][state]") {
    CcFollower follower;
    REQUIRE_FALSE(follower.isRunning());
    REQUIRE_FALSE(follower.isActive());
    REQUIRE(follower.getRunState() == FollowerRunState::Stopped);
    REQUIRE_FALSE(follower.hasInputAccess());
}

TEST_CASE("CcFollower start without input access is a no-op",
          "[dsp][systems][cc_follower][state]") {
    CcFollower follower;
    follower.start();
    REQUIRE(follower.getRunState() == FollowerRunState::Stopped);

    follower.toggleActive();
    REQUIRE(follower.getRunState() == FollowerRunState::Stopped);
}

TEST_CASE("CcFollower start runs the pipeline and activates emission",
          "[dsp][systems][cc_follower][state]") {
    CcFollower follower;
    follower.setInputAccess(true);
    follower.start();

    REQUIRE(follower.isRunning());
    REQUIRE(follower.isActive());
    REQUIRE(follower.getRunState() == FollowerRunState::RunningActive);

    SECTION("a second start changes nothing") {
        follower.toggleActive();
        follower.start();
        REQUIRE(follower.getRunState() == FollowerRunState::RunningInactive);
    }

    SECTION("toggleActive flips between active and inactive") {
        follower.toggleActive();
        REQUIRE(follower.getRunState() == FollowerRunState::RunningInactive);
        follower.toggleActive();
        REQUIRE(follower.getRunState() == FollowerRunState::RunningActive);
    }

    SECTION("stop clears running and active") {
        follower.stop();
        REQUIRE(follower.getRunState() == FollowerRunState::Stopped);
        REQUIRE_FALSE(follower.follower().isActive());
    }

    SECTION("toggleActive from stopped starts the pipeline") {
        follower.stop();
        follower.toggleActive();
        REQUIRE(follower.getRunState() == FollowerRunState::RunningActive);
    }
}

// ==============================================================================
// Processing
// ==============================================================================

TEST_CASE("CcFollower forwards events to the bound output while active",
          "[dsp][systems][cc_follower][process]") {
    RecordingOutput output;
    CcFollower follower;
    follower.setOutput(&output);
    follower.setInputAccess(true);
    follower.follower().setCcNumber(20);
    follower.follower().setMidiChannel(3);
    follower.start();

    for (int i = 0; i < 10; ++i) {
        auto event = follower.processAmplitude(0.7f);
        REQUIRE(event.has_value());
    }

    REQUIRE(output.events.size() == 10);
    for (const auto& event : output.events) {
        REQUIRE(event.type == MidiEventType::ControlChange);
        REQUIRE(event.controller() == 20);
        REQUIRE(event.channel == 2);
    }
    REQUIRE(output.events.back().value() == follower.getDisplayCcValue());

    SECTION("inactive keeps smoothing but sends nothing") {
        follower.toggleActive();
        const float before = follower.follower().getCurrentAmplitude();
        REQUIRE_FALSE(follower.processAmplitude(0.7f).has_value());
        REQUIRE(output.events.size() == 10);
        REQUIRE(follower.follower().getCurrentAmplitude() > before);
    }

    SECTION("no output bound still returns the event") {
        follower.setOutput(nullptr);
        REQUIRE(follower.processAmplitude(0.7f).has_value());
        REQUIRE(output.events.size() == 10);
    }
}

TEST_CASE("CcFollower ignores samples while stopped",
          "[dsp][systems][cc_follower][process]") {
    RecordingOutput output;
    CcFollower follower;
    follower.setOutput(&output);

    REQUIRE_FALSE(follower.processAmplitude(1.0f).has_value());
    REQUIRE(follower.follower().getCurrentAmplitude() == 0.0f);
    REQUIRE(follower.getDisplayCcValue() == 0);
    REQUIRE(output.events.empty());

    std::vector<float> block(AmplitudeTap::kDefaultBlockSize, 1.0f);
    REQUIRE_FALSE(follower.processBlock(block.data(), block.size()).has_value());
    REQUIRE(follower.amplitudeTap().getLastValue() == 0.0f);
}

TEST_CASE("CcFollower keeps the smoothed amplitude across stop and start",
          "[dsp][systems][cc_follower][state]") {
    CcFollower follower;
    follower.setInputAccess(true);
    follower.start();
    for (int i = 0; i < 20; ++i) {
        (void)follower.processAmplitude(0.9f);
    }
    const float smoothed = follower.follower().getCurrentAmplitude();
    REQUIRE(smoothed > 0.5f);

    follower.stop();
    follower.start();
    REQUIRE(follower.follower().getCurrentAmplitude() == smoothed);

    (void)follower.processAmplitude(0.9f);
    REQUIRE(follower.follower().getCurrentAmplitude() >= smoothed);
}

TEST_CASE("CcFollower processBlock reduces audio through the amplitude tap",
          "[dsp][systems][cc_follower][process]") {
    RecordingOutput output;
    CcFollower follower;
    follower.setOutput(&output);
    follower.setInputAccess(true);
    follower.follower().setSmoothing(0.0f);
    follower.follower().setThreshold(0.0f);
    follower.start();

    std::vector<float> block(AmplitudeTap::kDefaultBlockSize, 0.5f);
    auto event = follower.processBlock(block.data(), block.size());

    REQUIRE(event.has_value());
    REQUIRE(follower.amplitudeTap().getLastValue() == Approx(0.5f).margin(1e-6f));
    REQUIRE(event->value() == 64);
    REQUIRE(output.events.size() == 1);

    SECTION("empty blocks produce no reading") {
        REQUIRE_FALSE(follower.processBlock(block.data(), 0).has_value());
        REQUIRE(output.events.size() == 1);
    }
}

TEST_CASE("CcFollower publishes display values", "[dsp][systems][cc_follower][display]") {
    CcFollower follower;
    follower.setInputAccess(true);
    follower.follower().setSmoothing(0.0f);
    follower.start();

    (void)follower.processAmplitude(0.6f);
    REQUIRE(follower.getDisplayAmplitude() == Approx(0.6f));
    REQUIRE(follower.getDisplayCcValue() == follower.follower().getCcValue());

    follower.reset();
    REQUIRE(follower.getDisplayAmplitude() == 0.0f);
    REQUIRE(follower.getDisplayCcValue() == 0);
}
