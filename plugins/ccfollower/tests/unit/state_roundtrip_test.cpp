// ==============================================================================
// Unit Test: State Round-Trip Persistence
// ==============================================================================
// Verifies that getState() followed by setState() on a new Processor
// preserves all parameter values, and that malformed streams keep defaults.
// ==============================================================================

#include <catch2/catch_test_macros.hpp>

#include "processor/processor.h"
#include "plugin_ids.h"

#include "public.sdk/source/common/memorystream.h"
#include "base/source/fstreamer.h"
#include "pluginterfaces/vst/ivstparameterchanges.h"

#include <cstring>
#include <memory>
#include <vector>

// =============================================================================
// Mocks
// =============================================================================

namespace {

class SingleValueQueue : public Steinberg::Vst::IParamValueQueue {
public:
    SingleValueQueue(Steinberg::Vst::ParamID id, double value)
        : paramId_(id), value_(value) {}

    Steinberg::tresult PLUGIN_API queryInterface(const Steinberg::TUID, void**) override {
        return Steinberg::kNoInterface;
    }
    Steinberg::uint32 PLUGIN_API addRef() override { return 1; }
    Steinberg::uint32 PLUGIN_API release() override { return 1; }

    Steinberg::Vst::ParamID PLUGIN_API getParameterId() override { return paramId_; }
    Steinberg::int32 PLUGIN_API getPointCount() override { return 1; }

    Steinberg::tresult PLUGIN_API getPoint(
        Steinberg::int32 index, Steinberg::int32& sampleOffset,
        Steinberg::Vst::ParamValue& value) override {
        if (index != 0) return Steinberg::kResultFalse;
        sampleOffset = 0;
        value = value_;
        return Steinberg::kResultTrue;
    }

    Steinberg::tresult PLUGIN_API addPoint(
        Steinberg::int32, Steinberg::Vst::ParamValue, Steinberg::int32&) override {
        return Steinberg::kResultFalse;
    }

private:
    Steinberg::Vst::ParamID paramId_;
    double value_;
};

class ParamChangeBatch : public Steinberg::Vst::IParameterChanges {
public:
    Steinberg::tresult PLUGIN_API queryInterface(const Steinberg::TUID, void**) override {
        return Steinberg::kNoInterface;
    }
    Steinberg::uint32 PLUGIN_API addRef() override { return 1; }
    Steinberg::uint32 PLUGIN_API release() override { return 1; }

    Steinberg::int32 PLUGIN_API getParameterCount() override {
        return static_cast<Steinberg::int32>(queues_.size());
    }

    Steinberg::Vst::IParamValueQueue* PLUGIN_API getParameterData(
        Steinberg::int32 index) override {
        if (index < 0 || index >= static_cast<Steinberg::int32>(queues_.size()))
            return nullptr;
        return &queues_[static_cast<size_t>(index)];
    }

    Steinberg::Vst::IParamValueQueue* PLUGIN_API addParameterData(
        const Steinberg::Vst::ParamID&, Steinberg::int32&) override {
        return nullptr;
    }

    void add(Steinberg::Vst::ParamID id, double value) { queues_.emplace_back(id, value); }

private:
    std::vector<SingleValueQueue> queues_;
};

// Expose processParameterChanges for testing
class TestableProcessor : public CntrlFollower::Processor {
public:
    using CntrlFollower::Processor::processParameterChanges;
};

std::unique_ptr<TestableProcessor> makeProcessor() {
    auto p = std::make_unique<TestableProcessor>();
    p->initialize(nullptr);

    Steinberg::Vst::ProcessSetup setup{};
    setup.processMode = Steinberg::Vst::kRealtime;
    setup.symbolicSampleSize = Steinberg::Vst::kSample32;
    setup.sampleRate = 44100.0;
    setup.maxSamplesPerBlock = 512;
    p->setupProcessing(setup);

    return p;
}

std::vector<char> captureState(CntrlFollower::Processor& processor) {
    auto* stream = new Steinberg::MemoryStream();
    REQUIRE(processor.getState(stream) == Steinberg::kResultTrue);

    Steinberg::int64 size = 0;
    stream->seek(0, Steinberg::IBStream::kIBSeekEnd, &size);
    std::vector<char> bytes(static_cast<size_t>(size));
    std::memcpy(bytes.data(), stream->getData(), bytes.size());

    stream->release();
    return bytes;
}

Steinberg::MemoryStream* streamFrom(const std::vector<char>& bytes) {
    auto* stream = new Steinberg::MemoryStream();
    Steinberg::int32 written = 0;
    stream->write(const_cast<char*>(bytes.data()),
                  static_cast<Steinberg::int32>(bytes.size()), &written);
    stream->seek(0, Steinberg::IBStream::kIBSeekSet, nullptr);
    return stream;
}

} // namespace

// =============================================================================
// Tests
// =============================================================================

TEST_CASE("Processor state starts with the format version", "[state][processor]") {
    auto processor = makeProcessor();
    const auto bytes = captureState(*processor);

    // version + 8 fields of 4 bytes
    REQUIRE(bytes.size() == 36);

    auto* stream = streamFrom(bytes);
    Steinberg::IBStreamer reader(stream, kLittleEndian);
    Steinberg::int32 version = 0;
    REQUIRE(reader.readInt32(version));
    REQUIRE(version == CntrlFollower::kCurrentStateVersion);
    stream->release();

    processor->terminate();
}

TEST_CASE("Processor state round-trips through a new instance", "[state][processor]") {
    auto original = makeProcessor();

    ParamChangeBatch changes;
    changes.add(CntrlFollower::kActiveId, 0.0);
    changes.add(CntrlFollower::kThresholdId, 0.6);
    changes.add(CntrlFollower::kGainId, 0.75);
    changes.add(CntrlFollower::kSmoothingId, 0.3);
    changes.add(CntrlFollower::kCcNumberId, CntrlFollower::followerCcNumberToNormalized(74));
    changes.add(CntrlFollower::kMidiChannelId, CntrlFollower::followerChannelToNormalized(10));
    changes.add(CntrlFollower::kDetectorModeId, 1.0);
    original->processParameterChanges(&changes);

    const auto saved = captureState(*original);

    auto restored = makeProcessor();
    auto* stream = streamFrom(saved);
    REQUIRE(restored->setState(stream) == Steinberg::kResultTrue);
    stream->release();

    REQUIRE(captureState(*restored) == saved);

    original->terminate();
    restored->terminate();
}

TEST_CASE("Processor setState keeps defaults for unusable streams", "[state][processor]") {
    auto processor = makeProcessor();
    const auto defaults = captureState(*processor);

    SECTION("empty stream") {
        auto* stream = new Steinberg::MemoryStream();
        REQUIRE(processor->setState(stream) == Steinberg::kResultTrue);
        stream->release();
    }

    SECTION("unknown version") {
        auto* stream = new Steinberg::MemoryStream();
        {
            Steinberg::IBStreamer writer(stream, kLittleEndian);
            writer.writeInt32(CntrlFollower::kCurrentStateVersion + 1);
            writer.writeInt32(0);
            writer.writeInt32(0);
        }
        stream->seek(0, Steinberg::IBStream::kIBSeekSet, nullptr);
        REQUIRE(processor->setState(stream) == Steinberg::kResultTrue);
        stream->release();
    }

    REQUIRE(captureState(*processor) == defaults);

    processor->terminate();
}
