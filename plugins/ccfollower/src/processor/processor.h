#pragma once

// ==============================================================================
// Audio Processor - CC Follower
// ==============================================================================
// Follows the envelope of the stereo input and emits MIDI Control Change on
// the event output bus. Audio passes through unchanged.
//
// Audio is downmixed to mono and analysed in fixed blocks of
// AmplitudeTap::kDefaultBlockSize samples. Blocks may straddle process()
// calls; each completed block yields one amplitude reading and at most one
// CC event, stamped with the sample offset at which the block completed.
//
// Real-time safety: no allocation, locks or exceptions in process().
// ==============================================================================

#include "parameters/follower_params.h"

#include "midi/vst_event_output.h"

#include <cntrl/dsp/systems/cc_follower.h>

#include "public.sdk/source/vst/vstaudioeffect.h"

#include <array>
#include <vector>

namespace CntrlFollower {

// State format version (written first in getState)
constexpr Steinberg::int32 kCurrentStateVersion = 1;

class Processor : public Steinberg::Vst::AudioEffect {
public:
    Processor();
    ~Processor() override = default;

    // ===========================================================================
    // IPluginBase
    // ===========================================================================

    Steinberg::tresult PLUGIN_API initialize(FUnknown* context) override;
    Steinberg::tresult PLUGIN_API terminate() override;

    // ===========================================================================
    // IAudioProcessor
    // ===========================================================================

    Steinberg::tresult PLUGIN_API setupProcessing(
        Steinberg::Vst::ProcessSetup& setup) override;

    Steinberg::tresult PLUGIN_API setActive(Steinberg::TBool state) override;

    Steinberg::tresult PLUGIN_API process(
        Steinberg::Vst::ProcessData& data) override;

    Steinberg::tresult PLUGIN_API setBusArrangements(
        Steinberg::Vst::SpeakerArrangement* inputs, Steinberg::int32 numIns,
        Steinberg::Vst::SpeakerArrangement* outputs, Steinberg::int32 numOuts) override;

    // ===========================================================================
    // IComponent - State
    // ===========================================================================

    Steinberg::tresult PLUGIN_API getState(Steinberg::IBStream* state) override;
    Steinberg::tresult PLUGIN_API setState(Steinberg::IBStream* state) override;

    // ===========================================================================
    // Factory
    // ===========================================================================

    static FUnknown* createInstance(void*) {
        return static_cast<Steinberg::Vst::IAudioProcessor*>(new Processor());
    }

    // ===========================================================================
    // Inspection (UI / tests)
    // ===========================================================================

    [[nodiscard]] const Cntrl::DSP::CcFollower& getFollower() const noexcept { return follower_; }

protected:
    void processParameterChanges(Steinberg::Vst::IParameterChanges* changes);
    void applyParamsToFollower();
    void analyzeInput(const float* left, const float* right,
                      Steinberg::int32 numSamples,
                      Steinberg::Vst::IEventList* outputEvents);
    void writeMeters(Steinberg::Vst::IParameterChanges* outputChanges);

private:
    // ===========================================================================
    // Parameters
    // ===========================================================================

    FollowerParams params_;

    // ===========================================================================
    // Engine
    // ===========================================================================

    Cntrl::DSP::CcFollower follower_;
    Cntrl::Plugins::VstEventOutput eventOutput_;

    std::array<float, Cntrl::DSP::AmplitudeTap::kDefaultBlockSize> analysisBlock_{};
    size_t analysisFill_ = 0;
};

} // namespace CntrlFollower
