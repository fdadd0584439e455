// ==============================================================================
// Audio Processor Implementation
// ==============================================================================

#include "processor.h"
#include "plugin_ids.h"

#include "base/source/fstreamer.h"
#include "pluginterfaces/vst/ivstevents.h"
#include "pluginterfaces/vst/ivstparameterchanges.h"

#include <algorithm>
#include <cstring>

namespace CntrlFollower {

// ==============================================================================
// Constructor
// ==============================================================================

Processor::Processor() {
    setControllerClass(kControllerUID);
}

// ==============================================================================
// IPluginBase
// ==============================================================================

Steinberg::tresult PLUGIN_API Processor::initialize(FUnknown* context) {
    Steinberg::tresult result = AudioEffect::initialize(context);
    if (result != Steinberg::kResultTrue) {
        return result;
    }

    // Stereo pass-through plus a MIDI event output
    addAudioInput(STR16("Audio Input"), Steinberg::Vst::SpeakerArr::kStereo);
    addAudioOutput(STR16("Audio Output"), Steinberg::Vst::SpeakerArr::kStereo);
    addEventOutput(STR16("MIDI Out"), 16);

    follower_.setOutput(&eventOutput_);

    return Steinberg::kResultTrue;
}

Steinberg::tresult PLUGIN_API Processor::terminate() {
    follower_.stop();
    follower_.setOutput(nullptr);
    return AudioEffect::terminate();
}

// ==============================================================================
// IAudioProcessor
// ==============================================================================

Steinberg::tresult PLUGIN_API Processor::setupProcessing(
    Steinberg::Vst::ProcessSetup& setup) {
    // Analysis runs in fixed sample blocks, independent of the sample rate
    return AudioEffect::setupProcessing(setup);
}

Steinberg::tresult PLUGIN_API Processor::setActive(Steinberg::TBool state) {
    if (state) {
        // Host re-activation: clear the envelope and any partial block
        follower_.reset();
        analysisBlock_.fill(0.0f);
        analysisFill_ = 0;
    }

    return AudioEffect::setActive(state);
}

Steinberg::tresult PLUGIN_API Processor::process(Steinberg::Vst::ProcessData& data) {
    // ==========================================================================
    // REAL-TIME SAFETY CRITICAL
    // - NO memory allocation, NO locks, NO exceptions
    // ==========================================================================

    if (data.inputParameterChanges) {
        processParameterChanges(data.inputParameterChanges);
    }

    // Input access: a connected stereo input bus
    const bool hasInput = data.numInputs > 0 && data.inputs != nullptr
                       && data.inputs[0].numChannels >= 2
                       && data.inputs[0].channelBuffers32 != nullptr;
    follower_.setInputAccess(hasInput);

    applyParamsToFollower();

    if (data.numSamples <= 0) {
        return Steinberg::kResultTrue;
    }

    // Pass audio through
    if (data.numOutputs > 0 && data.outputs[0].numChannels >= 2) {
        const auto numSamples = static_cast<size_t>(data.numSamples);
        for (Steinberg::int32 ch = 0; ch < 2; ++ch) {
            float* out = data.outputs[0].channelBuffers32[ch];
            if (!out) {
                continue;
            }
            const float* in = hasInput ? data.inputs[0].channelBuffers32[ch] : nullptr;
            if (in == nullptr) {
                std::fill_n(out, numSamples, 0.0f);
            } else if (in != out) {
                std::memcpy(out, in, numSamples * sizeof(float));
            }
        }
        data.outputs[0].silenceFlags = hasInput ? data.inputs[0].silenceFlags : 0x3;
    }

    if (hasInput) {
        analyzeInput(data.inputs[0].channelBuffers32[0],
                     data.inputs[0].channelBuffers32[1],
                     data.numSamples, data.outputEvents);
    }

    writeMeters(data.outputParameterChanges);

    return Steinberg::kResultTrue;
}

Steinberg::tresult PLUGIN_API Processor::setBusArrangements(
    Steinberg::Vst::SpeakerArrangement* inputs, Steinberg::int32 numIns,
    Steinberg::Vst::SpeakerArrangement* outputs, Steinberg::int32 numOuts) {

    // Accept stereo only, the host falls back to the default arrangement
    if (numIns == 1 && numOuts == 1 &&
        inputs[0] == Steinberg::Vst::SpeakerArr::kStereo &&
        outputs[0] == Steinberg::Vst::SpeakerArr::kStereo) {
        return AudioEffect::setBusArrangements(inputs, numIns, outputs, numOuts);
    }

    return Steinberg::kResultFalse;
}

// ==============================================================================
// IComponent - State Management
// ==============================================================================

Steinberg::tresult PLUGIN_API Processor::getState(Steinberg::IBStream* state) {
    Steinberg::IBStreamer streamer(state, kLittleEndian);

    streamer.writeInt32(kCurrentStateVersion);
    saveFollowerParams(params_, streamer);

    return Steinberg::kResultTrue;
}

Steinberg::tresult PLUGIN_API Processor::setState(Steinberg::IBStream* state) {
    Steinberg::IBStreamer streamer(state, kLittleEndian);

    Steinberg::int32 version = 0;
    if (!streamer.readInt32(version)) {
        return Steinberg::kResultTrue; // Empty stream, keep defaults
    }

    if (version != kCurrentStateVersion) {
        return Steinberg::kResultTrue; // Unknown version, keep defaults
    }

    // A truncated stream keeps defaults for the remaining fields
    loadFollowerParams(params_, streamer);

    return Steinberg::kResultTrue;
}

// ==============================================================================
// Parameter Handling
// ==============================================================================

void Processor::processParameterChanges(Steinberg::Vst::IParameterChanges* changes) {
    if (!changes) {
        return;
    }

    const Steinberg::int32 numParamsChanged = changes->getParameterCount();

    for (Steinberg::int32 i = 0; i < numParamsChanged; ++i) {
        Steinberg::Vst::IParamValueQueue* paramQueue = changes->getParameterData(i);
        if (!paramQueue) {
            continue;
        }

        const Steinberg::Vst::ParamID paramId = paramQueue->getParameterId();
        const Steinberg::int32 numPoints = paramQueue->getPointCount();
        if (numPoints <= 0) {
            continue;
        }

        // Get the last value (most recent)
        Steinberg::int32 sampleOffset = 0;
        Steinberg::Vst::ParamValue value = 0.0;

        if (paramQueue->getPoint(numPoints - 1, sampleOffset, value)
            != Steinberg::kResultTrue) {
            continue;
        }

        if (paramId <= kFollowerEndId) {
            handleFollowerParamChange(params_, paramId, value);
        }
        // Meters are output-only
    }
}

void Processor::applyParamsToFollower() {
    auto& envelope = follower_.follower();
    envelope.setThreshold(params_.threshold.load(std::memory_order_relaxed));
    envelope.setGain(params_.gain.load(std::memory_order_relaxed));
    envelope.setSmoothing(params_.smoothing.load(std::memory_order_relaxed));
    envelope.setCcNumber(params_.ccNumber.load(std::memory_order_relaxed));
    envelope.setMidiChannel(params_.midiChannel.load(std::memory_order_relaxed));
    follower_.amplitudeTap().setMode(
        followerDetectorMode(params_.detectorMode.load(std::memory_order_relaxed)));

    // Run state: Enabled drives start/stop, Send CC selects active/inactive
    const bool wantRunning = params_.enabled.load(std::memory_order_relaxed);
    if (wantRunning && !follower_.isRunning()) {
        follower_.start();  // no-op without input access
    } else if (!wantRunning && follower_.isRunning()) {
        follower_.stop();
    }

    if (follower_.isRunning()) {
        const bool wantActive = params_.active.load(std::memory_order_relaxed);
        if (wantActive != follower_.isActive()) {
            follower_.toggleActive();
        }
    }
}

void Processor::analyzeInput(const float* left, const float* right,
                             Steinberg::int32 numSamples,
                             Steinberg::Vst::IEventList* outputEvents) {
    if (!left || !right) {
        return;
    }

    for (Steinberg::int32 i = 0; i < numSamples; ++i) {
        analysisBlock_[analysisFill_++] = 0.5f * (left[i] + right[i]);

        if (analysisFill_ == analysisBlock_.size()) {
            eventOutput_.bind(outputEvents, i, 0);
            (void)follower_.processBlock(analysisBlock_.data(), analysisBlock_.size());
            analysisFill_ = 0;
        }
    }

    eventOutput_.unbind();
}

void Processor::writeMeters(Steinberg::Vst::IParameterChanges* outputChanges) {
    if (!outputChanges) {
        return;
    }

    Steinberg::int32 index = 0;
    if (auto* queue = outputChanges->addParameterData(kCcValueMeterId, index)) {
        const double cc = static_cast<double>(follower_.getDisplayCcValue()) / 127.0;
        queue->addPoint(0, cc, index);
    }

    index = 0;
    if (auto* queue = outputChanges->addParameterData(kAmplitudeMeterId, index)) {
        const float amplitude = std::clamp(follower_.getDisplayAmplitude(), 0.0f, 1.0f);
        queue->addPoint(0, static_cast<Steinberg::Vst::ParamValue>(amplitude), index);
    }
}

} // namespace CntrlFollower
