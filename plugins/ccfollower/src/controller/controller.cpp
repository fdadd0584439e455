// ==============================================================================
// Edit Controller Implementation
// ==============================================================================

#include "controller.h"
#include "plugin_ids.h"
#include "processor/processor.h"
#include "parameters/follower_params.h"

#include "base/source/fstreamer.h"

namespace CntrlFollower {

// ==============================================================================
// IPluginBase
// ==============================================================================

Steinberg::tresult PLUGIN_API Controller::initialize(FUnknown* context) {
    Steinberg::tresult result = EditControllerEx1::initialize(context);
    if (result != Steinberg::kResultTrue) {
        return result;
    }

    registerFollowerParams(parameters);
    registerFollowerMeters(parameters);

    return Steinberg::kResultTrue;
}

Steinberg::tresult PLUGIN_API Controller::terminate() {
    return EditControllerEx1::terminate();
}

// ==============================================================================
// IEditController
// ==============================================================================

Steinberg::tresult PLUGIN_API Controller::setComponentState(Steinberg::IBStream* state) {
    if (!state) {
        return Steinberg::kResultFalse;
    }

    Steinberg::IBStreamer streamer(state, kLittleEndian);

    // Read version first (same format as Processor::setState)
    Steinberg::int32 version = 0;
    if (!streamer.readInt32(version)) {
        return Steinberg::kResultTrue; // Empty stream, keep defaults
    }

    if (version != kCurrentStateVersion) {
        return Steinberg::kResultTrue;
    }

    loadFollowerParamsToController(streamer,
        [this](Steinberg::Vst::ParamID id, double value) {
            setParamNormalized(id, value);
        });

    return Steinberg::kResultTrue;
}

Steinberg::IPlugView* PLUGIN_API Controller::createView(Steinberg::FIDString /*name*/) {
    return nullptr;
}

Steinberg::tresult PLUGIN_API Controller::getParamStringByValue(
    Steinberg::Vst::ParamID id,
    Steinberg::Vst::ParamValue valueNormalized,
    Steinberg::Vst::String128 string) {

    if (id <= kFollowerEndId || (id >= kMeterBaseId && id <= kMeterEndId)) {
        const Steinberg::tresult result = formatFollowerParam(id, valueNormalized, string);
        if (result == Steinberg::kResultOk) {
            return result;
        }
    }

    return EditControllerEx1::getParamStringByValue(id, valueNormalized, string);
}

} // namespace CntrlFollower
