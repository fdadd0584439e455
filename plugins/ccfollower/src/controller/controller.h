#pragma once

// ==============================================================================
// Edit Controller
// ==============================================================================
// Runs on the UI thread. Registers the follower parameters and the read-only
// meters the processor writes back, and mirrors processor state for display.
// The plugin ships without a custom editor; hosts use their generic UI.
// ==============================================================================

#include "public.sdk/source/vst/vsteditcontroller.h"

namespace CntrlFollower {

class Controller : public Steinberg::Vst::EditControllerEx1 {
public:
    Controller() = default;
    ~Controller() override = default;

    // ===========================================================================
    // IPluginBase
    // ===========================================================================

    Steinberg::tresult PLUGIN_API initialize(FUnknown* context) override;
    Steinberg::tresult PLUGIN_API terminate() override;

    // ===========================================================================
    // IEditController
    // ===========================================================================

    /// Receive processor state and synchronize controller
    Steinberg::tresult PLUGIN_API setComponentState(
        Steinberg::IBStream* state) override;

    Steinberg::IPlugView* PLUGIN_API createView(Steinberg::FIDString name) override;

    Steinberg::tresult PLUGIN_API getParamStringByValue(
        Steinberg::Vst::ParamID id,
        Steinberg::Vst::ParamValue valueNormalized,
        Steinberg::Vst::String128 string) override;

    // ===========================================================================
    // Factory
    // ===========================================================================

    static FUnknown* createInstance(void*) {
        return static_cast<Steinberg::Vst::IEditController*>(new Controller());
    }
};

} // namespace CntrlFollower
