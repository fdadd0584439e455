#pragma once

// ==============================================================================
// Parameter Helper Functions
// ==============================================================================
// Basic Parameter::toPlain() returns the normalized value unchanged, while
// StringListParameter::toPlain() scales to integer indices. Discrete list
// parameters are therefore always created through these helpers.
// ==============================================================================

#include "public.sdk/source/vst/vstparameters.h"
#include "pluginterfaces/base/ustring.h"

#include <cstdint>
#include <initializer_list>

namespace CntrlFollower {

// ==============================================================================
// createDropdownParameter - discrete list parameter, default index 0
// ==============================================================================

inline Steinberg::Vst::StringListParameter* createDropdownParameter(
    const Steinberg::Vst::TChar* title,
    Steinberg::Vst::ParamID id,
    std::initializer_list<const Steinberg::Vst::TChar*> options) {

    auto* param = new Steinberg::Vst::StringListParameter(
        title,
        id,
        nullptr,
        Steinberg::Vst::ParameterInfo::kCanAutomate |
        Steinberg::Vst::ParameterInfo::kIsList
    );

    for (const auto* option : options) {
        param->appendString(option);
    }

    return param;
}

// ==============================================================================
// createIndexedDropdownParameter - list of "first" .. "first + count - 1"
// ==============================================================================

inline Steinberg::Vst::StringListParameter* createIndexedDropdownParameter(
    const Steinberg::Vst::TChar* title,
    Steinberg::Vst::ParamID id,
    int32_t first,
    int32_t count) {

    auto* param = new Steinberg::Vst::StringListParameter(
        title,
        id,
        nullptr,
        Steinberg::Vst::ParameterInfo::kCanAutomate |
        Steinberg::Vst::ParameterInfo::kIsList
    );

    for (int32_t i = 0; i < count; ++i) {
        Steinberg::Vst::String128 label{};
        Steinberg::UString(label, 128).printInt(first + i);
        param->appendString(label);
    }

    return param;
}

} // namespace CntrlFollower
