// ==============================================================================
// Component State Implementation
// ==============================================================================

#include "preset/component_state.h"

#include "base/source/fstreamer.h"

#include <algorithm>
#include <utility>

namespace Cntrl::Plugins {

using Cntrl::DSP::ControlType;

namespace {

/// Longest prefix of text that fits maxBytes without splitting a UTF-8 sequence
size_t utf8PrefixLength(const std::string& text, size_t maxBytes) {
    if (text.size() <= maxBytes) {
        return text.size();
    }
    size_t length = maxBytes;
    while (length > 0 && (static_cast<unsigned char>(text[length]) & 0xC0) == 0x80) {
        --length;
    }
    return length;
}

void writeString(Steinberg::IBStreamer& streamer, const std::string& text) {
    const auto size = static_cast<Steinberg::int32>(
        utf8PrefixLength(text, static_cast<size_t>(kMaxStateStringBytes)));
    streamer.writeInt32(size);
    if (size > 0) {
        streamer.writeRaw(text.data(), size);
    }
}

bool readString(Steinberg::IBStreamer& streamer, std::string& text) {
    Steinberg::int32 size = 0;
    if (!streamer.readInt32(size)) { return false; }
    if (size < 0 || size > kMaxStateStringBytes) { return false; }

    std::string buffer(static_cast<size_t>(size), '\0');
    if (size > 0 && streamer.readRaw(buffer.data(), size) != size) {
        return false;
    }
    text = std::move(buffer);
    return true;
}

} // namespace

// =============================================================================
// ComponentConfig
// =============================================================================

ComponentConfig ComponentConfig::makeDefault(ControlType type) {
    ComponentConfig config;
    config.type = type;
    config.label = std::string(Cntrl::DSP::controlTypeDisplayName(type));
    return config;
}

LegacyLabel parseLegacyLabel(std::string_view stored) {
    LegacyLabel result{std::string(kDefaultComponentStyle), std::string(stored)};

    if (stored.substr(0, kLegacyStylePrefix.size()) == kLegacyStylePrefix) {
        const auto rest = stored.substr(kLegacyStylePrefix.size());
        const auto separator = rest.find('|');
        const auto style = rest.substr(0, separator);
        if (!style.empty()) {
            result.style = std::string(style);
        }
        // No separator: the record carried a style only
        result.label = (separator == std::string_view::npos)
                           ? std::string()
                           : std::string(rest.substr(separator + 1));
        return result;
    }

    // Records older than the prefix named the style somewhere in the label
    for (const auto known : kLegacyStyleNames) {
        if (stored.find(known) != std::string_view::npos) {
            result.style = std::string(known);
            break;
        }
    }
    return result;
}

// =============================================================================
// Single record
// =============================================================================

void saveComponentConfig(const ComponentConfig& config, Steinberg::IBStreamer& streamer) {
    const auto& mapping = config.midiMapping;

    streamer.writeInt32(kComponentStateVersion);
    streamer.writeInt32(static_cast<Steinberg::int32>(config.type));
    writeString(streamer, config.style);
    writeString(streamer, config.label);

    streamer.writeInt32(static_cast<Steinberg::int32>(mapping.ccNumber));
    streamer.writeInt32(static_cast<Steinberg::int32>(mapping.midiChannel));
    streamer.writeInt8(static_cast<Steinberg::int8>(mapping.noteNumber.has_value() ? 1 : 0));
    if (mapping.noteNumber) {
        streamer.writeInt32(static_cast<Steinberg::int32>(*mapping.noteNumber));
    }

    streamer.writeDouble(mapping.rangeMapping.inputLow);
    streamer.writeDouble(mapping.rangeMapping.inputHigh);
    streamer.writeInt32(static_cast<Steinberg::int32>(mapping.rangeMapping.outputLow));
    streamer.writeInt32(static_cast<Steinberg::int32>(mapping.rangeMapping.outputHigh));
}

bool loadComponentConfig(ComponentConfig& config, Steinberg::IBStreamer& streamer) {
    Steinberg::int32 version = 0;
    if (!streamer.readInt32(version)) { return false; }
    if (version < 1 || version > kComponentStateVersion) { return false; }

    Steinberg::int32 iv = 0;
    if (!streamer.readInt32(iv)) { return false; }
    // Unknown types (written by a newer build) fall back to a knob
    config.type = Cntrl::DSP::isValidControlType(iv) ? static_cast<ControlType>(iv)
                                                     : ControlType::Knob;

    std::string text;
    if (version >= 2) {
        if (!readString(streamer, text)) { return false; }
        config.style = text.empty() ? std::string(kDefaultComponentStyle) : text;
        if (!readString(streamer, text)) { return false; }
        config.label = text;
    } else {
        // v1: style travelled inside the label
        if (!readString(streamer, text)) { return false; }
        auto legacy = parseLegacyLabel(text);
        config.style = std::move(legacy.style);
        config.label = legacy.label.empty()
                           ? std::string(Cntrl::DSP::controlTypeDisplayName(config.type))
                           : std::move(legacy.label);
    }

    auto& mapping = config.midiMapping;

    if (!streamer.readInt32(iv)) { return false; }
    mapping.ccNumber = iv;
    if (!streamer.readInt32(iv)) { return false; }
    mapping.midiChannel = iv;

    Steinberg::int8 hasNote = 0;
    if (!streamer.readInt8(hasNote)) { return false; }
    if (hasNote != 0) {
        if (!streamer.readInt32(iv)) { return false; }
        mapping.noteNumber = iv;
    } else {
        mapping.noteNumber.reset();
    }

    double dv = 0.0;
    if (!streamer.readDouble(dv)) { return false; }
    mapping.rangeMapping.inputLow = dv;
    if (!streamer.readDouble(dv)) { return false; }
    mapping.rangeMapping.inputHigh = dv;
    if (!streamer.readInt32(iv)) { return false; }
    mapping.rangeMapping.outputLow = iv;
    if (!streamer.readInt32(iv)) { return false; }
    mapping.rangeMapping.outputHigh = iv;

    return true;
}

// =============================================================================
// Layout
// =============================================================================

void saveLayout(const std::vector<ComponentConfig>& layout, Steinberg::IBStreamer& streamer) {
    const auto count = static_cast<Steinberg::int32>(
        std::min<size_t>(layout.size(), static_cast<size_t>(kMaxLayoutComponents)));

    streamer.writeInt32(kLayoutStateVersion);
    streamer.writeInt32(count);
    for (Steinberg::int32 i = 0; i < count; ++i) {
        saveComponentConfig(layout[static_cast<size_t>(i)], streamer);
    }
}

bool loadLayout(std::vector<ComponentConfig>& layout, Steinberg::IBStreamer& streamer) {
    layout.clear();

    Steinberg::int32 version = 0;
    if (!streamer.readInt32(version)) { return false; }
    if (version != kLayoutStateVersion) { return false; }

    Steinberg::int32 count = 0;
    if (!streamer.readInt32(count)) { return false; }
    if (count < 0 || count > kMaxLayoutComponents) { return false; }

    layout.reserve(static_cast<size_t>(count));
    for (Steinberg::int32 i = 0; i < count; ++i) {
        ComponentConfig config;
        if (!loadComponentConfig(config, streamer)) {
            return false;
        }
        layout.push_back(std::move(config));
    }
    return true;
}

} // namespace Cntrl::Plugins
