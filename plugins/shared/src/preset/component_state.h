#pragma once

// ==============================================================================
// Component State - Persistence of control-surface component records
// ==============================================================================
// Binary, little-endian records written through Steinberg::IBStreamer.
//
// Record layout (version 2):
//   int32  version
//   int32  type           (ControlType)
//   str    style          (v2 only)
//   str    label          (v1: may carry "STYLE:<style>|<label>")
//   int32  ccNumber
//   int32  midiChannel    (1-indexed)
//   int8   hasNoteNumber
//   int32  noteNumber     (only when hasNoteNumber != 0)
//   double inputLow, inputHigh
//   int32  outputLow, outputHigh
//
// "str" is an int32 byte count followed by the raw UTF-8 bytes.
//
// Thread Safety: UI thread only.
// ==============================================================================

#include <cntrl/dsp/systems/control_surface.h>

#include "pluginterfaces/base/ftypes.h"

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace Steinberg {
class IBStreamer;
}

namespace Cntrl::Plugins {

/// Current record version. Version 1 is read for migration only.
constexpr Steinberg::int32 kComponentStateVersion = 2;

/// Layout list container version
constexpr Steinberg::int32 kLayoutStateVersion = 1;

/// Upper bound on components accepted from a stream
constexpr Steinberg::int32 kMaxLayoutComponents = 1024;

/// Upper bound on a persisted string, guards against corrupt lengths
constexpr Steinberg::int32 kMaxStateStringBytes = 4096;

inline constexpr std::string_view kDefaultComponentStyle = "Minimal";

/// Prefix used by version 1 records to carry the style inside the label
inline constexpr std::string_view kLegacyStylePrefix = "STYLE:";

/// Styles recognised in unprefixed version 1 labels, in match order
inline constexpr std::array<std::string_view, 3> kLegacyStyleNames{
    "Neumorphic", "Dotted", "Minimal"};

// =============================================================================
// ComponentConfig
// =============================================================================

struct ComponentConfig {
    Cntrl::DSP::ControlType type = Cntrl::DSP::ControlType::Knob;
    std::string style{kDefaultComponentStyle};
    /// Persisted as UTF-8; longer than kMaxStateStringBytes is cut at the
    /// last whole code point on save
    std::string label{Cntrl::DSP::controlTypeDisplayName(Cntrl::DSP::ControlType::Knob)};
    Cntrl::DSP::MidiMapping midiMapping;

    /// Default record for a freshly placed component of the given type
    static ComponentConfig makeDefault(Cntrl::DSP::ControlType type);

    [[nodiscard]] bool operator==(const ComponentConfig&) const = default;
};

/// Style and label recovered from a version 1 label string
struct LegacyLabel {
    std::string style;
    std::string label;
};

/// @brief Split a version 1 "STYLE:<style>|<label>" label.
/// "STYLE:<style>" without a separator carries a style and an empty label.
/// Unprefixed labels keep their text; the style is the first of
/// kLegacyStyleNames the label contains, else the default.
[[nodiscard]] LegacyLabel parseLegacyLabel(std::string_view stored);

// =============================================================================
// Single record
// =============================================================================

/// Write one record at the current version.
void saveComponentConfig(const ComponentConfig& config, Steinberg::IBStreamer& streamer);

/// @brief Read one record (version 1 or 2).
/// Fields are applied as they are read; on a truncated stream the unread
/// fields keep the values config already held.
/// @return false on a truncated stream or unknown version
bool loadComponentConfig(ComponentConfig& config, Steinberg::IBStreamer& streamer);

// =============================================================================
// Layout
// =============================================================================

/// Write a container version, a count and each record.
void saveLayout(const std::vector<ComponentConfig>& layout, Steinberg::IBStreamer& streamer);

/// @brief Read a layout written by saveLayout().
/// Records read before a failure are kept in layout.
/// @return false on a truncated or malformed stream
bool loadLayout(std::vector<ComponentConfig>& layout, Steinberg::IBStreamer& streamer);

} // namespace Cntrl::Plugins
