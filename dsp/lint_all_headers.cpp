// ==============================================================================
// CntrlDSP Lint Stub - Strict clang-tidy analysis of all public headers
// ==============================================================================
// This file exists solely to give clang-tidy a .cpp translation unit that
// includes every public DSP header, so each header is checked standalone.
//
// This file is NOT part of the CntrlDSP library itself; it is compiled as a
// separate OBJECT library target (cntrl_dsp_lint_stub) for
// compile_commands.json.
// ==============================================================================

// Layer 0: Core
#include <cntrl/dsp/core/db_utils.h>
#include <cntrl/dsp/core/mackie_control.h>
#include <cntrl/dsp/core/midi_event.h>
#include <cntrl/dsp/core/midi_output.h>
#include <cntrl/dsp/core/midi_utils.h>
#include <cntrl/dsp/core/range_mapping.h>

// Layer 1: Primitives
#include <cntrl/dsp/primitives/amplitude_tap.h>

// Layer 2: Processors
#include <cntrl/dsp/processors/cc_envelope_follower.h>

// Layer 3: Systems
#include <cntrl/dsp/systems/cc_follower.h>
#include <cntrl/dsp/systems/control_surface.h>
