// ==============================================================================
// RawMidiSender Implementation
// ==============================================================================

#include "midi/raw_midi_sender.h"

#include "base/source/fdebug.h"

namespace Cntrl::Plugins {

using Cntrl::DSP::MidiDecodeStatus;

MidiDecodeStatus RawMidiSender::send(std::span<const uint8_t> bytes) {
    const MidiDecodeStatus status = Cntrl::DSP::classifyRawMidi(bytes);

    switch (status) {
        case MidiDecodeStatus::TooShort:
            ++rejectedCount_;
            SMTG_DBPRT1("RawMidiSender: dropped %d-byte MIDI buffer (too short)\n",
                        static_cast<int>(bytes.size()));
            return status;

        case MidiDecodeStatus::Unsupported:
            ++rejectedCount_;
            SMTG_DBPRT1("RawMidiSender: unsupported MIDI message type 0x%02X\n",
                        static_cast<unsigned>(bytes[0]));
            return status;

        case MidiDecodeStatus::Ok:
            break;
    }

    const auto event = Cntrl::DSP::decodeRawMidi(bytes);
    if (event && output_ != nullptr) {
        output_->send(*event);
    }
    return status;
}

MidiDecodeStatus RawMidiSender::sendMackiePress(Cntrl::DSP::MackieCommand command) {
    const auto bytes = Cntrl::DSP::mackiePressBytes(command);
    return send(bytes);
}

MidiDecodeStatus RawMidiSender::sendMackieRelease(Cntrl::DSP::MackieCommand command) {
    const auto bytes = Cntrl::DSP::mackieReleaseBytes(command);
    return send(bytes);
}

} // namespace Cntrl::Plugins
