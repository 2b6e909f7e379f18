// src/can/frame_decoder.hpp
#pragma once

#include <cstdint>
#include <vector>

#include "can/frame.hpp"
#include "can/signal_catalog.hpp"

namespace can {

class FrameDecoder {
public:
    /**
     * Decode every catalog signal defined for frame.arbitration_id.
     *
     * Signals whose byte range lies beyond frame.size are skipped with a
     * warning. Output follows catalog order and carries the frame timestamp.
     * value = raw * scale + offset, raw sign-extended when is_signed.
     */
    static std::vector<DecodedSample> decode(const RawFrame& frame, const SignalCatalog& catalog);

    // Raw integer of a byte-aligned field, zero-extended to 64 bits
    static uint64_t extract_raw(const uint8_t* data, int start_byte, int length_bytes,
                                ByteOrder order);

    // Two's complement interpretation of the low bit_length bits
    static int64_t sign_extend(uint64_t v, int bit_length);

    // Single signal; false if the frame is too short for it
    static bool decode_signal(const SignalDefinition& def, const RawFrame& frame, double& out);
};

} // namespace can
