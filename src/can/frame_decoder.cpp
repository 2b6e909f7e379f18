// src/can/frame_decoder.cpp
#include "can/frame_decoder.hpp"
#include "utils/logging.hpp"

namespace can {

uint64_t FrameDecoder::extract_raw(const uint8_t* data, int start_byte, int length_bytes,
                                   ByteOrder order) {
    uint64_t raw = 0;
    if (order == ByteOrder::Big) {
        for (int i = 0; i < length_bytes; ++i) {
            raw = (raw << 8) | static_cast<uint64_t>(data[start_byte + i]);
        }
    } else {
        for (int i = length_bytes - 1; i >= 0; --i) {
            raw = (raw << 8) | static_cast<uint64_t>(data[start_byte + i]);
        }
    }
    return raw;
}

int64_t FrameDecoder::sign_extend(uint64_t v, int bit_length) {
    if (bit_length <= 0 || bit_length >= 64)
        return static_cast<int64_t>(v);

    const uint64_t sign_bit = 1ULL << (bit_length - 1);
    if (v & sign_bit) {
        const uint64_t mask = (~0ULL) << bit_length;
        v |= mask;
    }
    return static_cast<int64_t>(v);
}

bool FrameDecoder::decode_signal(const SignalDefinition& def, const RawFrame& frame, double& out) {
    const int available = frame.size > 8 ? 8 : static_cast<int>(frame.size);
    if (def.start_byte + def.length_bytes > available)
        return false;

    const uint64_t raw_u = extract_raw(frame.data.data(), def.start_byte,
                                       def.length_bytes, def.byte_order);
    if (def.is_signed) {
        const int64_t raw_s = sign_extend(raw_u, def.length_bytes * 8);
        out = static_cast<double>(raw_s) * def.scale + def.offset;
    } else {
        out = static_cast<double>(raw_u) * def.scale + def.offset;
    }
    return true;
}

std::vector<DecodedSample> FrameDecoder::decode(const RawFrame& frame, const SignalCatalog& catalog) {
    std::vector<DecodedSample> out;

    const auto* defs = catalog.find(frame.arbitration_id);
    if (!defs)
        return out;

    out.reserve(defs->size());
    for (const auto& def : *defs) {
        double value = 0.0;
        if (!decode_signal(def, frame, value)) {
            LOG_WARN("[CAN] '%s' (id 0x%X): frame too short, need %d bytes, got %d",
                     def.signal_name.c_str(), frame.arbitration_id,
                     def.start_byte + def.length_bytes, static_cast<int>(frame.size));
            continue;
        }
        out.push_back(DecodedSample{frame.timestamp, def.signal_name, value});
    }
    return out;
}

} // namespace can
