#include "envelope.h"
#include "util.h"

#include <algorithm>
#include <array>

#include <spdlog/spdlog.h>

const char* variant_name(MessageVariant v) {
    switch (v) {
    case MessageVariant::PLAIN_TEXT:         return "xml";
    case MessageVariant::STREAM_FRAMED:      return "stream";
    case MessageVariant::MESH_FRAMED:        return "mesh";
    case MessageVariant::HEURISTIC_PROTOBUF: return "omni";
    case MessageVariant::UNRECOGNIZED:       return "unknown";
    }
    return "unknown";
}

bool is_heuristic_tag_byte(uint8_t b) {
    static constexpr std::array<uint8_t, 8> allowed = {
        0x08, 0x0A, 0x10, 0x12, 0x1A, 0x22, 0x2A, 0x32,
    };
    return std::find(allowed.begin(), allowed.end(), b) != allowed.end();
}

static Envelope classify_framed(const pb::ByteSpan& payload) {
    Envelope env;
    size_t offset = 1;  // magic

    auto v1 = pb::decode_varint(payload, offset);
    if (!v1.ok()) {
        env.variant = MessageVariant::STREAM_FRAMED;
        env.status = EnvelopeStatus::BAD_VARINT;
        spdlog::debug("TAK frame: bad varint after magic ({})", pb::status_name(v1.status));
        return env;
    }
    offset += v1.bytes_consumed;

    if (offset < payload.size() && payload[offset] == TAK_MAGIC) {
        // Mesh: no length prefix, payload runs to the end of the buffer
        offset += 1;
        env.variant = MessageVariant::MESH_FRAMED;
        env.status = EnvelopeStatus::OK;
        env.version = v1.value;
        env.payload_offset = offset;
        env.payload_length = payload.size() - offset;
        return env;
    }

    env.variant = MessageVariant::STREAM_FRAMED;
    env.version = 1;
    env.declared_length = v1.value;

    size_t remaining = payload.size() - offset;
    if (v1.value != remaining) {
        env.status = EnvelopeStatus::LENGTH_MISMATCH;
        spdlog::debug("TAK stream frame: declared length {} but {} byte(s) remain",
                      v1.value, remaining);
        return env;
    }

    env.status = EnvelopeStatus::OK;
    env.payload_offset = offset;
    env.payload_length = remaining;
    return env;
}

Envelope classify_envelope(const pb::ByteSpan& payload) {
    Envelope env;
    if (payload.empty()) return env;

    const uint8_t* p = payload.data();
    size_t len = payload.size();

    if (util::starts_with(p, len, "<?xml") || util::starts_with(p, len, "<event")) {
        env.variant = MessageVariant::PLAIN_TEXT;
        env.status = EnvelopeStatus::OK;
        env.payload_offset = 0;
        env.payload_length = len;
        return env;
    }

    if (p[0] == TAK_MAGIC) {
        return classify_framed(payload);
    }

    if (is_heuristic_tag_byte(p[0])) {
        env.variant = MessageVariant::HEURISTIC_PROTOBUF;
        env.status = EnvelopeStatus::OK;
        env.payload_offset = 0;
        env.payload_length = len;
        return env;
    }

    spdlog::trace("unrecognized envelope, leading bytes {}",
                  util::format_hex(p, std::min<size_t>(len, 4)));
    return env;
}
