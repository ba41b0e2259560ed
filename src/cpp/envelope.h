#pragma once

#include "pb_wire.h"
#include <cstdint>
#include <string>

// Envelope classification for the top of a transport payload.
// Evaluated once per payload, highest priority first:
//   PLAIN_TEXT          "<?xml" / "<event" prefix
//   MESH_FRAMED         0xBF varint(version) 0xBF payload...
//   STREAM_FRAMED       0xBF varint(length) payload[length]
//   HEURISTIC_PROTOBUF  bare protobuf whose first tag byte is on the allow-list
//   UNRECOGNIZED        none of the above

constexpr uint8_t TAK_MAGIC = 0xBF;

enum class MessageVariant {
    PLAIN_TEXT,
    STREAM_FRAMED,
    MESH_FRAMED,
    HEURISTIC_PROTOBUF,
    UNRECOGNIZED,
};

enum class EnvelopeStatus {
    OK,
    BAD_VARINT,        // 0xBF followed by a truncated / over-long varint
    LENGTH_MISMATCH,   // stream frame length disagrees with the bytes present
    UNRECOGNIZED,      // not ours; not an error
};

const char* variant_name(MessageVariant v);

// Strict validated result for the outer framing. payload_offset and
// payload_length locate the embedded message inside the classified span;
// they are only meaningful when status == OK.
struct Envelope {
    MessageVariant variant = MessageVariant::UNRECOGNIZED;
    EnvelopeStatus status = EnvelopeStatus::UNRECOGNIZED;
    uint64_t version = 0;
    uint64_t declared_length = 0;   // stream frames: the length prefix
    size_t payload_offset = 0;
    size_t payload_length = 0;

    bool ok() const { return status == EnvelopeStatus::OK; }
};

// First bytes consistent with a BaseEvent starting with field 1..6 at
// VARINT or LENGTH_DELIMITED wire type.
bool is_heuristic_tag_byte(uint8_t b);

Envelope classify_envelope(const pb::ByteSpan& payload);
