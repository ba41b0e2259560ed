#include "dissector.h"
#include "field_registry.h"
#include "omni_builders.h"
#include "schema.h"
#include "tak_builders.h"

#include <exception>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

// ── Dissector base ──

size_t Dissector::dissect(const uint8_t* buf, size_t buf_len, size_t offset, size_t length,
                          DissectOutput& out) const {
    pb::ByteSpan whole(buf, buf_len);
    return dissect(whole.subspan(offset, length), out);
}

size_t Dissector::dissect(const pb::ByteSpan& payload, DissectOutput& out) const {
    try {
        return dissect_payload(payload, out);
    } catch (const std::exception& e) {
        spdlog::debug("{} dissector failed at +{}: {}", name(), payload.origin(), e.what());
        out.add_expert(malformed_expert(), e.what());
        return 0;
    }
}

void Dissector::add_envelope_fields(FieldNode& root, const FieldInfo& version_field,
                                    const FieldInfo& length_field, const FieldInfo& protocol_field,
                                    uint64_t version, uint64_t length, const std::string& protocol) {
    root.add(version_field, version);
    root.add(length_field, length);
    root.add(protocol_field, protocol);
    root.append_text(fmt::format(", Version: {}, Length: {}, Protocol: {}", version, length, protocol));
}

static void open_root(DissectOutput& out, const FieldInfo& proto, const char* label,
                      const char* column, const pb::ByteSpan& payload) {
    out.root.info = &proto;
    out.root.label = label;
    out.root.set_range(payload);
    out.protocol_column = column;
    out.info_column = column;
}

// ── TAK ──

const ExpertDef& TakDissector::malformed_expert() const { return ei::tak_malformed; }

size_t TakDissector::dissect_payload(const pb::ByteSpan& payload, DissectOutput& out) const {
    open_root(out, hf::tak, "TAK Message", "TAK", payload);

    Envelope env = classify_envelope(payload);

    switch (env.status) {
    case EnvelopeStatus::OK:
        break;
    case EnvelopeStatus::BAD_VARINT:
        out.add_expert(ei::tak_malformed, "Failed to decode varint");
        return 0;
    case EnvelopeStatus::LENGTH_MISMATCH:
        out.add_expert(ei::tak_malformed, "Payload length mismatch");
        return 0;
    case EnvelopeStatus::UNRECOGNIZED:
        out.add_expert(ei::tak_unsupported, "Unknown message format");
        return 0;
    }

    uint64_t length = 0;
    switch (env.variant) {
    case MessageVariant::PLAIN_TEXT:
        length = payload.size();
        out.info_column = "TAK/XML";
        break;
    case MessageVariant::STREAM_FRAMED:
        length = env.declared_length;
        out.info_column = "TAK/Stream";
        break;
    case MessageVariant::MESH_FRAMED:
        length = env.payload_length;
        out.info_column = fmt::format("TAK/Mesh v{}", env.version);
        break;
    default:
        // Bare protobuf without the magic byte is not a TAK envelope
        out.add_expert(ei::tak_unsupported, "Unknown message format");
        return 0;
    }

    add_envelope_fields(out.root, hf::tak_version, hf::tak_length, hf::tak_protocol,
                        env.version, length, variant_name(env.variant));

    if (env.variant == MessageVariant::PLAIN_TEXT) {
        if (plain_text_) plain_text_(payload, out.root, out);
        return payload.size();
    }

    if (env.payload_length > 0) {
        BuildContext ctx(out, ei::tak_malformed, settings_.max_nesting_depth);
        pb::ByteSpan body = payload.subspan(env.payload_offset, env.payload_length);
        out.info_column += ctx.descend(tak::build_tak_message, body, out.root);
    }

    spdlog::trace("TAK {} message, {} byte(s)", variant_name(env.variant), payload.size());
    return payload.size();
}

// ── OMNI ──

const ExpertDef& OmniDissector::malformed_expert() const { return ei::omni_malformed; }

size_t OmniDissector::dissect_payload(const pb::ByteSpan& payload, DissectOutput& out) const {
    open_root(out, hf::omni, "OMNI Message", "OMNI", payload);

    Envelope env = classify_envelope(payload);
    if (env.variant != MessageVariant::HEURISTIC_PROTOBUF) {
        out.add_expert(ei::omni_unsupported, "Unknown message format");
        return 0;
    }

    add_envelope_fields(out.root, hf::omni_version, hf::omni_length, hf::omni_protocol,
                        0, payload.size(), variant_name(env.variant));

    BuildContext ctx(out, ei::omni_malformed, settings_.max_nesting_depth);
    out.info_column += ctx.descend(omni::build_base_event, payload, out.root);
    return payload.size();
}
