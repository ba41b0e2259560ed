#pragma once

#include "envelope.h"
#include "field_tree.h"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>

struct DecoderSettings {
    size_t max_nesting_depth = 32;
};

// Host entry point contract: dissect() reads buf[offset, offset+length),
// fills out, and returns the bytes claimed (0 = not this protocol or
// rejected). It never throws.
class Dissector {
public:
    explicit Dissector(DecoderSettings settings) : settings_(settings) {}
    virtual ~Dissector() = default;

    virtual const char* name() const = 0;

    size_t dissect(const uint8_t* buf, size_t buf_len, size_t offset, size_t length,
                   DissectOutput& out) const;
    size_t dissect(const pb::ByteSpan& payload, DissectOutput& out) const;

    const DecoderSettings& settings() const { return settings_; }
    void set_settings(const DecoderSettings& settings) { settings_ = settings; }

protected:
    virtual size_t dissect_payload(const pb::ByteSpan& payload, DissectOutput& out) const = 0;
    virtual const ExpertDef& malformed_expert() const = 0;

    // version / length / protocol children plus the ", Version: ..." summary
    static void add_envelope_fields(FieldNode& root, const FieldInfo& version_field,
                                    const FieldInfo& length_field, const FieldInfo& protocol_field,
                                    uint64_t version, uint64_t length, const std::string& protocol);

    DecoderSettings settings_;
};

// Plain-text CoT documents are handed to the host's scraper.
using PlainTextHandler = std::function<void(const pb::ByteSpan& payload, FieldNode& root,
                                            DissectOutput& out)>;

class TakDissector : public Dissector {
public:
    explicit TakDissector(DecoderSettings settings = {}) : Dissector(settings) {}

    const char* name() const override { return "tak"; }

    void set_plain_text_handler(PlainTextHandler handler) { plain_text_ = std::move(handler); }

protected:
    size_t dissect_payload(const pb::ByteSpan& payload, DissectOutput& out) const override;
    const ExpertDef& malformed_expert() const override;

private:
    PlainTextHandler plain_text_;
};

class OmniDissector : public Dissector {
public:
    explicit OmniDissector(DecoderSettings settings = {}) : Dissector(settings) {}

    const char* name() const override { return "omni"; }

protected:
    size_t dissect_payload(const pb::ByteSpan& payload, DissectOutput& out) const override;
    const ExpertDef& malformed_expert() const override;
};
