#pragma once

#include "field_value.h"
#include "pb_wire.h"
#include <cstdint>
#include <list>
#include <string>
#include <vector>

// ── Static field / expert registrations ──

enum class FieldType { NONE, STRING, UINT8, UINT32, UINT64, DOUBLE };

struct FieldInfo {
    const char* abbrev;   // filter name, e.g. "tak.cot.uid"
    const char* name;     // display name, e.g. "UID"
    FieldType type;
};

struct ExpertDef {
    enum class Group { MALFORMED, UNDECODED };
    enum class Severity { WARN, ERROR };

    const char* abbrev;
    const char* summary;
    Group group;
    Severity severity;
};

struct ExpertInfo {
    const ExpertDef* def = nullptr;
    std::string message;
};

// ── Result tree ──

// One node of the dissection tree. offset/length locate the bytes the node
// covers in the top-level payload (length 0 = no highlight). summary is
// text appended after the value, e.g. ": 45.000000, -75.000000".
struct FieldNode {
    const FieldInfo* info = nullptr;
    std::string label;         // overrides info->name when set
    FieldValue value;
    size_t offset = 0;
    size_t length = 0;
    std::string summary;
    std::list<FieldNode> children;   // list: references stay valid while siblings are added

    FieldNode& add(const FieldInfo& field, FieldValue v = {});
    FieldNode& add(const FieldInfo& field, const pb::ByteSpan& range, FieldValue v = {});

    void append_text(const std::string& text) { summary += text; }
    void set_range(const pb::ByteSpan& range);

    const char* abbrev() const { return info ? info->abbrev : ""; }

    // Depth-first lookup by filter name (this node included).
    const FieldNode* find(const std::string& abbrev) const;
    std::vector<const FieldNode*> find_all(const std::string& abbrev) const;

    // "Name: value" followed by summary, as a tree view would print it.
    std::string display() const;
};

// Everything one dissect call produces for the host.
struct DissectOutput {
    FieldNode root;
    std::string protocol_column;
    std::string info_column;
    std::vector<ExpertInfo> experts;

    void add_expert(const ExpertDef& def, const std::string& message);
    bool has_expert(const ExpertDef& def) const;
};
