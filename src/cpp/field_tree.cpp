#include "field_tree.h"

#include <spdlog/spdlog.h>

FieldNode& FieldNode::add(const FieldInfo& field, FieldValue v) {
    children.emplace_back();
    FieldNode& child = children.back();
    child.info = &field;
    child.value = std::move(v);
    child.offset = offset;
    return child;
}

FieldNode& FieldNode::add(const FieldInfo& field, const pb::ByteSpan& range, FieldValue v) {
    FieldNode& child = add(field, std::move(v));
    child.set_range(range);
    return child;
}

void FieldNode::set_range(const pb::ByteSpan& range) {
    offset = range.origin();
    length = range.size();
}

const FieldNode* FieldNode::find(const std::string& abbrev_name) const {
    if (info && abbrev_name == info->abbrev) return this;
    for (const auto& c : children) {
        if (auto* hit = c.find(abbrev_name)) return hit;
    }
    return nullptr;
}

std::vector<const FieldNode*> FieldNode::find_all(const std::string& abbrev_name) const {
    std::vector<const FieldNode*> out;
    if (info && abbrev_name == info->abbrev) out.push_back(this);
    for (const auto& c : children) {
        auto sub = c.find_all(abbrev_name);
        out.insert(out.end(), sub.begin(), sub.end());
    }
    return out;
}

std::string FieldNode::display() const {
    std::string text = !label.empty() ? label : (info ? info->name : "");
    if (field_has_value(value)) {
        text += ": ";
        text += field_to_string(value);
    }
    return text + summary;
}

void DissectOutput::add_expert(const ExpertDef& def, const std::string& message) {
    if (def.severity == ExpertDef::Severity::ERROR) {
        spdlog::debug("{}: {}", def.abbrev, message);
    } else {
        spdlog::trace("{}: {}", def.abbrev, message);
    }
    experts.push_back(ExpertInfo{&def, message});
}

bool DissectOutput::has_expert(const ExpertDef& def) const {
    for (const auto& e : experts) {
        if (e.def == &def) return true;
    }
    return false;
}
