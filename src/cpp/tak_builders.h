#pragma once

#include "schema.h"
#include <string>

// Tree builders for the TAK protobuf payload (TakMessage and its children).

namespace tak {

struct CotSummary {
    std::string uid;
    std::string type;
};

// TakControl: adds the control node under parent, returns the contact uid.
std::string build_tak_control(BuildContext& ctx, const pb::ByteSpan& msg, FieldNode& parent);

// CotEvent: event core, point fields 10-14 and the detail container.
CotSummary build_cot_event(BuildContext& ctx, const pb::ByteSpan& msg, FieldNode& parent);

// TakMessage (1 = TakControl, 2 = CotEvent). Returns the text the caller
// appends to the info column (" [uid] type").
std::string build_tak_message(BuildContext& ctx, const pb::ByteSpan& msg, FieldNode& parent);

} // namespace tak
