#pragma once

#include "schema.h"
#include <string>

// Tree builders for the OMNI BaseEvent and its oneof sub-events.

namespace omni {

// Shared Geopoint: 1 lat, 2 lon (raw doubles), 3-7 DoubleValue wrappers.
// Returns "LAT, LON".
std::string build_geopoint(BuildContext& ctx, const pb::ByteSpan& msg, FieldNode& parent);

// The event-type oneof of BaseEvent, in ascending field-number order.
const OneofTable& event_cases();

// BaseEvent. Returns the text the caller appends to the info column
// (" [TYPE #ENTITY]").
std::string build_base_event(BuildContext& ctx, const pb::ByteSpan& msg, FieldNode& parent);

} // namespace omni
