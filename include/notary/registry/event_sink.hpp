#pragma once

#include <notary/schema/claim_event.hpp>
#include <functional>

namespace notary::registry {

/// Receives exactly one event per successful claim operation.
using event_sink_t = std::function<void(const notary::schema::claim_event_t&)>;

/// Supplies the logical time recorded as a proof's created_at.
using logical_clock_t = std::function<notary::schema::block_height_t()>;

}  // namespace notary::registry
