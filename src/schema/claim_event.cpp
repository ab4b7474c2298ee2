#include <notary/schema/claim_event.hpp>
#include <notary/schema/enum_string.hpp>

#include <array>
#include <utility>

namespace notary::schema {

namespace {

constexpr auto kClaimEventKindNames =
    std::array<std::pair<std::string_view, claim_event_kind>, 3>{{
        {"claim_created", claim_event_kind::claim_created},
        {"claim_transfered", claim_event_kind::claim_transfered},
        {"claim_revoked", claim_event_kind::claim_revoked},
    }};

}  // namespace

std::string_view to_string(const claim_event_kind kind) {
  return to_string(kind, kClaimEventKindNames).value_or("unknown");
}

}  // namespace notary::schema
