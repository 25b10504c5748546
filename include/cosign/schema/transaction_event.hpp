#pragma once

#include <cosign/schema/transaction_event_attribute.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Schema type: transaction event.
// Emitted once per applied action (`Executed`, `QuorumUpdated`,
// `SignerUpdated`) and appended to the persisted event log. Replaying the
// `SignerUpdated` stream is the only way to list the trusted set.
namespace cosign::schema {

template <uint16_t Version>
struct transaction_event;

template <>
struct transaction_event<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  std::string type;
  std::vector<transaction_event_attribute_t> attributes;

  bool operator==(const transaction_event&) const = default;
};

using transaction_event_t = transaction_event<1>;

inline constexpr std::string_view kExecutedEvent{"Executed"};
inline constexpr std::string_view kQuorumUpdatedEvent{"QuorumUpdated"};
inline constexpr std::string_view kSignerUpdatedEvent{"SignerUpdated"};

/// Value of the first attribute named `key`, if any.
std::optional<std::string> find_attribute(const transaction_event_t& event,
                                          std::string_view key);

}  // namespace cosign::schema
