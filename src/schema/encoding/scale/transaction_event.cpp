#include <cosign/schema/encoding/scale/transaction_event.hpp>

using namespace cosign::schema;

namespace cosign::schema::encoding::scale {

bytes_t encode(encoder<scale_encoder_tag>& encoder,
               const transaction_event_t& event) {
  auto attributes = std::vector<event_attribute_row_t>{};
  attributes.reserve(event.attributes.size());
  for (const auto& attribute : event.attributes) {
    attributes.emplace_back(attribute.key, attribute.value, attribute.index);
  }
  return encoder.encode(
      event_row_t{event.version, event.sequence, event.type, attributes});
}

std::optional<transaction_event_t> try_decode_event(
    encoder<scale_encoder_tag>& encoder,
    const bytes_view_t& bytes) {
  auto decoded = encoder.try_decode<event_row_t>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  auto& [version, sequence, type, attributes] = *decoded;
  if (version != 1) {
    return std::nullopt;
  }
  auto event = transaction_event_t{};
  event.sequence = sequence;
  event.type = std::move(type);
  event.attributes.reserve(attributes.size());
  for (auto& [key, value, index] : attributes) {
    event.attributes.push_back(transaction_event_attribute_t{
        .key = std::move(key), .value = std::move(value), .index = index});
  }
  return event;
}

}  // namespace cosign::schema::encoding::scale
