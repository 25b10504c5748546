#pragma once

#include <cosign/schema/encoding/scale/encoder.hpp>
#include <cosign/schema/transaction_event.hpp>

#include <string>
#include <tuple>
#include <vector>

// Persisted layout of a transaction event:
// (version, sequence, type, [(key, value, index)...])
namespace cosign::schema::encoding::scale {

using event_attribute_row_t = std::tuple<std::string, std::string, bool>;
using event_row_t = std::tuple<uint16_t,
                               uint64_t,
                               std::string,
                               std::vector<event_attribute_row_t>>;

bytes_t encode(encoder<scale_encoder_tag>& encoder,
               const transaction_event_t& event);

std::optional<transaction_event_t> try_decode_event(
    encoder<scale_encoder_tag>& encoder,
    const bytes_view_t& bytes);

}  // namespace cosign::schema::encoding::scale
