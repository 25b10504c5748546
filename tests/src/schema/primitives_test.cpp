#include <gtest/gtest.h>
#include <cosign/schema/action.hpp>
#include <cosign/schema/primitives.hpp>
#include <cosign/schema/transaction_result.hpp>

#include <limits>
#include <string>
#include <string_view>

TEST(primitives, make_hash32_from_hex_string_decodes) {
  auto hash = cosign::schema::make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  EXPECT_EQ(hash[0], 0x01);
  EXPECT_EQ(hash[31], 0x20);
}

TEST(primitives, make_zero_hash_returns_zero_bytes) {
  auto zero = cosign::schema::make_zero_hash();
  for (auto byte : zero) {
    EXPECT_EQ(byte, 0u);
  }
}

TEST(primitives, hex_round_trips_bytes_with_or_without_prefix) {
  auto payload = cosign::schema::bytes_t{0x00, 0x01, 0xAB, 0xFE, 0xFF};
  auto encoded = cosign::schema::to_hex(payload);
  EXPECT_EQ(encoded, "0001abfeff");
  EXPECT_EQ(cosign::schema::from_hex(encoded), payload);
  EXPECT_EQ(cosign::schema::from_hex("0x" + encoded), payload);
  EXPECT_EQ(cosign::schema::from_hex("0001ABFEFF"), payload);
}

TEST(primitives, try_from_hex_rejects_odd_length_and_bad_digits) {
  EXPECT_FALSE(cosign::schema::try_from_hex("abc").has_value());
  EXPECT_FALSE(cosign::schema::try_from_hex("zz").has_value());
  auto empty = cosign::schema::try_from_hex("0x");
  ASSERT_TRUE(empty.has_value());
  EXPECT_TRUE(empty->empty());
}

TEST(primitives, try_make_address_requires_twenty_bytes) {
  auto address = cosign::schema::try_make_address(
      "0x00000000000000000000000000000000000000ff");
  ASSERT_TRUE(address.has_value());
  EXPECT_EQ((*address)[19], 0xFF);
  EXPECT_FALSE(cosign::schema::try_make_address("0x00ff").has_value());
  EXPECT_FALSE(cosign::schema::try_make_hash32("0x00ff").has_value());
}

TEST(primitives, address_ordering_is_big_endian_numeric) {
  auto low = cosign::schema::make_address(
      "0x00000000000000000000000000000000000000ff");
  auto high = cosign::schema::make_address(
      "0x0000000000000000000000000000000000000100");
  EXPECT_LT(low, high);
  EXPECT_LT(cosign::schema::make_zero_address(), low);
}

TEST(primitives, try_make_amount_parses_full_uint256_range) {
  auto max = std::numeric_limits<cosign::schema::amount_t>::max();
  auto text = cosign::schema::to_string(max);
  auto parsed = cosign::schema::try_make_amount(text);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, max);

  // max + 1
  auto overflow = text;
  overflow.back() = static_cast<char>(overflow.back() + 1);
  EXPECT_FALSE(cosign::schema::try_make_amount(overflow).has_value());
  EXPECT_FALSE(cosign::schema::try_make_amount("").has_value());
  EXPECT_FALSE(cosign::schema::try_make_amount("-1").has_value());
  EXPECT_FALSE(cosign::schema::try_make_amount("12a").has_value());
  EXPECT_EQ(*cosign::schema::try_make_amount("1000000000000000000"),
            cosign::schema::amount_t{1000000000000000000ull});
}

TEST(primitives, try_make_amount_reads_decimal_only) {
  // Leading zeros stay decimal rather than switching to octal.
  EXPECT_EQ(*cosign::schema::try_make_amount("0010"),
            cosign::schema::amount_t{10});
  EXPECT_EQ(*cosign::schema::try_make_amount("000"),
            cosign::schema::amount_t{0});
  EXPECT_FALSE(cosign::schema::try_make_amount("0x10").has_value());
  EXPECT_FALSE(cosign::schema::try_make_amount("+5").has_value());
  EXPECT_FALSE(cosign::schema::try_make_amount(" 5").has_value());

  // Far past 2^256 with leading zeros in front.
  auto huge = std::string(90, '9');
  EXPECT_FALSE(cosign::schema::try_make_amount("00" + huge).has_value());
  auto padded_max =
      "000" + cosign::schema::to_string(
                  std::numeric_limits<cosign::schema::amount_t>::max());
  EXPECT_EQ(*cosign::schema::try_make_amount(padded_max),
            std::numeric_limits<cosign::schema::amount_t>::max());
}

TEST(primitives, signature_wire_form_is_r_s_v) {
  auto wire = cosign::schema::bytes_t(cosign::schema::kSignatureWireSize);
  wire[0] = 0x11;
  wire[32] = 0x22;
  wire[64] = 27;
  auto signature = cosign::schema::make_signature(wire);
  ASSERT_TRUE(signature.has_value());
  EXPECT_EQ(signature->r[0], 0x11);
  EXPECT_EQ(signature->s[0], 0x22);
  EXPECT_EQ(signature->v, 27);
  EXPECT_EQ(cosign::schema::to_bytes(*signature), wire);

  wire.pop_back();
  EXPECT_FALSE(cosign::schema::make_signature(wire).has_value());
}

TEST(primitives, action_kind_names_match_command_spelling) {
  EXPECT_EQ(cosign::schema::try_make_action_kind("execute"),
            cosign::schema::action_kind::execute);
  EXPECT_EQ(cosign::schema::try_make_action_kind("set-quorum"),
            cosign::schema::action_kind::update_quorum);
  EXPECT_EQ(cosign::schema::try_make_action_kind("set-signer"),
            cosign::schema::action_kind::update_signer);
  EXPECT_FALSE(cosign::schema::try_make_action_kind("transfer").has_value());

  auto action = cosign::schema::action_t{cosign::schema::update_quorum_t{}};
  EXPECT_EQ(cosign::schema::kind_of(action),
            cosign::schema::action_kind::update_quorum);
  EXPECT_EQ(cosign::schema::to_string(cosign::schema::kind_of(action)),
            "set-quorum");
}

TEST(primitives, error_results_carry_code_and_name) {
  auto result = cosign::schema::make_error_result(
      cosign::schema::transaction_error_code::signature_index_out_of_range,
      "cosign.execute", "signature 3 missing");
  EXPECT_FALSE(result.ok());
  EXPECT_EQ(result.code, 3u);
  EXPECT_EQ(result.log, "signature index out of range");
  EXPECT_EQ(result.codespace, "cosign.execute");
  EXPECT_EQ(result.info, "signature 3 missing");
  EXPECT_TRUE(result.events.empty());

  EXPECT_EQ(cosign::schema::to_string(
                cosign::schema::transaction_error_code::reentrant_call),
            "reentrant call");
}
