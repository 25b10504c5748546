#include <gtest/gtest.h>
#include <cosign/blake3/hash.hpp>
#include <cosign/digest/builder.hpp>
#include <cosign/digest/typed_data.hpp>
#include <cosign/testing/common.hpp>

#include <algorithm>
#include <set>

namespace {

cosign::digest::domain_t make_domain() {
  return cosign::digest::domain_t{
      .name = "treasury",
      .chain_id = 1,
      .verifying_module = cosign::testing::make_address(0xC0)};
}

cosign::schema::action_t make_execute() {
  return cosign::schema::execute_t{
      .target = cosign::testing::make_address(0x42),
      .value = cosign::schema::amount_t{1000},
      .payload = cosign::schema::bytes_t{0xDE, 0xAD, 0xBE, 0xEF}};
}

}  // namespace

TEST(digest_builder, encodes_unsigned_integers_big_endian) {
  auto b = cosign::digest::builder{};
  b.word(uint64_t{0x0102});
  ASSERT_EQ(b.data.size(), 32u);
  EXPECT_EQ(b.data[30], 0x01);
  EXPECT_EQ(b.data[31], 0x02);
  for (std::size_t i = 0; i < 30; ++i) {
    EXPECT_EQ(b.data[i], 0u);
  }
}

TEST(digest_builder, left_pads_addresses_and_booleans) {
  auto b = cosign::digest::builder{};
  b.word(cosign::testing::make_address(0xAA)).word(true).word(false);
  ASSERT_EQ(b.data.size(), 96u);
  for (std::size_t i = 0; i < 12; ++i) {
    EXPECT_EQ(b.data[i], 0u);
  }
  for (std::size_t i = 12; i < 32; ++i) {
    EXPECT_EQ(b.data[i], 0xAA);
  }
  EXPECT_EQ(b.data[63], 1u);
  EXPECT_EQ(b.data[95], 0u);
}

TEST(digest_builder, encodes_uint256_amounts_big_endian) {
  auto b = cosign::digest::builder{};
  auto value = (cosign::schema::amount_t{1} << 255) + 1;
  b.word(value);
  ASSERT_EQ(b.data.size(), 32u);
  EXPECT_EQ(b.data[0], 0x80);
  EXPECT_EQ(b.data[31], 0x01);
}

TEST(digest_builder, hashes_dynamic_data_into_one_word) {
  auto payload = cosign::schema::bytes_t{1, 2, 3};
  auto b = cosign::digest::builder{};
  b.hash(payload);
  auto expected = cosign::blake3::hash(payload);
  ASSERT_EQ(b.data.size(), 32u);
  EXPECT_TRUE(std::equal(std::begin(b.data), std::end(b.data),
                         std::begin(expected)));
}

TEST(typed_data, type_hashes_are_distinct) {
  auto hashes = std::set<cosign::schema::hash32_t>{
      cosign::digest::type_hash(cosign::digest::kDomainType),
      cosign::digest::type_hash(cosign::schema::action_kind::execute),
      cosign::digest::type_hash(cosign::schema::action_kind::update_quorum),
      cosign::digest::type_hash(cosign::schema::action_kind::update_signer)};
  EXPECT_EQ(hashes.size(), 4u);
}

TEST(typed_data, digest_prefixes_domain_and_struct_hash) {
  auto separator = cosign::digest::domain_separator(make_domain());
  auto struct_hash = cosign::digest::struct_hash(make_execute(), 1);

  auto preimage = cosign::schema::bytes_t{0x19, 0x01};
  preimage.insert(std::end(preimage), std::begin(separator),
                  std::end(separator));
  preimage.insert(std::end(preimage), std::begin(struct_hash),
                  std::end(struct_hash));

  EXPECT_EQ(cosign::digest::build_digest(separator, make_execute(), 1),
            cosign::blake3::hash(preimage));
}

TEST(typed_data, update_quorum_struct_hash_matches_word_layout) {
  auto b = cosign::digest::builder{};
  b.word(cosign::blake3::hash(cosign::digest::kUpdateQuorumType))
      .word(uint64_t{3})
      .word(uint64_t{9});
  EXPECT_EQ(cosign::digest::struct_hash(
                cosign::schema::update_quorum_t{.quorum = 3}, 9),
            cosign::blake3::hash(b.data));
}

TEST(typed_data, digest_is_deterministic) {
  auto separator = cosign::digest::domain_separator(make_domain());
  EXPECT_EQ(cosign::digest::build_digest(separator, make_execute(), 7),
            cosign::digest::build_digest(separator, make_execute(), 7));
  EXPECT_EQ(separator, cosign::digest::domain_separator(make_domain()));
}

TEST(typed_data, digest_changes_with_nonce_and_fields) {
  auto separator = cosign::digest::domain_separator(make_domain());
  auto base = cosign::digest::build_digest(separator, make_execute(), 1);

  EXPECT_NE(base, cosign::digest::build_digest(separator, make_execute(), 2));

  auto target = std::get<cosign::schema::execute_t>(make_execute());
  target.target = cosign::testing::make_address(0x43);
  EXPECT_NE(base, cosign::digest::build_digest(separator, target, 1));

  auto value = std::get<cosign::schema::execute_t>(make_execute());
  value.value += 1;
  EXPECT_NE(base, cosign::digest::build_digest(separator, value, 1));

  auto payload = std::get<cosign::schema::execute_t>(make_execute());
  payload.payload.push_back(0x00);
  EXPECT_NE(base, cosign::digest::build_digest(separator, payload, 1));
}

TEST(typed_data, digest_changes_with_every_domain_field) {
  auto base = cosign::digest::build_digest(
      cosign::digest::domain_separator(make_domain()), make_execute(), 1);

  auto name = make_domain();
  name.name = "treasury-2";
  auto chain = make_domain();
  chain.chain_id = 2;
  auto module = make_domain();
  module.verifying_module = cosign::testing::make_address(0xC1);

  for (const auto& domain : {name, chain, module}) {
    EXPECT_NE(base, cosign::digest::build_digest(
                        cosign::digest::domain_separator(domain),
                        make_execute(), 1));
  }
}

TEST(typed_data, action_kinds_never_share_a_digest) {
  auto separator = cosign::digest::domain_separator(make_domain());
  auto signer = cosign::testing::make_address(0x05);
  auto trust = cosign::digest::build_digest(
      separator, cosign::schema::update_signer_t{.signer = signer}, 1);
  auto distrust = cosign::digest::build_digest(
      separator,
      cosign::schema::update_signer_t{.signer = signer, .trust = false}, 1);
  auto quorum = cosign::digest::build_digest(
      separator, cosign::schema::update_quorum_t{.quorum = 1}, 1);
  EXPECT_NE(trust, distrust);
  EXPECT_NE(trust, quorum);
  EXPECT_NE(distrust, quorum);
}
