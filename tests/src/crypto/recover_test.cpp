#include <gtest/gtest.h>
#include <cosign/blake3/hash.hpp>
#include <cosign/crypto/recover.hpp>
#include <cosign/crypto/signing_key.hpp>
#include <cosign/testing/common.hpp>

#include <boost/multiprecision/cpp_int.hpp>

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <string_view>
#include <vector>

namespace {

cosign::schema::hash32_t make_digest(const std::string_view message) {
  return cosign::blake3::hash(message);
}

// secp256k1 group order, big-endian.
cosign::schema::hash32_t curve_order() {
  return cosign::schema::make_hash32(std::string_view{
      "fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141"});
}

bool is_low_s(const cosign::schema::hash32_t& s) {
  auto half = cosign::schema::make_hash32(std::string_view{
      "7fffffffffffffffffffffffffffffff5d576e7357a4501ddfe92f46681b20a0"});
  return s <= half;
}

// n - s, the high-s twin of a low-s value.
cosign::schema::hash32_t negate_s(const cosign::schema::hash32_t& s) {
  using boost::multiprecision::uint256_t;
  auto order = curve_order();
  auto n = uint256_t{};
  auto value = uint256_t{};
  boost::multiprecision::import_bits(n, std::begin(order), std::end(order));
  boost::multiprecision::import_bits(value, std::begin(s), std::end(s));

  auto bytes = std::vector<uint8_t>{};
  boost::multiprecision::export_bits(uint256_t{n - value},
                                     std::back_inserter(bytes), 8);
  auto out = cosign::schema::hash32_t{};
  std::copy(std::begin(bytes), std::end(bytes),
            std::end(out) - static_cast<std::ptrdiff_t>(bytes.size()));
  return out;
}

}  // namespace

TEST(crypto_recover, recovers_signer_address) {
  auto key = cosign::crypto::signing_key::generate();
  auto digest = make_digest("execute");
  auto signature = key.sign(digest);

  EXPECT_TRUE(signature.v == 27 || signature.v == 28);
  EXPECT_TRUE(is_low_s(signature.s));

  auto public_key = cosign::crypto::recover_public_key(digest, signature);
  ASSERT_TRUE(public_key.has_value());
  EXPECT_EQ(*public_key, key.public_key());

  auto signer = cosign::crypto::recover_signer(digest, signature);
  ASSERT_TRUE(signer.has_value());
  EXPECT_EQ(*signer, key.address());
}

TEST(crypto_recover, accepts_zero_based_recovery_id) {
  auto key = cosign::crypto::signing_key::generate();
  auto digest = make_digest("zero-based");
  auto signature = key.sign(digest);
  signature.v = static_cast<uint8_t>(signature.v - 27);

  auto signer = cosign::crypto::recover_signer(digest, signature);
  ASSERT_TRUE(signer.has_value());
  EXPECT_EQ(*signer, key.address());
}

TEST(crypto_recover, accepts_high_s_twin) {
  auto key = cosign::crypto::signing_key::generate();
  auto digest = make_digest("high-s");
  auto signature = key.sign(digest);

  auto twin = signature;
  twin.s = negate_s(signature.s);
  twin.v = signature.v == 27 ? 28 : 27;
  EXPECT_FALSE(is_low_s(twin.s));

  auto signer = cosign::crypto::recover_signer(digest, twin);
  ASSERT_TRUE(signer.has_value());
  EXPECT_EQ(*signer, key.address());
}

TEST(crypto_signing_key, signatures_are_deterministic) {
  auto key = cosign::crypto::signing_key::generate();
  auto digest = make_digest("rfc6979");
  auto first = key.sign(digest);
  auto second = key.sign(digest);
  EXPECT_EQ(first.r, second.r);
  EXPECT_EQ(first.s, second.s);
  EXPECT_EQ(first.v, second.v);
}

TEST(crypto_recover, other_digest_recovers_other_identity) {
  auto key = cosign::crypto::signing_key::generate();
  auto signature = key.sign(make_digest("one"));
  auto signer = cosign::crypto::recover_signer(make_digest("two"), signature);
  if (signer.has_value()) {
    EXPECT_NE(*signer, key.address());
  }
}

TEST(crypto_recover, flipped_recovery_id_recovers_other_identity) {
  auto key = cosign::crypto::signing_key::generate();
  auto digest = make_digest("flip");
  auto signature = key.sign(digest);
  signature.v = signature.v == 27 ? 28 : 27;
  auto signer = cosign::crypto::recover_signer(digest, signature);
  if (signer.has_value()) {
    EXPECT_NE(*signer, key.address());
  }
}

TEST(crypto_recover, rejects_malformed_signatures) {
  auto key = cosign::crypto::signing_key::generate();
  auto digest = make_digest("malformed");
  auto valid = key.sign(digest);

  auto bad_v = valid;
  bad_v.v = 29;
  EXPECT_FALSE(cosign::crypto::recover_signer(digest, bad_v).has_value());

  auto zero_r = valid;
  zero_r.r = cosign::schema::make_zero_hash();
  EXPECT_FALSE(cosign::crypto::recover_signer(digest, zero_r).has_value());

  auto zero_s = valid;
  zero_s.s = cosign::schema::make_zero_hash();
  EXPECT_FALSE(cosign::crypto::recover_signer(digest, zero_s).has_value());

  auto big_s = valid;
  big_s.s = curve_order();
  EXPECT_FALSE(cosign::crypto::recover_signer(digest, big_s).has_value());

  EXPECT_FALSE(cosign::crypto::recover_signer(digest, cosign::schema::signature_t{})
                   .has_value());
}

TEST(crypto_signing_key, private_key_round_trips) {
  auto key = cosign::crypto::signing_key::generate();
  auto restored =
      cosign::crypto::signing_key::from_private_key(key.private_key());
  ASSERT_TRUE(restored.has_value());
  EXPECT_EQ(restored->address(), key.address());
  EXPECT_EQ(restored->public_key(), key.public_key());
  EXPECT_EQ(cosign::crypto::address_of(key.public_key()), key.address());
}

TEST(crypto_signing_key, rejects_out_of_range_private_keys) {
  EXPECT_FALSE(cosign::crypto::signing_key::from_private_key(
                   cosign::schema::make_zero_hash())
                   .has_value());
  EXPECT_FALSE(
      cosign::crypto::signing_key::from_private_key(curve_order()).has_value());
}

TEST(crypto_signing_key, deterministic_keys_have_distinct_addresses) {
  auto keys = cosign::testing::make_signing_keys(7);
  ASSERT_EQ(keys.size(), 7u);
  for (std::size_t i = 1; i < keys.size(); ++i) {
    EXPECT_LT(keys[i - 1].address(), keys[i].address());
  }
}

TEST(crypto_address, is_low_twenty_bytes_of_public_key_hash) {
  auto public_key = cosign::crypto::public_key_t{};
  public_key.fill(0x07);
  auto hash = cosign::blake3::hash(public_key);
  auto address = cosign::crypto::address_of(public_key);
  EXPECT_TRUE(std::equal(std::begin(address), std::end(address),
                         std::begin(hash) + 12));
}
