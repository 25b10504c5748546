#include <cosign/blake3/hash.hpp>
#include <cosign/crypto/detail/secp256k1.hpp>
#include <cosign/crypto/recover.hpp>

#include <algorithm>
#include <array>
#include <memory>

namespace cosign::crypto {

namespace {

using context_ptr =
    std::unique_ptr<secp256k1_context, decltype(&secp256k1_context_destroy)>;

std::optional<int> recovery_id_of(const uint8_t v) {
  if (v == 0 || v == 1) {
    return v;
  }
  if (v == 27 || v == 28) {
    return v - 27;
  }
  return std::nullopt;
}

}  // namespace

namespace detail {

const secp256k1_context* context() {
  static const auto shared = context_ptr{
      secp256k1_context_create(SECP256K1_CONTEXT_SIGN |
                               SECP256K1_CONTEXT_VERIFY),
      secp256k1_context_destroy};
  return shared.get();
}

std::optional<public_key_t> serialize_public_key(
    const secp256k1_pubkey& public_key) {
  auto encoded = std::array<uint8_t, 65>{};
  auto size = encoded.size();
  if (secp256k1_ec_pubkey_serialize(context(), encoded.data(), &size,
                                    &public_key,
                                    SECP256K1_EC_UNCOMPRESSED) != 1 ||
      size != encoded.size() || encoded[0] != 0x04) {
    return std::nullopt;
  }
  auto out = public_key_t{};
  std::copy(std::begin(encoded) + 1, std::end(encoded), std::begin(out));
  return out;
}

}  // namespace detail

cosign::schema::address_t address_of(const public_key_t& public_key) {
  auto hash = cosign::blake3::hash(
      std::span<const uint8_t>{public_key.data(), public_key.size()});
  auto address = cosign::schema::address_t{};
  std::copy_n(hash.data() + (hash.size() - address.size()), address.size(),
              address.data());
  return address;
}

std::optional<public_key_t> recover_public_key(
    const cosign::schema::hash32_t& digest,
    const cosign::schema::signature_t& signature) {
  auto recovery_id = recovery_id_of(signature.v);
  if (!recovery_id) {
    return std::nullopt;
  }

  auto compact = std::array<uint8_t, 64>{};
  std::copy(std::begin(signature.r), std::end(signature.r),
            std::begin(compact));
  std::copy(std::begin(signature.s), std::end(signature.s),
            std::begin(compact) + signature.r.size());

  // parse_compact rejects r or s >= n; recover rejects zero values and an r
  // with no matching curve point.
  auto recoverable = secp256k1_ecdsa_recoverable_signature{};
  if (secp256k1_ecdsa_recoverable_signature_parse_compact(
          detail::context(), &recoverable, compact.data(), *recovery_id) !=
      1) {
    return std::nullopt;
  }
  auto public_key = secp256k1_pubkey{};
  if (secp256k1_ecdsa_recover(detail::context(), &public_key, &recoverable,
                              digest.data()) != 1) {
    return std::nullopt;
  }
  return detail::serialize_public_key(public_key);
}

std::optional<cosign::schema::address_t> recover_signer(
    const cosign::schema::hash32_t& digest,
    const cosign::schema::signature_t& signature) {
  auto public_key = recover_public_key(digest, signature);
  if (!public_key) {
    return std::nullopt;
  }
  return address_of(*public_key);
}

}  // namespace cosign::crypto
