#include <cosign/execution/module_state.hpp>

namespace cosign::execution {

bool module_state::is_trusted(const cosign::schema::address_t& signer) const {
  return trusted.contains(signer);
}

bool module_state::set_trust(const cosign::schema::address_t& signer,
                             const bool trust) {
  if (trust) {
    return trusted.insert(signer).second;
  }
  return trusted.erase(signer) > 0;
}

uint64_t module_state::use_nonce() {
  return nonce++;
}

}  // namespace cosign::execution
