#include "digest.hpp"
#include "error.hpp"

#ifdef ZXBOOT_HAVE_SODIUM
#include <sodium.h>
#endif

namespace zxboot {

#ifdef ZXBOOT_HAVE_SODIUM
Blake2bVerifier::Blake2bVerifier(const std::vector<uint8_t> &expected)
    : expected_(expected) {
  if (sodium_init() < 0)
    throw BootError(FatalCode::Internal, "libsodium initialization failed");
  if (expected_.size() != kDigestSize)
    throw BootError(FatalCode::Internal, "digest must be 32 bytes");
  state_ = sodium_malloc(crypto_generichash_statebytes());
  if (!state_)
    throw BootError(FatalCode::Internal, "out of memory for digest state");
  crypto_generichash_init(
      static_cast<crypto_generichash_state *>(state_), nullptr, 0,
      kDigestSize);
}

Blake2bVerifier::~Blake2bVerifier() {
  sodium_free(state_);
}

void Blake2bVerifier::update(const uint8_t *data, size_t len) {
  if (finalized_)
    throw BootError(FatalCode::Internal, "digest already finalized");
  crypto_generichash_update(
      static_cast<crypto_generichash_state *>(state_), data, len);
}

bool Blake2bVerifier::verify() {
  if (finalized_)
    throw BootError(FatalCode::Internal, "digest already finalized");
  finalized_ = true;
  uint8_t out[kDigestSize];
  crypto_generichash_final(
      static_cast<crypto_generichash_state *>(state_), out,
      sizeof(out));
  return sodium_memcmp(out, expected_.data(), sizeof(out)) == 0;
}
#endif

} // namespace zxboot
