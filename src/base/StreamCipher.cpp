#include "StreamCipher.hpp"

#include <argon2.h>
#include <openssl/evp.h>

#define OPENSSL_FAIL(X)                                         \
  {                                                             \
    int rc = (X);                                               \
    if ((rc) != 1) STFATAL << "OpenSSL Error: (" << rc << ")"; \
  }

namespace st {
namespace {
const char* KDF_SALT =
    "This is a non-random salt for sshx.io, since we want to stretch the "
    "security of 83-bit keys!";

void storeBigEndian64(unsigned char* out, uint64_t value) {
  for (int i = 0; i < 8; i++) {
    out[i] = (unsigned char)((value >> (56 - 8 * i)) & 0xff);
  }
}
}  // namespace

StreamCipher::StreamCipher(const string& secret) {
  if (-1 == sodium_init()) {
    STFATAL << "libsodium init failed";
  }
  int rc = argon2id_hash_raw(KDF_ITERATIONS, KDF_MEMORY_KIB, KDF_LANES,
                             secret.data(), secret.length(), KDF_SALT,
                             strlen(KDF_SALT), key, KEY_LENGTH);
  if (rc != ARGON2_OK) {
    STFATAL << "Argon2id key derivation failed: " << argon2_error_message(rc);
  }
}

StreamCipher::~StreamCipher() { sodium_memzero(key, sizeof(key)); }

string StreamCipher::zeroBlock() const {
  unsigned char iv[16];
  memset(iv, 0, sizeof(iv));
  return applyKeystream(iv, 0, string(16, '\0'));
}

string StreamCipher::segment(uint64_t streamId, uint64_t offset,
                             const string& data) const {
  if (streamId == 0) {
    STFATAL << "Stream ID must be nonzero";
  }
  unsigned char iv[16];
  storeBigEndian64(iv, streamId);
  storeBigEndian64(iv + 8, offset / 16);
  return applyKeystream(iv, int(offset % 16), data);
}

string StreamCipher::applyKeystream(const unsigned char* iv, int skip,
                                    const string& data) const {
  unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)> ctx(
      EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
  if (!ctx) {
    STFATAL << "Could not allocate cipher context";
  }
  OPENSSL_FAIL(
      EVP_EncryptInit_ex(ctx.get(), EVP_aes_128_ctr(), NULL, key, iv));

  int outLength = 0;
  if (skip > 0) {
    // Advance the counter mode position to the true byte offset
    unsigned char zeros[16];
    unsigned char discard[16];
    memset(zeros, 0, sizeof(zeros));
    OPENSSL_FAIL(
        EVP_EncryptUpdate(ctx.get(), discard, &outLength, zeros, skip));
  }

  string retval(data.length(), '\0');
  if (!data.empty()) {
    OPENSSL_FAIL(EVP_EncryptUpdate(
        ctx.get(), (unsigned char*)&retval[0], &outLength,
        (const unsigned char*)data.data(), int(data.length())));
    if (size_t(outLength) != data.length()) {
      STFATAL << "Short keystream output: " << outLength << " != "
              << data.length();
    }
  }
  return retval;
}
}  // namespace st
