#ifndef __ST_STREAM_CIPHER__
#define __ST_STREAM_CIPHER__

#include "Headers.hpp"

namespace st {

/**
 * @brief Seekable AES-128-CTR keyed by a stretched, human shareable secret.
 *
 * Every logical stream (one per shell output, one for viewer input) has its
 * own 64 bit stream id, and any byte range of a stream can be encrypted or
 * decrypted without touching the bytes before it.
 */
class StreamCipher {
 public:
  /** @brief Argon2id parameters used to stretch session secrets. */
  static constexpr uint32_t KDF_ITERATIONS = 2;
  static constexpr uint32_t KDF_MEMORY_KIB = 19 * 1024;
  static constexpr uint32_t KDF_LANES = 1;
  static constexpr uint32_t KEY_LENGTH = 16;

  /**
   * @brief Derives the 128 bit key from `secret` with Argon2id.
   * @param secret Session encryption key or write password.
   */
  explicit StreamCipher(const string& secret);
  ~StreamCipher();

  /**
   * @brief Encrypts a block of zeros under IV 0.
   *
   * The server stores this value so viewers can check that they hold the
   * right secret without the server ever learning it.
   */
  string zeroBlock() const;

  /**
   * @brief Encrypts or decrypts `data` located at `offset` in stream
   * `streamId`.
   * @param streamId Nonzero stream identifier, placed in the upper half of
   * the IV.
   * @param offset Absolute byte offset of `data[0]` within the stream.
   */
  string segment(uint64_t streamId, uint64_t offset, const string& data) const;

 protected:
  string applyKeystream(const unsigned char* iv, int skip,
                        const string& data) const;

  unsigned char key[KEY_LENGTH];
};
}  // namespace st

#endif  // __ST_STREAM_CIPHER__
