#ifndef __ST_SHELL_STATE__
#define __ST_SHELL_STATE__

#include "Headers.hpp"

namespace st {
/**
 * @brief Rolling output backlog of one shell and its view of the server.
 *
 * `content` holds every byte of valid UTF-8 the shell has produced since
 * `contentOffset`. `seq` is the absolute offset the server is believed to
 * have received. After each chunk is taken, contentOffset <= seq <=
 * contentOffset + content.length() holds.
 */
class ShellState {
 public:
  /** @brief Largest plaintext carried by one Data message. */
  static constexpr size_t CHUNK_SIZE = 1 << 16;
  /** @brief Backlog always kept behind the acknowledged offset. */
  static constexpr int64_t ROLLING_BYTES = 8 << 20;
  /** @brief Content length that triggers pruning. */
  static constexpr size_t PRUNE_BYTES = 12 << 20;
  /** @brief Consecutive stale syncs after which the server value wins. */
  static constexpr int OUTDATED_SYNC_LIMIT = 3;

  ShellState() : contentOffset(0), seq(0), seqOutdatedCount(0) {}

  /**
   * @brief Appends terminal output, dropping bytes that do not start a
   * complete UTF-8 sequence.
   */
  void appendOutput(const char* data, size_t length);

  /**
   * @brief Applies a server reported offset.
   *
   * Only offsets behind the local one matter. After OUTDATED_SYNC_LIMIT of
   * them the server is assumed to have lost state and its offset is adopted.
   */
  void applySync(uint64_t serverSeq);

  /** @brief True if the server is behind the end of the buffered content. */
  bool hasPendingOutput() const;

  /**
   * @brief Takes the next chunk the server has not seen.
   *
   * The chunk starts and ends on character boundaries and is at most
   * CHUNK_SIZE bytes. Advances `seq` past it.
   * @param plaintext Receives the chunk.
   * @param offset Receives the absolute stream offset of the chunk.
   * @return false if there is nothing to send.
   */
  bool nextChunk(string* plaintext, uint64_t* offset);

  /**
   * @brief Discards old content once the buffer exceeds PRUNE_BYTES, keeping
   * ROLLING_BYTES before `seq`.
   * @return Number of bytes discarded.
   */
  size_t prune();

  uint64_t getContentOffset() const { return contentOffset; }
  uint64_t getSeq() const { return seq; }
  int getSeqOutdatedCount() const { return seqOutdatedCount; }
  const string& getContent() const { return content; }

  /**
   * @brief Moves `index` back to the start of the character containing it.
   * Indices past the end clamp to the length, negative ones to 0.
   */
  static size_t prevCharBoundary(const string& s, int64_t index);

  /**
   * @brief Length of the well formed UTF-8 sequence at `data`, or 0 if the
   * bytes are invalid or truncated.
   */
  static int utf8SequenceLength(const unsigned char* data, size_t available);

 protected:
  string content;
  uint64_t contentOffset;
  uint64_t seq;
  int seqOutdatedCount;
};
}  // namespace st

#endif  // __ST_SHELL_STATE__
