#ifndef __ST_SHELL_DATA__
#define __ST_SHELL_DATA__

#include "Headers.hpp"

namespace st {
/**
 * @brief Item routed from the controller to one shell task.
 */
struct ShellData {
  enum Type {
    /** Decrypted viewer input to write to the terminal. */
    DATA,
    /** Server acknowledged offset for this shell's output stream. */
    SYNC,
    /** New terminal dimensions. */
    SIZE,
  };

  ShellData() : type(DATA), seq(0), rows(0), cols(0) {}

  static ShellData input(const string& bytes) {
    ShellData item;
    item.type = DATA;
    item.data = bytes;
    return item;
  }

  static ShellData sync(uint64_t seq) {
    ShellData item;
    item.type = SYNC;
    item.seq = seq;
    return item;
  }

  static ShellData size(uint32_t rows, uint32_t cols) {
    ShellData item;
    item.type = SIZE;
    item.rows = rows;
    item.cols = cols;
    return item;
  }

  Type type;
  string data;
  uint64_t seq;
  uint32_t rows;
  uint32_t cols;
};
}  // namespace st

#endif  // __ST_SHELL_DATA__
