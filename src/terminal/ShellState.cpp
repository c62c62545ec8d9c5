#include "ShellState.hpp"

namespace st {
namespace {
inline bool isContinuation(unsigned char c) { return (c & 0xC0) == 0x80; }
}  // namespace

void ShellState::appendOutput(const char* data, size_t length) {
  const unsigned char* bytes = (const unsigned char*)data;
  size_t i = 0;
  size_t dropped = 0;
  content.reserve(content.size() + length);
  while (i < length) {
    int sequenceLength = utf8SequenceLength(bytes + i, length - i);
    if (sequenceLength == 0) {
      dropped++;
      i++;
      continue;
    }
    content.append(data + i, sequenceLength);
    i += sequenceLength;
  }
  if (dropped) {
    VLOG(2) << "Dropped " << dropped << " bytes of invalid UTF-8";
  }
}

void ShellState::applySync(uint64_t serverSeq) {
  if (serverSeq < seq) {
    seqOutdatedCount++;
    if (seqOutdatedCount >= OUTDATED_SYNC_LIMIT) {
      VLOG(1) << "Server offset " << serverSeq << " is behind " << seq
              << ", resending";
      seq = serverSeq;
    }
  }
}

bool ShellState::hasPendingOutput() const {
  return contentOffset + content.length() > seq;
}

bool ShellState::nextChunk(string* plaintext, uint64_t* offset) {
  if (!hasPendingOutput()) {
    return false;
  }
  int64_t relative = int64_t(seq) - int64_t(contentOffset);
  size_t start = prevCharBoundary(content, relative);
  size_t end = prevCharBoundary(
      content, int64_t(std::min(start + CHUNK_SIZE, content.length())));
  if (end <= start) {
    STFATAL << "Empty chunk at " << start << " of " << content.length();
  }
  *plaintext = content.substr(start, end - start);
  *offset = contentOffset + start;
  seq = contentOffset + end;
  seqOutdatedCount = 0;
  return true;
}

size_t ShellState::prune() {
  if (content.length() <= PRUNE_BYTES ||
      int64_t(seq) - ROLLING_BYTES <= int64_t(contentOffset)) {
    return 0;
  }
  int64_t excess = (int64_t(seq) - ROLLING_BYTES) - int64_t(contentOffset);
  size_t pruned = prevCharBoundary(content, excess);
  content.erase(0, pruned);
  contentOffset += pruned;
  VLOG(1) << "Pruned " << pruned << " bytes, backlog now starts at "
          << contentOffset;
  return pruned;
}

size_t ShellState::prevCharBoundary(const string& s, int64_t index) {
  if (index >= int64_t(s.length())) {
    return s.length();
  }
  if (index <= 0) {
    return 0;
  }
  size_t i = size_t(index);
  while (i > 0 && isContinuation((unsigned char)s[i])) {
    i--;
  }
  return i;
}

int ShellState::utf8SequenceLength(const unsigned char* data,
                                   size_t available) {
  if (available == 0) {
    return 0;
  }
  unsigned char lead = data[0];
  if (lead < 0x80) {
    return 1;
  }

  int length;
  unsigned char low = 0x80;
  unsigned char high = 0xBF;
  if (lead >= 0xC2 && lead <= 0xDF) {
    length = 2;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    length = 3;
    if (lead == 0xE0) {
      // Overlong encodings
      low = 0xA0;
    } else if (lead == 0xED) {
      // Surrogates
      high = 0x9F;
    }
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    length = 4;
    if (lead == 0xF0) {
      low = 0x90;
    } else if (lead == 0xF4) {
      // Above U+10FFFF
      high = 0x8F;
    }
  } else {
    return 0;
  }

  if (available < size_t(length)) {
    return 0;
  }
  if (data[1] < low || data[1] > high) {
    return 0;
  }
  for (int i = 2; i < length; i++) {
    if (!isContinuation(data[i])) {
      return 0;
    }
  }
  return length;
}
}  // namespace st
