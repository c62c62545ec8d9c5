#include "EchoRunner.hpp"

namespace st {
void EchoRunner::run(uint32_t id, shared_ptr<StreamCipher> cipher,
                     shared_ptr<ShellQueue> input,
                     shared_ptr<OutputQueue> output,
                     shared_ptr<CancellationToken> token) {
  uint64_t seq = 0;
  ShellData item;
  while (input->pop(&item, token)) {
    if (item.type != ShellData::DATA) {
      continue;
    }
    sshx::ClientUpdate update;
    sshx::TerminalData* data = update.mutable_data();
    data->set_id(id);
    data->set_data(
        cipher->segment(SHELL_OUTPUT_STREAM_BASE | id, seq, item.data));
    data->set_seq(seq);
    if (!output->push(update, token)) {
      return;
    }
    seq += item.data.length();
  }
  VLOG(1) << "Echo shell " << id << " finished at " << seq;
}
}  // namespace st
