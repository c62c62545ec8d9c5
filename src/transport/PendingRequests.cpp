#include "PendingRequests.hpp"

namespace st {
string PendingRequests::registerRequest() {
  lock_guard<std::mutex> guard(slotMutex);
  string id = "req_" + to_string(++nextId);
  slots[id] = shared_ptr<Slot>(new Slot());
  return id;
}

sshx::CliResponse PendingRequests::waitFor(
    const string& id, std::chrono::milliseconds timeout,
    shared_ptr<CancellationToken> token) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  std::unique_lock<std::mutex> lock(slotMutex);
  auto it = slots.find(id);
  if (it == slots.end()) {
    throw runtime_error("Unknown request id " + id);
  }
  shared_ptr<Slot> slot = it->second;
  while (!slot->ready && !failed) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline || (token && token->isCancelled())) {
      break;
    }
    // Wake up periodically to notice cancellation
    auto slice = std::min<std::chrono::steady_clock::duration>(
        deadline - now, std::chrono::milliseconds(50));
    slotReady.wait_for(lock, slice);
  }
  slots.erase(id);
  if (slot->ready) {
    return slot->response;
  }
  if (failed) {
    throw runtime_error("Request " + id + " failed: " + failure);
  }
  if (token && token->isCancelled()) {
    throw runtime_error("Request " + id + " was cancelled");
  }
  throw runtime_error("Timed out waiting for response to " + id);
}

bool PendingRequests::deliver(const sshx::CliResponse& response) {
  {
    lock_guard<std::mutex> guard(slotMutex);
    auto it = slots.find(response.id());
    if (it == slots.end() || it->second->ready) {
      return false;
    }
    it->second->response = response;
    it->second->ready = true;
  }
  slotReady.notify_all();
  return true;
}

void PendingRequests::cancel(const string& id) {
  lock_guard<std::mutex> guard(slotMutex);
  slots.erase(id);
}

void PendingRequests::failAll(const string& reason) {
  {
    lock_guard<std::mutex> guard(slotMutex);
    if (!failed) {
      failed = true;
      failure = reason;
    }
  }
  slotReady.notify_all();
}

size_t PendingRequests::size() const {
  lock_guard<std::mutex> guard(slotMutex);
  return slots.size();
}
}  // namespace st
