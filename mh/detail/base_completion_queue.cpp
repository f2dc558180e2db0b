#include "mh/detail/base_completion_queue.hpp"
#include <mh/errors.hpp>
#include <mh/log.hpp>

#include <sstream>
#include <vector>

namespace mh {
namespace detail {

std::chrono::milliseconds constexpr base_completion_queue::loop_timeout;

base_completion_queue::base_completion_queue()
    : mu_()
    , pending_ops_()
    , start_mu_()
    , queue_()
    , shutdown_(false) {
}

base_completion_queue::~base_completion_queue() {
  if (not pending_ops_.empty()) {
    // The operations might point to objects already deleted, calling them is too risky.  We print the best debug
    // message we can and continue.
    std::ostringstream os;
    for (auto const& op : pending_ops_) {
      os << op.second->name << "\n";
    }
    MH_LOG(notice) << " completion queue deleted while holding " << pending_ops_.size()
                   << " pending operations: " << os.str();
  }
}

void base_completion_queue::run() {
  void* tag = nullptr;
  bool ok = false;
  for (;;) {
    auto deadline = std::chrono::system_clock::now() + loop_timeout;

    auto status = queue_.AsyncNext(&tag, &ok, deadline);
    if (status == grpc::CompletionQueue::SHUTDOWN) {
      MH_LOG(trace) << "shutdown, exit loop";
      break;
    }
    if (status == grpc::CompletionQueue::TIMEOUT) {
      MH_LOG(trace) << "timeout, continue loop";
      continue;
    }
    if (tag == nullptr) {
      continue;
    }

    // ... try to find the operation in our list of known operations ...
    std::shared_ptr<base_async_op> op = unregister_op(tag);
    if (not op) {
      MH_LOG(error) << "Unknown tag reported in asynchronous operation: " << std::hex << std::intptr_t(tag);
      continue;
    }
    // ... it was there, now it is removed, and the lock is released, call it.  Anything that completes after
    // shutdown() is reported as cancelled ...
    op->callback(*op, ok and not shutdown_.load());
  }
}

void base_completion_queue::shutdown() {
  std::vector<std::shared_ptr<base_async_op>> pending;
  {
    std::lock_guard<std::recursive_mutex> start_lock(start_mu_);
    if (shutdown_.exchange(true)) {
      return;
    }
    MH_LOG(trace) << "shutting down queue";
    std::lock_guard<std::mutex> lock(mu_);
    for (auto const& i : pending_ops_) {
      pending.push_back(i.second);
    }
  }
  // ... cancel everything so the loop can drain the queue promptly ...
  for (auto const& op : pending) {
    op->cancel();
  }
  queue_.Shutdown();
}

void* base_completion_queue::register_op(char const* where, std::shared_ptr<base_async_op> op) {
  void* tag = static_cast<void*>(op.get());
  auto key = reinterpret_cast<std::intptr_t>(tag);
  std::lock_guard<std::mutex> lock(mu_);
  auto r = pending_ops_.emplace(key, op);
  MH_ASSERT_THROW(r.second != false);
  return tag;
}

std::shared_ptr<base_async_op> base_completion_queue::unregister_op(void* tag) {
  std::lock_guard<std::mutex> lock(mu_);
  pending_ops_type::iterator i = pending_ops_.find(reinterpret_cast<std::intptr_t>(tag));
  if (i != pending_ops_.end()) {
    auto op = i->second;
    pending_ops_.erase(i);
    return op;
  }
  return std::shared_ptr<base_async_op>();
}

} // namespace detail
} // namespace mh
