#include "mh/active_completion_queue.hpp"
#include <mh/log.hpp>

namespace mh {

active_completion_queue::active_completion_queue(std::string name)
    : name_(std::move(name))
    , queue_(std::make_shared<completion_queue<>>())
    , thread_() {
  auto q = queue_;
  auto n = name_;
  thread_ = std::thread([q, n]() {
    MH_LOG(trace) << "loop " << n << " started";
    q->run();
    MH_LOG(trace) << "loop " << n << " finished";
  });
}

active_completion_queue::~active_completion_queue() {
  MH_LOG(trace) << "loop " << name_ << " shutting down";
  queue_->shutdown();
  if (thread_.joinable()) {
    thread_.join();
  }
}

} // namespace mh
