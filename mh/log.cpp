#include "mh/log.hpp"

#include <vector>

namespace {
std::once_flag log_initialized;
} // anonymous namespace

namespace mh {

std::unique_ptr<log> log::singleton_;

log& log::instance() {
  std::call_once(log_initialized, []() { singleton_.reset(new log); });
  return *singleton_;
}

long log::add_sink(std::shared_ptr<log_sink> sink) {
  std::lock_guard<std::mutex> guard(mu_);
  long token = ++next_token_;
  sinks_.emplace(token, std::move(sink));
  return token;
}

void log::remove_sink(long token) {
  std::lock_guard<std::mutex> guard(mu_);
  sinks_.erase(token);
}

void log::clear_sinks() {
  std::lock_guard<std::mutex> guard(mu_);
  sinks_.clear();
}

void log::write(severity sev, std::string&& msg) {
  // Sinks are called without the lock, a sink may log (or remove itself) from its own log() call.
  std::vector<std::shared_ptr<log_sink>> sinks;
  {
    std::lock_guard<std::mutex> guard(mu_);
    if (sinks_.empty() or sev < min_severity_) {
      return;
    }
    sinks.reserve(sinks_.size());
    for (auto const& s : sinks_) {
      sinks.push_back(s.second);
    }
  }
  // Special case, very common and avoid copying the message ...
  if (sinks.size() == 1) {
    sinks[0]->log(sev, std::move(msg));
    return;
  }
  for (auto const& s : sinks) {
    std::string copy(msg);
    s->log(sev, std::move(copy));
  }
}

logger<false>::logger(severity s, char const* func, char const* file, int l, log& sink)
    : os()
    , sev(s)
    , closed(sev < sink.min_severity()) {
  if (closed) {
    return;
  }
  function = func;
  filename = file;
  lineno = l;
  os << "[" << sev << "] ";
}

void logger<false>::write_to(log& sink) {
  closed = true;
  os << " in " << function << "(" << filename << ":" << lineno << ")";
  sink.write(sev, os.str());
}

} // namespace mh
