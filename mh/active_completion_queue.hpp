#ifndef mh_active_completion_queue_hpp
#define mh_active_completion_queue_hpp

#include <mh/completion_queue.hpp>

#include <string>
#include <thread>

namespace mh {

/**
 * A completion queue and the thread running its loop.
 *
 * The thread is the coordination context of a mesh host: timers, inbound messages and the public API calls all run
 * there, one at a time.  On destruction the queue is shutdown, which cancels the pending timers, and then the
 * thread is joined.
 */
class active_completion_queue {
public:
  /// Start a new loop, @a name identifies it in the log, e.g. the id of the peer using it.
  explicit active_completion_queue(std::string name = "mesh");

  active_completion_queue(active_completion_queue const&) = delete;
  active_completion_queue& operator=(active_completion_queue const&) = delete;

  ~active_completion_queue();

  completion_queue<>& cq() {
    return *queue_;
  }

  std::string const& name() const {
    return name_;
  }

  /// Return true if the calling thread is the one running the event loop.
  bool in_loop_thread() const {
    return std::this_thread::get_id() == thread_.get_id();
  }

private:
  std::string name_;
  std::shared_ptr<completion_queue<>> queue_;
  std::thread thread_;
};

} // namespace mh

#endif // mh_active_completion_queue_hpp
