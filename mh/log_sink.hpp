#ifndef mh_log_sink_hpp
#define mh_log_sink_hpp

#include <mh/log_severity.hpp>

#include <memory>
#include <string>
#include <utility>

namespace mh {

/**
 * A destination for logging messages.
 *
 * Applications configure where the election and transport messages go by adding one or more instances of
 * mh::log_sink to the global logger.
 */
class log_sink {
public:
  virtual ~log_sink() {}

  /**
   * Log the given message to the sink.
   *
   * @param sev the severity of the message.
   * @param message the message value.
   */
  virtual void log(severity sev, std::string&& message) = 0;
};

/**
 * An adaptor that converts any Functor into a @c mh::log_sink.
 *
 * @tparam Functor the type of the functor to adapt.
 */
template <typename Functor>
class log_to_functor : public log_sink {
public:
  explicit log_to_functor(Functor&& f)
      : functor_(std::move(f)) {
  }

  virtual void log(severity sev, std::string&& message) override {
    functor_(sev, std::move(message));
  }

private:
  Functor functor_;
};

/**
 * Create a @c mh::log_sink shared pointer from a functor.
 *
 * @tparam Functor the type of the functor object @a f.
 * @param f the functor object to forward calls to.
 * @return a log_sink that forwards log() calls to the given functor @a f.
 */
template <typename Functor>
std::shared_ptr<log_sink> make_log_sink(Functor&& f) {
  using functor_type = typename std::decay<Functor>::type;
  return std::make_shared<log_to_functor<functor_type>>(functor_type(std::forward<Functor>(f)));
}

} // namespace mh

#endif // mh_log_sink_hpp
