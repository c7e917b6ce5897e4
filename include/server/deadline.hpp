#ifndef DFP_SERVER_DEADLINE_HPP
#define DFP_SERVER_DEADLINE_HPP

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include "session_error.hpp"

namespace dfp::server {

// Shared flag raised by whoever abandons a piece of work. The worker polls it
// at its publication points and stops before producing visible effects.
class CancellationToken {
public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() const { flag_->store(true); }
  bool cancelled() const { return flag_->load(); }

  // Throws OperationCancelled naming `what` once cancelled
  void throw_if_cancelled(const std::string& what) const {
    if (cancelled()) {
      throw OperationCancelled(what);
    }
  }

private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

// Runs fn on the pool and waits at most `timeout` for it. On expiry the token
// is cancelled and DeadlineExceeded is thrown; the work may still be running
// but observes the cancellation. Exceptions from fn propagate unchanged.
template <typename Result>
Result run_with_deadline(boost::asio::thread_pool& pool,
                         std::chrono::milliseconds timeout,
                         const std::string& operation,
                         std::function<Result(const CancellationToken&)> fn) {
  CancellationToken token;
  auto task = std::make_shared<std::packaged_task<Result()>>(
      [fn = std::move(fn), token]() { return fn(token); });
  std::future<Result> result = task->get_future();
  boost::asio::post(pool, [task]() { (*task)(); });

  if (result.wait_for(timeout) != std::future_status::ready) {
    token.cancel();
    throw DeadlineExceeded(operation + " exceeded " + std::to_string(timeout.count()) + " ms");
  }
  return result.get();
}

} // namespace dfp::server

#endif // DFP_SERVER_DEADLINE_HPP
