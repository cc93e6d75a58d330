#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <boost/asio.hpp>

namespace guidstore {
namespace utils {

// Cancellable periodic timer. Invokes its callback from a private background
// thread every period until stopped. Invocations never overlap: a tick that
// fires while the previous callback is still running is skipped.
class IntervalFlusher {
public:
  using Callback = std::function<void()>;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  IntervalFlusher(std::chrono::milliseconds period, Callback callback);
  ~IntervalFlusher();

  IntervalFlusher(const IntervalFlusher&) = delete;
  IntervalFlusher& operator=(const IntervalFlusher&) = delete;


  // ---- TIMER CONTROL ----
  // Starts the timer thread, returns false when already running
  bool start();
  // Cancels the timer and joins its thread, safe to call repeatedly. From
  // inside the callback it only prevents further ticks; the thread is joined
  // by the next start(), stop() or the destructor, which must not itself run
  // on the timer thread.
  void stop();
  // Runs the callback on the calling thread unless an invocation is in flight
  bool trigger();


  // ---- GETTERS ----
  bool is_running() const { return running_; }
  std::chrono::milliseconds period() const { return period_; }
  uint64_t completed_ticks() const { return completed_ticks_; }
  uint64_t skipped_ticks() const { return skipped_ticks_; }

private:
  // ---- PARAMETERS ----
  const std::chrono::milliseconds period_;
  Callback callback_;

  // Timer state
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::steady_timer> timer_;
  std::unique_ptr<std::thread> timer_thread_;
  std::mutex control_mutex_;
  std::atomic<bool> running_{false};

  // Re-entrancy guard and counters
  std::atomic<bool> in_flight_{false};
  std::atomic<uint64_t> completed_ticks_{0};
  std::atomic<uint64_t> skipped_ticks_{0};


  // ---- TIMER LOOP ----
  // Joins and releases the io thread and its timer; caller holds control_mutex_
  void join_timer_thread();
  // Arms the timer for the next fixed-rate deadline
  void schedule_next();
  // Timer completion handler
  void on_tick(const boost::system::error_code& error);
  // Invokes the callback behind the in-flight guard
  bool run_guarded();
};

} // namespace utils
} // namespace guidstore
