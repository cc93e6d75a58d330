#include "utils/interval_flusher.hpp"
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace guidstore {
namespace utils {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

IntervalFlusher::IntervalFlusher(std::chrono::milliseconds period, Callback callback)
  : period_(period)
  , callback_(std::move(callback)) {
  if (period_.count() <= 0) {
    throw std::invalid_argument("Interval flusher: period must be positive");
  }
  if (!callback_) {
    throw std::invalid_argument("Interval flusher: callback must be set");
  }
  BOOST_LOG_TRIVIAL(debug) << "Interval flusher: Created with period " << period_.count() << "ms";
}

IntervalFlusher::~IntervalFlusher() {
  stop();
}


//==============================================
// TIMER CONTROL
//==============================================

bool IntervalFlusher::start() {
  if (io_context_.get_executor().running_in_this_thread()) {
    BOOST_LOG_TRIVIAL(warning) << "Interval flusher: start() called from the callback, ignoring";
    return false;
  }

  std::lock_guard<std::mutex> lock(control_mutex_);
  if (running_) {
    BOOST_LOG_TRIVIAL(warning) << "Interval flusher: Already running";
    return false;
  }
  // A stop() issued from the callback leaves its thread to be joined here
  join_timer_thread();

  io_context_.restart();
  timer_ = std::make_unique<boost::asio::steady_timer>(io_context_);
  timer_->expires_after(period_);
  running_ = true;
  timer_->async_wait([this](const boost::system::error_code& error) { on_tick(error); });

  // Serve the timer from its own thread
  timer_thread_ = std::make_unique<std::thread>([this]() {
    try {
      io_context_.run();
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Interval flusher: IO context error: " << e.what();
      running_ = false;
    }
  });

  BOOST_LOG_TRIVIAL(info) << "Interval flusher: Started with period " << period_.count() << "ms";
  return true;
}

void IntervalFlusher::stop() {
  if (io_context_.get_executor().running_in_this_thread()) {
    // Called from the callback: no further tick is armed, so run() returns
    // once the callback does. The thread is joined by the next start(),
    // stop() or the destructor.
    running_ = false;
    BOOST_LOG_TRIVIAL(debug) << "Interval flusher: Stop requested from the callback";
    return;
  }

  std::lock_guard<std::mutex> lock(control_mutex_);
  if (!timer_thread_) {
    return;
  }

  BOOST_LOG_TRIVIAL(debug) << "Interval flusher: Stopping";
  running_ = false;
  io_context_.stop();
  join_timer_thread();

  BOOST_LOG_TRIVIAL(info) << "Interval flusher: Stopped after " << completed_ticks_
                          << " ticks (" << skipped_ticks_ << " skipped)";
}

bool IntervalFlusher::trigger() {
  return run_guarded();
}


//==============================================
// TIMER LOOP
//==============================================

void IntervalFlusher::join_timer_thread() {
  if (!timer_thread_) {
    return;
  }
  if (timer_thread_->joinable()) {
    timer_thread_->join();
  }
  timer_thread_.reset();
  // Safe once the io thread is gone; pending waits complete as aborted on the next run()
  timer_.reset();
}

void IntervalFlusher::schedule_next() {
  // Fixed rate: next deadline derives from the previous one, not from now.
  // Deadlines that passed while the callback ran are skipped, not replayed.
  auto next = timer_->expiry() + period_;
  auto now = boost::asio::steady_timer::clock_type::now();
  while (next <= now) {
    next += period_;
    ++skipped_ticks_;
  }
  timer_->expires_at(next);
  timer_->async_wait([this](const boost::system::error_code& error) { on_tick(error); });
}

void IntervalFlusher::on_tick(const boost::system::error_code& error) {
  if (error == boost::asio::error::operation_aborted || !running_) {
    return;
  }
  if (error) {
    BOOST_LOG_TRIVIAL(error) << "Interval flusher: Timer error: " << error.message();
    return;
  }

  run_guarded();

  if (running_) {
    schedule_next();
  }
}

bool IntervalFlusher::run_guarded() {
  bool expected = false;
  if (!in_flight_.compare_exchange_strong(expected, true)) {
    ++skipped_ticks_;
    BOOST_LOG_TRIVIAL(debug) << "Interval flusher: Previous invocation still running, skipping tick";
    return false;
  }

  try {
    callback_();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Interval flusher: Callback failed: " << e.what();
  }

  ++completed_ticks_;
  in_flight_ = false;
  return true;
}

} // namespace utils
} // namespace guidstore
