/*
 * Copyright (c) 2026 Gabriel2392
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <utility>

namespace gdbflash::core {

// Produces items on a background thread, at most `depth` ahead of the
// consumer. Items come out in production order. A producer returning
// nullopt ends the stream; a producer exception is rethrown from next().
template <class Item> class Lookahead {
public:
  using Produce = std::function<std::optional<Item>(std::stop_token)>;

  explicit Lookahead(Produce produce, std::size_t depth = 1)
      : depth_(depth ? depth : 1), produce_(std::move(produce)) {
    worker_ = std::jthread([this](std::stop_token st) { producer_loop_(st); });
  }

  ~Lookahead() { request_stop(); }

  Lookahead(const Lookahead &) = delete;
  Lookahead &operator=(const Lookahead &) = delete;

  // Stops the producer and drops anything produced but not yet taken.
  void request_stop() noexcept {
    {
      std::lock_guard lk(m_);
      stopping_ = true;
    }
    cv_can_produce_.notify_all();
    cv_can_take_.notify_all();

    worker_.request_stop();
    if (worker_.joinable())
      worker_.join();

    std::deque<Item> drop;
    {
      std::lock_guard lk(m_);
      drop.swap(q_);
    }
  }

  std::optional<Item> next() {
    std::unique_lock lk(m_);
    cv_can_take_.wait(lk, [&] { return stopping_ || error_ || !q_.empty() || done_; });

    if (!q_.empty()) {
      Item it = std::move(q_.front());
      q_.pop_front();
      lk.unlock();
      cv_can_produce_.notify_all();
      return it;
    }

    if (error_)
      std::rethrow_exception(error_);
    return std::nullopt;
  }

private:
  void producer_loop_(std::stop_token st) noexcept {
    try {
      for (;;) {
        {
          std::unique_lock lk(m_);
          cv_can_produce_.wait(lk, [&] { return stopping_ || q_.size() < depth_; });
          if (stopping_ || st.stop_requested()) {
            done_ = true;
            cv_can_take_.notify_all();
            return;
          }
        }

        auto item = produce_(st);

        {
          std::lock_guard lk(m_);
          if (!item || stopping_ || st.stop_requested()) {
            done_ = true;
          } else {
            q_.push_back(std::move(*item));
          }
        }
        cv_can_take_.notify_all();
        if (!item) return;
      }
    } catch (...) {
      {
        std::lock_guard lk(m_);
        error_ = std::current_exception();
        done_ = true;
      }
      cv_can_take_.notify_all();
    }
  }

private:
  std::mutex m_;
  std::condition_variable cv_can_produce_;
  std::condition_variable cv_can_take_;

  std::deque<Item> q_;
  bool done_ = false;
  bool stopping_ = false;
  std::exception_ptr error_{};

  std::size_t depth_ = 1;
  Produce produce_{};

  std::jthread worker_{};
};

} // namespace gdbflash::core
