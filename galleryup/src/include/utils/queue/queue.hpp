/*
 * @file        galleryup/src/include/utils/queue/queue.hpp
 * @brief       Blocking queue shared by the scan worker, upload driver and upload engine
 * @author      Yurun Zi
 * @date        2025-03-20
 * @license     MIT
 *
 * @copyright   Copyright (c) 2025 Yurun Zi
 */

// Copyright (c) 2025 Yurun Zi
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

namespace galleryup {
/**
 * @brief A thread-safe unbounded blocking queue. Consumers sleep on pop() until a producer
 *        pushes.
 */
template <typename T>
class ConcurrentBlockingQueue {
 public:
  ConcurrentBlockingQueue() = default;

  /**
   * @brief A thread-safe wrapper for push()
   *
   * @param new_request the request to enqueue
   */
  void push(T new_request) {
    {
      std::unique_lock<std::mutex> lock(mtx_);
      queue_.push(std::move(new_request));
    }
    consumer_cv_.notify_one();
  }

  /**
   * @brief Block until an element is available and dequeue it
   *
   * @return the front-most element of the queue
   */
  T pop() {
    std::unique_lock<std::mutex> lock(mtx_);
    consumer_cv_.wait(lock, [this] { return !queue_.empty(); });

    T handled_request = std::move(queue_.front());
    queue_.pop();
    return handled_request;
  }

  auto try_pop() -> std::optional<T> {
    std::unique_lock<std::mutex> lock(mtx_);
    if (queue_.empty()) return std::nullopt;
    T handled_request = std::move(queue_.front());
    queue_.pop();
    return handled_request;
  }

  template <typename Rep, typename Period>
  auto pop_for(const std::chrono::duration<Rep, Period>& timeout) -> std::optional<T> {
    std::unique_lock<std::mutex> lock(mtx_);
    if (!consumer_cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
      return std::nullopt;
    }
    T handled_request = std::move(queue_.front());
    queue_.pop();
    return handled_request;
  }

  auto size() -> size_t {
    std::unique_lock<std::mutex> lock(mtx_);
    return queue_.size();
  }

  auto empty() -> bool { return size() == 0; }

 private:
  std::queue<T>           queue_;
  std::mutex              mtx_;
  std::condition_variable consumer_cv_;
};
};  // namespace galleryup
