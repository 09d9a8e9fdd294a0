#ifndef THREAD_SAFE_QUEUE_H
#define THREAD_SAFE_QUEUE_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

// Mutex/condition-variable queue shared by the worker pool and the progress
// channel. After shutdown, consumers drain what is left and then receive
// false.
template <typename T> class ThreadSafeQueue {
private:
  mutable std::mutex mtx;
  std::deque<T> queue;
  std::condition_variable cv;
  std::atomic<bool> shutdown{false};

public:
  void push(T item) {
    {
      std::lock_guard<std::mutex> lock(mtx);
      queue.push_back(std::move(item));
    }
    cv.notify_one();
  }

  // Never blocks: when the queue already holds capacity items the oldest is
  // discarded. Returns true if an item was discarded.
  bool pushDropOldest(T item, size_t capacity) {
    bool dropped = false;
    {
      std::lock_guard<std::mutex> lock(mtx);
      while (capacity > 0 && queue.size() >= capacity) {
        queue.pop_front();
        dropped = true;
      }
      queue.push_back(std::move(item));
    }
    cv.notify_one();
    return dropped;
  }

  bool pop(T &item,
           std::chrono::milliseconds timeout = std::chrono::milliseconds(100)) {
    std::unique_lock<std::mutex> lock(mtx);
    if (cv.wait_for(lock, timeout,
                    [this] { return !queue.empty() || shutdown; })) {
      if (!queue.empty()) {
        item = std::move(queue.front());
        queue.pop_front();
        return true;
      }
    }
    return false;
  }

  bool tryPop(T &item) {
    std::lock_guard<std::mutex> lock(mtx);
    if (queue.empty())
      return false;
    item = std::move(queue.front());
    queue.pop_front();
    return true;
  }

  bool popBlocking(T &item) {
    std::unique_lock<std::mutex> lock(mtx);
    cv.wait(lock, [this] { return !queue.empty() || shutdown; });

    if (queue.empty()) {
      return false;
    }

    item = std::move(queue.front());
    queue.pop_front();
    return true;
  }

  void shutdown_queue() {
    {
      std::lock_guard<std::mutex> lock(mtx);
      shutdown = true;
    }
    cv.notify_all();
  }

  bool isShutdown() const { return shutdown; }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mtx);
    return queue.size();
  }

  bool empty() const {
    std::lock_guard<std::mutex> lock(mtx);
    return queue.empty();
  }
};

#endif
