#pragma once
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace unchessful::engine {

// Fixed-size pool for blocking jobs. Destruction runs whatever is still queued,
// then joins; jobs are expected to honour their own cancel flags.
class WorkerPool {
 public:
  explicit WorkerPool(int threads = 1) {
    int n = threads > 0 ? threads : 1;
    m_threads.reserve(n);
    for (int i = 0; i < n; ++i) m_threads.emplace_back([this] { worker(); });
  }

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  ~WorkerPool() {
    {
      std::lock_guard lock(m_mutex);
      m_stop = true;
    }
    m_cv.notify_all();
    for (auto& t : m_threads)
      if (t.joinable()) t.join();
  }

  template <class F, class... Args>
  auto submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
    using R = std::invoke_result_t<F, Args...>;

    auto task = std::make_shared<std::packaged_task<R()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...));
    std::future<R> fut = task->get_future();
    {
      std::lock_guard lock(m_mutex);
      m_queue.emplace([task]() { (*task)(); });
    }
    m_cv.notify_one();
    return fut;
  }

  [[nodiscard]] std::size_t size() const noexcept { return m_threads.size(); }

 private:
  void worker() {
    for (;;) {
      std::function<void()> job;
      {
        std::unique_lock lock(m_mutex);
        m_cv.wait(lock, [&] { return m_stop || !m_queue.empty(); });
        if (m_stop && m_queue.empty()) return;
        job = std::move(m_queue.front());
        m_queue.pop();
      }
      job();
    }
  }

  std::mutex m_mutex;
  std::condition_variable m_cv;
  std::queue<std::function<void()>> m_queue;
  std::vector<std::thread> m_threads;
  bool m_stop = false;
};

}  // namespace unchessful::engine
