#ifndef XS_UTILS_THREAD_POOL_HPP
#define XS_UTILS_THREAD_POOL_HPP

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>
#include "utils/channel.hpp"

namespace xs {
namespace utils {

class ThreadPool {
public:
  using Job = std::function<void()>;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit ThreadPool(std::size_t size);
  // Stops accepting jobs and joins the workers once their current job ends
  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;


  // ---- JOB SUBMISSION ----
  // Hands job to an idle worker, blocking until one takes it
  void execute(Job job);
  // Blocks until no submitted job is running
  void wait_for_completion();


  // ---- QUERY METHODS ----
  std::size_t active_count() const { return active_count_.load(); }
  std::size_t size() const { return workers_.size(); }

private:
  // ---- PARAMETERS ----
  Sender<Job> jobs_;
  std::vector<std::thread> workers_;
  std::atomic<std::size_t> active_count_{0};
  std::mutex completion_mutex_;
  std::condition_variable completion_cv_;


  // ---- WORKER LOOP ----
  void worker_loop(Receiver<Job> jobs);
  // Decrements the active counter, waking waiters on the transition to zero
  void finish_job();
};

} // namespace utils
} // namespace xs

#endif // XS_UTILS_THREAD_POOL_HPP
