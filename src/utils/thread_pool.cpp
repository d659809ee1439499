#include "utils/thread_pool.hpp"
#include <boost/log/trivial.hpp>
#include <stdexcept>

namespace xs {
namespace utils {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ThreadPool::ThreadPool(std::size_t size) {
  if (size == 0) {
    throw std::invalid_argument("Thread pool: size must be at least 1");
  }

  // Zero capacity: execute() returns only once a worker has taken the job
  auto [sender, receiver] = make_channel<Job>(0);
  jobs_ = std::move(sender);

  workers_.reserve(size);
  for (std::size_t i = 0; i < size; ++i) {
    workers_.emplace_back(&ThreadPool::worker_loop, this, receiver);
  }

  BOOST_LOG_TRIVIAL(debug) << "Thread pool: Started " << size << " workers";
}

ThreadPool::~ThreadPool() {
  jobs_.reset();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  BOOST_LOG_TRIVIAL(debug) << "Thread pool: All workers stopped";
}


//==============================================
// JOB SUBMISSION
//==============================================

void ThreadPool::execute(Job job) {
  // Count the job before handing it off so a waiter can never observe zero
  // between handoff and the worker picking it up
  const std::size_t count = active_count_.fetch_add(1) + 1;
  BOOST_LOG_TRIVIAL(trace) << "Thread pool: count increased to: " << count;

  if (!jobs_.send(std::move(job))) {
    finish_job();
    throw std::runtime_error("Thread pool: pool is shut down");
  }
}

void ThreadPool::wait_for_completion() {
  std::unique_lock<std::mutex> lock(completion_mutex_);
  completion_cv_.wait(lock, [this]() { return active_count_.load() == 0; });
}


//==============================================
// WORKER LOOP
//==============================================

void ThreadPool::worker_loop(Receiver<Job> jobs) {
  while (auto job = jobs.recv()) {
    try {
      (*job)();
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Thread pool: Job failed: " << e.what();
    } catch (...) {
      BOOST_LOG_TRIVIAL(error) << "Thread pool: Job failed with a non-standard exception";
    }
    finish_job();
  }
}

void ThreadPool::finish_job() {
  const std::size_t count = active_count_.fetch_sub(1) - 1;
  BOOST_LOG_TRIVIAL(trace) << "Thread pool: count decreased to: " << count;

  if (count == 0) {
    std::lock_guard<std::mutex> lock(completion_mutex_);
    completion_cv_.notify_all();
  }
}

} // namespace utils
} // namespace xs
