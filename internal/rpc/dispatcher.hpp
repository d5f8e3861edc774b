#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace cms::rpc {

/*
  Dispatcher

  The single logical worker of the front end. Request bodies, RPC
  continuations and immediate RPC failures are all posted here and run
  one at a time, in post order, on one thread. Continuations therefore
  never run concurrently with each other.

  Either Start() a background thread, or drive the queue from the
  calling thread with RunPending() (never both at once).
*/
class Dispatcher {
 public:
  using Task = std::function<void()>;

  Dispatcher() = default;
  ~Dispatcher();

  Dispatcher(const Dispatcher&)            = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  // Thread-safe; callable from gRPC completion threads.
  void Post(Task task);

  // Runs queued tasks on the calling thread until the queue is empty.
  // Throws util::InvalidState while the worker thread is running.
  std::size_t RunPending();

  void Start();

  // Drains whatever is already queued, then joins the worker.
  void Stop();

  bool IsRunning() const {
    return running_;
  }

  bool OnWorkerThread() const;

  std::size_t QueuedTasks() const;

 private:
  void Run();
  void Execute(Task& task) noexcept;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::deque<Task>        queue_;
  bool                    shutdown_ = false;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace cms::rpc
