#include "internal/rpc/dispatcher.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using cms::rpc::Dispatcher;

void TestRunPendingExecutesInPostOrder() {
  Dispatcher       dispatcher;
  std::vector<int> order;

  for (int i = 0; i < 5; ++i) {
    dispatcher.Post([&order, i] { order.push_back(i); });
  }
  assert(dispatcher.QueuedTasks() == 5);
  assert(dispatcher.RunPending() == 5);
  assert((order == std::vector<int>{0, 1, 2, 3, 4}));
}

void TestTaskPostedByTaskRunsInSamePass() {
  Dispatcher dispatcher;
  int        runs = 0;

  dispatcher.Post([&] {
    ++runs;
    dispatcher.Post([&] { ++runs; });
  });
  assert(dispatcher.RunPending() == 2);
  assert(runs == 2);
}

void TestThrowingTaskDoesNotStopQueue() {
  Dispatcher dispatcher;
  bool       after = false;

  dispatcher.Post([] { throw std::runtime_error("boom"); });
  dispatcher.Post([&] { after = true; });
  dispatcher.RunPending();
  assert(after);

  // Not derived from std::exception.
  after = false;
  dispatcher.Post([] { throw 42; });
  dispatcher.Post([&] { after = true; });
  assert(dispatcher.RunPending() == 2);
  assert(after);
}

void TestWorkerThreadSerializesTasks() {
  Dispatcher dispatcher;
  dispatcher.Start();
  assert(dispatcher.IsRunning());

  bool threw = false;
  try {
    dispatcher.RunPending();
  } catch (const cms::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  std::atomic<int> in_flight{0};
  std::atomic<int> max_in_flight{0};
  std::atomic<int> executed{0};
  std::atomic<int> on_worker{0};

  std::vector<std::thread> posters;
  for (int p = 0; p < 4; ++p) {
    posters.emplace_back([&] {
      for (int i = 0; i < 250; ++i) {
        dispatcher.Post([&] {
          const int now = ++in_flight;
          int       seen = max_in_flight.load();
          while (now > seen && !max_in_flight.compare_exchange_weak(seen, now)) {
          }
          if (dispatcher.OnWorkerThread()) ++on_worker;
          ++executed;
          --in_flight;
        });
      }
    });
  }
  for (auto& t : posters) t.join();

  // Stop drains what is already queued.
  dispatcher.Stop();
  assert(!dispatcher.IsRunning());
  assert(executed == 1000);
  assert(on_worker == 1000);
  assert(max_in_flight == 1);
}

} // namespace

int main() {
  TestRunPendingExecutesInPostOrder();
  TestTaskPostedByTaskRunsInSamePass();
  TestThrowingTaskDoesNotStopQueue();
  TestWorkerThreadSerializesTasks();

  std::cout << "cms_admin_unit_dispatcher: pass\n";
  return 0;
}
