#include <autoinspect/app/inspection_runner.hpp>
#include <algorithm>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace autoinspect::app {

void run_inspection_batch(const InspectionOrchestrator& orchestrator,
                          const std::vector<InspectionRequest>& requests,
                          const InspectionResultCallback& callback) {
  for (std::size_t i = 0; i < requests.size(); ++i) {
    const InspectionResult result = orchestrator.process(requests[i].op, requests[i].image);
    if (callback) callback(i, result);
  }
}

namespace {

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

}  // namespace

void run_inspection_batch_parallel(const InspectionOrchestrator& orchestrator,
                                   const std::vector<InspectionRequest>& requests,
                                   const InspectionResultCallback& callback,
                                   std::size_t num_workers) {
  const std::size_t n = requests.size();
  if (n == 0) return;

  const std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers <= 1) {
    run_inspection_batch(orchestrator, requests, callback);
    return;
  }

  // The queue is filled before any worker starts, so an empty queue means done.
  std::queue<std::size_t> index_queue;
  for (std::size_t i = 0; i < n; ++i) {
    index_queue.push(i);
  }
  std::mutex queue_mutex;

  auto worker = [&]() {
    while (true) {
      std::size_t idx;
      {
        std::lock_guard lock(queue_mutex);
        if (index_queue.empty()) return;
        idx = index_queue.front();
        index_queue.pop();
      }
      const InspectionResult result = orchestrator.process(requests[idx].op, requests[idx].image);
      if (callback) callback(idx, result);
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& t : threads) {
    t.join();
  }
}

}  // namespace autoinspect::app
