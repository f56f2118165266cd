#include <autoinspect/app/inspection_runner_tbb.hpp>

#ifdef AUTOINSPECT_HAS_TBB

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <cstddef>

namespace autoinspect::app {

void run_inspection_batch_tbb(const InspectionOrchestrator& orchestrator,
                              const std::vector<InspectionRequest>& requests,
                              const InspectionResultCallback& callback) {
  if (requests.empty()) return;

  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, requests.size()),
      [&orchestrator, &requests, &callback](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          const InspectionResult result = orchestrator.process(requests[i].op, requests[i].image);
          if (callback) callback(i, result);
        }
      });
}

}  // namespace autoinspect::app

#endif  // AUTOINSPECT_HAS_TBB
