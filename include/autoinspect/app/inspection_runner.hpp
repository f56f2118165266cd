#pragma once

#include <autoinspect/app/inspection_orchestrator.hpp>
#include <autoinspect/core/error.hpp>
#include <autoinspect/core/inspection_record.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <vector>

namespace autoinspect::app {

/// One upload: who submitted it and the encoded image bytes.
struct InspectionRequest {
  core::OperatorRef op;
  std::vector<std::byte> image;
};

using InspectionResult = std::expected<core::InspectionSummary, core::InspectionError>;

/// Callback for each processed request: (index into the request list, result).
/// May be invoked from worker threads; must be thread-safe for the parallel runners.
using InspectionResultCallback =
    std::function<void(std::size_t index, const InspectionResult& result)>;

/// Processes requests one after another on the calling thread.
void run_inspection_batch(const InspectionOrchestrator& orchestrator,
                          const std::vector<InspectionRequest>& requests,
                          const InspectionResultCallback& callback);

/// Processes requests on a fixed pool of worker threads pulling from a shared queue.
/// Each request still runs the orchestrator's sequential steps; only independent
/// requests overlap. num_workers 0 = use hardware concurrency. Returns after every
/// request has been processed and reported.
void run_inspection_batch_parallel(const InspectionOrchestrator& orchestrator,
                                   const std::vector<InspectionRequest>& requests,
                                   const InspectionResultCallback& callback,
                                   std::size_t num_workers = 0);

}  // namespace autoinspect::app
