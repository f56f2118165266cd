#pragma once

#include <autoinspect/app/inspection_orchestrator.hpp>
#include <autoinspect/app/inspection_runner.hpp>
#include <vector>

#ifdef AUTOINSPECT_HAS_TBB

namespace autoinspect::app {

/// Processes requests in parallel with TBB tasks.
///
/// Requests from different operators, and several from the same operator, may run
/// concurrently; the ledger serializes id assignment, so every successful request gets
/// a distinct record. \p callback receives (index, result) and must be thread-safe.
void run_inspection_batch_tbb(const InspectionOrchestrator& orchestrator,
                              const std::vector<InspectionRequest>& requests,
                              const InspectionResultCallback& callback);

}  // namespace autoinspect::app

#endif  // AUTOINSPECT_HAS_TBB
