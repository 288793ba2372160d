#pragma once

#include "engine/engine.h"

#include <cstddef>
#include <functional>
#include <thread>
#include <vector>

namespace firewatch {

// Starts one worker thread running the given task.
using WorkerLauncher = std::function<std::thread(std::function<void()>)>;

// Splits records into contiguous chunks, one thread per chunk, all sharing the
// engine's rule store. Results are written by original index, so the output
// is identical to engine.evaluate_all(records). workers == 0 means 1.
std::vector<EvaluationResult> evaluate_parallel(const Engine& engine,
                                                const std::vector<Record>& records,
                                                std::size_t workers);

// As above, starting workers through launch. If a launch throws, the workers
// already started are joined before the exception propagates.
std::vector<EvaluationResult> evaluate_parallel(const Engine& engine,
                                                const std::vector<Record>& records,
                                                std::size_t workers,
                                                const WorkerLauncher& launch);

} // namespace firewatch
