#include "engine/parallel_evaluator.h"

#include <algorithm>

namespace firewatch {

std::vector<EvaluationResult> evaluate_parallel(const Engine& engine,
                                                const std::vector<Record>& records,
                                                std::size_t workers) {
    return evaluate_parallel(engine, records, workers,
                             [](std::function<void()> task) {
                                 return std::thread(std::move(task));
                             });
}

std::vector<EvaluationResult> evaluate_parallel(const Engine& engine,
                                                const std::vector<Record>& records,
                                                std::size_t workers,
                                                const WorkerLauncher& launch) {
    std::vector<EvaluationResult> results(records.size());
    if (records.empty()) {
        return results;
    }

    workers = std::clamp<std::size_t>(workers, 1, records.size());
    if (workers == 1) {
        return engine.evaluate_all(records);
    }

    std::size_t chunk = records.size() / workers;
    std::size_t remainder = records.size() % workers;

    std::vector<std::thread> threads;
    threads.reserve(workers);

    auto join_all = [&threads]() {
        for (auto& t : threads) {
            if (t.joinable()) {
                t.join();
            }
        }
    };

    try {
        std::size_t begin = 0;
        for (std::size_t w = 0; w < workers; ++w) {
            // First `remainder` chunks take one extra record
            std::size_t end = begin + chunk + (w < remainder ? 1 : 0);
            threads.push_back(launch([&engine, &records, &results, begin, end]() {
                for (std::size_t i = begin; i < end; ++i) {
                    results[i] = engine.evaluate_one(records[i]);
                }
            }));
            begin = end;
        }
    } catch (...) {
        join_all();
        throw;
    }

    join_all();

    return results;
}

} // namespace firewatch
