#include "config/run_config.h"
#include "engine/engine.h"
#include "engine/parallel_evaluator.h"
#include "io/record_reader.h"
#include "logging/logger.h"
#include "rules/rule_errors.h"
#include "rules/rule_store.h"

#include <cstring>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>

using namespace firewatch;

static void print_usage(const char* program) {
    std::cerr << "usage: " << program
              << " [--config <run.json>] --rules <rules.json> --records <alerts.csv>"
                 " [--log <path>] [--workers <n>] [--matches-only]\n";
}

int main(int argc, char* argv[]) {
    RunConfig config;

    // --config is applied first so explicit flags override the profile
    try {
        for (int i = 1; i < argc; ++i) {
            if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
                config = RunConfig::load(argv[i + 1]);
            }
        }

        for (int i = 1; i < argc; ++i) {
            if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
                ++i;
            } else if (std::strcmp(argv[i], "--rules") == 0 && i + 1 < argc) {
                config.rules_path = argv[++i];
            } else if (std::strcmp(argv[i], "--records") == 0 && i + 1 < argc) {
                config.records_path = argv[++i];
            } else if (std::strcmp(argv[i], "--log") == 0 && i + 1 < argc) {
                config.log_path = argv[++i];
            } else if (std::strcmp(argv[i], "--workers") == 0 && i + 1 < argc) {
                config.workers = std::stoul(argv[++i]);
            } else if (std::strcmp(argv[i], "--matches-only") == 0) {
                config.matches_only = true;
            } else {
                std::cerr << "[firewatch] unknown argument: " << argv[i] << "\n";
                print_usage(argv[0]);
                return 2;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[firewatch] configuration error: " << e.what() << "\n";
        return 2;
    }

    if (config.rules_path.empty() || config.records_path.empty()) {
        print_usage(argv[0]);
        return 2;
    }

    Logger logger(config.log_path);

    std::shared_ptr<const RuleStore> store;
    try {
        store = RuleStore::load(config.rules_path);
    } catch (const RuleLoadError& e) {
        logger.log_load_error(config.rules_path, e);
        std::cerr << "[firewatch] " << e.what() << "\n";
        return 1;
    }
    logger.log_rules_loaded(config.rules_path, store->size());
    if (store->empty()) {
        logger.log_warning("rule set " + config.rules_path +
                           " is empty; every record will be " + kDefaultRisk);
    }

    std::vector<Record> records;
    try {
        records = RecordReader::load(config.records_path);
    } catch (const RuleLoadError& e) {
        logger.log_load_error(config.records_path, e);
        std::cerr << "[firewatch] " << e.what() << "\n";
        return 1;
    }
    logger.log_records_loaded(config.records_path, records.size());

    Engine engine(store);
    auto results = evaluate_parallel(engine, records, config.workers);

    std::map<std::string, std::size_t> by_risk;
    for (std::size_t i = 0; i < results.size(); ++i) {
        ++by_risk[results[i].risk];
        if (!config.matches_only || results[i].matched()) {
            logger.log_evaluation(i, results[i]);
        }
    }
    logger.log_summary(results.size(), by_risk);

    std::cout << "[firewatch] evaluated " << results.size() << " record(s) against "
              << store->size() << " rule(s)\n";
    for (const auto& [risk, count] : by_risk) {
        std::cout << "[firewatch]   " << risk << ": " << count << "\n";
    }

    return 0;
}
