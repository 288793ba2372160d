#pragma once

#include "engine/evaluation_result.h"
#include "rules/rule_errors.h"

#include <cstddef>
#include <fstream>
#include <map>
#include <mutex>
#include <string>

namespace firewatch {

class Logger {
public:
    explicit Logger(const std::string& output_path);
    ~Logger();

    void log_rules_loaded(const std::string& source, std::size_t rule_count);
    void log_records_loaded(const std::string& source, std::size_t record_count);
    void log_load_error(const std::string& source, const RuleLoadError& error);
    void log_evaluation(std::size_t index, const EvaluationResult& result);
    void log_summary(std::size_t total, const std::map<std::string, std::size_t>& by_risk);
    void log_warning(const std::string& message);

private:
    void write_line(const std::string& json);
    std::string timestamp_iso8601() const;

    std::ofstream file_;
    std::mutex mutex_;
};

} // namespace firewatch
