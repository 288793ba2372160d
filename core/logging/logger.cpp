#include "logging/logger.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace firewatch {

Logger::Logger(const std::string& output_path) {
    if (!output_path.empty()) {
        file_.open(output_path, std::ios::app);
    }
}

Logger::~Logger() {
    if (file_.is_open()) {
        file_.close();
    }
}

void Logger::log_rules_loaded(const std::string& source, std::size_t rule_count) {
    nlohmann::json j;
    j["ts"] = timestamp_iso8601();
    j["type"] = "rules_loaded";
    j["source"] = source;
    j["count"] = rule_count;
    write_line(j.dump());
}

void Logger::log_records_loaded(const std::string& source, std::size_t record_count) {
    nlohmann::json j;
    j["ts"] = timestamp_iso8601();
    j["type"] = "records_loaded";
    j["source"] = source;
    j["count"] = record_count;
    write_line(j.dump());
}

void Logger::log_load_error(const std::string& source, const RuleLoadError& error) {
    nlohmann::json j;
    j["ts"] = timestamp_iso8601();
    j["type"] = "load_error";
    j["source"] = source;
    j["kind"] = to_string(error.kind());
    j["message"] = error.what();
    if (auto* invalid = dynamic_cast<const InvalidRuleError*>(&error)) {
        j["rule"] = invalid->rule_id();
        j["field"] = invalid->field();
    }
    write_line(j.dump());
}

void Logger::log_evaluation(std::size_t index, const EvaluationResult& result) {
    nlohmann::json j;
    j["ts"] = timestamp_iso8601();
    j["type"] = "evaluation";
    j["index"] = index;
    j["risk"] = result.risk;
    j["action"] = result.action;
    j["rule"] = result.matched_rule_id;
    write_line(j.dump());
}

void Logger::log_summary(std::size_t total,
                         const std::map<std::string, std::size_t>& by_risk) {
    nlohmann::json j;
    j["ts"] = timestamp_iso8601();
    j["type"] = "summary";
    j["total"] = total;
    j["by_risk"] = by_risk;
    write_line(j.dump());
}

void Logger::log_warning(const std::string& message) {
    nlohmann::json j;
    j["ts"] = timestamp_iso8601();
    j["type"] = "warning";
    j["message"] = message;
    write_line(j.dump());
}

void Logger::write_line(const std::string& json) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_ << json << "\n";
        file_.flush();
    }
    std::cout << json << std::endl;
}

std::string Logger::timestamp_iso8601() const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace firewatch
