#pragma once

#include <cstddef>
#include <string>

namespace firewatch {

struct RunConfig {
    std::string rules_path;
    std::string records_path;
    std::string log_path = "firewatch.jsonl";
    std::size_t workers = 1;
    bool matches_only = false;

    // Reads a JSON run profile. Keys absent from the file keep their defaults.
    // Throws std::runtime_error when the file is missing, unparsable or
    // holds a key of the wrong type.
    static RunConfig load(const std::string& path);
};

} // namespace firewatch
