#pragma once

#include "engine/record.h"

#include <iosfwd>
#include <string>
#include <vector>

namespace firewatch {

// Reads alert records from CSV with a header row. Numeric cells become
// numbers, other cells strings, and empty cells are left out of the record.
class RecordReader {
public:
    // Throws SourceNotFoundError or MalformedSourceError.
    static std::vector<Record> load(const std::string& path);
    static std::vector<Record> load(std::istream& in, const std::string& source_name);

    // Splits one CSV line, honouring double quotes and "" escapes.
    static std::vector<std::string> split_line(const std::string& line);

    // Number when the whole cell parses as one, string otherwise.
    static Value parse_cell(const std::string& cell);
};

} // namespace firewatch
