#include "io/record_reader.h"
#include "rules/rule_errors.h"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>

namespace firewatch {

namespace {

void strip_carriage_return(std::string& line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t") == std::string::npos;
}

} // namespace

std::vector<Record> RecordReader::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw SourceNotFoundError(path);
    }
    return load(file, path);
}

std::vector<Record> RecordReader::load(std::istream& in, const std::string& source_name) {
    std::string line;
    std::size_t line_number = 0;

    std::vector<std::string> header;
    while (std::getline(in, line)) {
        ++line_number;
        strip_carriage_return(line);
        if (!is_blank(line)) {
            header = split_line(line);
            break;
        }
    }
    if (header.empty()) {
        throw MalformedSourceError(source_name, "missing header row");
    }

    std::vector<Record> records;
    while (std::getline(in, line)) {
        ++line_number;
        strip_carriage_return(line);
        if (is_blank(line)) {
            continue;
        }

        auto cells = split_line(line);
        if (cells.size() != header.size()) {
            throw MalformedSourceError(
                source_name, "line " + std::to_string(line_number) + " has " +
                                 std::to_string(cells.size()) + " cells, expected " +
                                 std::to_string(header.size()));
        }

        Record record;
        for (std::size_t i = 0; i < cells.size(); ++i) {
            if (!cells[i].empty()) {
                record.set(header[i], parse_cell(cells[i]));
            }
        }
        records.push_back(std::move(record));
    }

    return records;
}

std::vector<std::string> RecordReader::split_line(const std::string& line) {
    std::vector<std::string> cells;
    std::string cell;
    bool quoted = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    cell += '"';
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                cell += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            cells.push_back(std::move(cell));
            cell.clear();
        } else {
            cell += c;
        }
    }
    cells.push_back(std::move(cell));

    return cells;
}

Value RecordReader::parse_cell(const std::string& cell) {
    const char* begin = cell.c_str();
    char* end = nullptr;
    errno = 0;
    double number = std::strtod(begin, &end);

    bool whole = end != begin && *end == '\0';
    if (whole && errno == 0 && std::isfinite(number)) {
        return Value(number);
    }
    return Value(cell);
}

} // namespace firewatch
