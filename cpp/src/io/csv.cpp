#include "otree/io/csv.hpp"
#include "otree/error.hpp"

#include <fstream>
#include <sstream>
#include <vector>

namespace otree {

namespace {

std::string trim(const std::string& s) {
    const size_t first = s.find_first_not_of(" \t\r");
    if (first == std::string::npos) return "";
    const size_t last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

std::vector<std::string> split(const std::string& line) {
    std::vector<std::string> cells;
    std::stringstream ss(line);
    std::string cell;
    while (std::getline(ss, cell, ',')) {
        cells.push_back(trim(cell));
    }
    if (!line.empty() && line.back() == ',') {
        cells.emplace_back();
    }
    return cells;
}

} // anonymous namespace

RowBatch read_csv(std::istream& in) {
    std::string line;
    if (!std::getline(in, line)) {
        throw InvalidArgumentError("CSV input has no header");
    }

    std::vector<Field> fields;
    for (const std::string& column : split(line)) {
        const size_t colon = column.find(':');
        Field field;
        field.name = column.substr(0, colon);
        field.type = colon == std::string::npos ? QDataType::Double : parse_data_type(column.substr(colon + 1));
        if (field.name.empty()) {
            throw InvalidArgumentError("CSV header has an empty column name");
        }
        fields.push_back(std::move(field));
    }

    RowBatch batch;
    batch.schema = Schema(std::move(fields));

    size_t line_number = 1;
    while (std::getline(in, line)) {
        ++line_number;
        if (trim(line).empty()) continue;
        std::vector<std::string> cells = split(line);
        if (cells.size() != batch.schema.size()) {
            throw InvalidArgumentError("CSV line " + std::to_string(line_number) + " has " +
                                       std::to_string(cells.size()) + " cells, expected " +
                                       std::to_string(batch.schema.size()));
        }
        Row row;
        row.reserve(cells.size());
        for (size_t i = 0; i < cells.size(); ++i) {
            row.push_back(parse_value(cells[i], batch.schema[i].type));
        }
        batch.rows.push_back(std::move(row));
    }
    return batch;
}

RowBatch read_csv_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw InvalidArgumentError("Cannot open '" + path + "'");
    }
    return read_csv(in);
}

} // namespace otree
