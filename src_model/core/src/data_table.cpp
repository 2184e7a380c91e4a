#include "mlmc_model/data_table.hpp"

#include "mlmc_model/errors.hpp"
#include "text_utils.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <istream>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mlmc::model {

DataTable::DataTable(std::size_t rows, std::size_t columns, std::vector<double> values, std::string source)
    : rows_(rows), columns_(columns), values_(std::move(values)), source_(std::move(source)) {
    if (values_.size() != rows_ * columns_) {
        throw DataValidationError("Table " + source_ + " expects " + std::to_string(rows_ * columns_) +
                                  " values but holds " + std::to_string(values_.size()));
    }
}

DataTable DataTable::from_rows(const std::vector<std::vector<double>>& rows, std::string source) {
    const std::size_t columns = rows.empty() ? 0 : rows.front().size();
    std::vector<double> values;
    values.reserve(rows.size() * columns);
    for (std::size_t index = 0; index < rows.size(); ++index) {
        if (rows[index].size() != columns) {
            throw DataValidationError("Table " + source + " row " + std::to_string(index + 1) + " has " +
                                      std::to_string(rows[index].size()) + " columns, expected " +
                                      std::to_string(columns));
        }
        values.insert(values.end(), rows[index].begin(), rows[index].end());
    }
    return DataTable(rows.size(), columns, std::move(values), std::move(source));
}

std::vector<double> DataTable::row(std::size_t row) const {
    if (row >= rows_) {
        throw std::out_of_range("Row " + std::to_string(row) + " out of range for table " + source_);
    }
    const double* begin = row_data(row);
    return std::vector<double>(begin, begin + columns_);
}

double DataTable::at(std::size_t row, std::size_t column) const {
    if (row >= rows_ || column >= columns_) {
        throw std::out_of_range("Cell (" + std::to_string(row) + ", " + std::to_string(column) +
                                ") out of range for table " + source_);
    }
    return values_[row * columns_ + column];
}

DataTableReader::DataTableReader(Options options) : options_(options) {}

DataTable DataTableReader::read(const std::filesystem::path& file) const {
    if (!std::filesystem::exists(file)) {
        throw DataFileError("Data file does not exist: " + file.string());
    }
    if (!std::filesystem::is_regular_file(file)) {
        throw DataFileError("Data path is not a regular file: " + file.string());
    }

    std::ifstream input(file);
    if (!input.is_open()) {
        throw DataFileError("Unable to open data file: " + file.string());
    }
    return parse(input, file.string());
}

DataTable DataTableReader::parse(std::istream& input, const std::string& source_name) const {
    if (options_.delimiter && *options_.delimiter == options_.comment_char) {
        throw InvalidParameterError("Delimiter and comment character are both '" +
                                    std::string(1, options_.comment_char) + "'");
    }

    std::string raw_line;
    std::size_t line_no = 0;
    for (; line_no < options_.skip_header_rows; ++line_no) {
        if (!std::getline(input, raw_line)) {
            throw DataFileError("Cannot skip " + std::to_string(options_.skip_header_rows) +
                                " header rows: " + source_name + " has only " + std::to_string(line_no) +
                                " lines");
        }
    }

    std::vector<double> values;
    std::vector<std::size_t> line_of_row;
    std::size_t columns = 0;

    while (std::getline(input, raw_line)) {
        ++line_no;

        std::string_view line{raw_line};
        const auto comment = line.find(options_.comment_char);
        if (comment != std::string_view::npos) {
            line = line.substr(0, comment);
        }
        if (detail::trim_copy(line).empty()) {
            continue;
        }

        const auto fields = detail::split_fields(line, options_.delimiter);
        if (fields.empty()) {
            continue;
        }
        if (line_of_row.empty()) {
            columns = fields.size();
        } else if (fields.size() != columns) {
            throw DataValidationError("Inconsistent column count at " + source_name + ":" +
                                      std::to_string(line_no) + " (got " + std::to_string(fields.size()) +
                                      ", expected " + std::to_string(columns) + ")");
        }

        for (const auto& field : fields) {
            const auto value = detail::parse_double(field);
            values.push_back(value ? *value : std::numeric_limits<double>::quiet_NaN());
        }
        line_of_row.push_back(line_no);
    }

    if (input.bad()) {
        throw DataFileError("Read failure on data file: " + source_name);
    }
    if (line_of_row.empty()) {
        throw DataValidationError("Data file contains no rows: " + source_name);
    }

    for (std::size_t index = 0; index < values.size(); ++index) {
        if (std::isnan(values[index])) {
            const std::size_t row = index / columns;
            throw DataValidationError("Missing or non-numeric value at " + source_name + ":" +
                                      std::to_string(line_of_row[row]) + " column " +
                                      std::to_string(index % columns + 1));
        }
    }

    return DataTable(line_of_row.size(), columns, std::move(values), source_name);
}

}  // namespace mlmc::model
