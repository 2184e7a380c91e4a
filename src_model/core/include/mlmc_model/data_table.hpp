#pragma once

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace mlmc::model {

/**
 * \brief Dense row-major numeric table as read from a data file.
 *
 * One row per sample. A single-column file yields N rows of width one; a single-line
 * file yields one row. Instances are immutable once built.
 */
class DataTable {
public:
    DataTable() = default;

    /// Throws DataValidationError when \p values does not hold rows * columns entries.
    DataTable(std::size_t rows, std::size_t columns, std::vector<double> values, std::string source = {});

    /// Builds a table from nested rows; throws DataValidationError on ragged input.
    [[nodiscard]] static DataTable from_rows(const std::vector<std::vector<double>>& rows,
                                             std::string source = {});

    [[nodiscard]] std::size_t rows() const noexcept { return rows_; }
    [[nodiscard]] std::size_t columns() const noexcept { return columns_; }
    [[nodiscard]] bool empty() const noexcept { return rows_ == 0; }

    /// File path (or caller supplied label) the table came from.
    [[nodiscard]] const std::string& source() const noexcept { return source_; }

    [[nodiscard]] const double* row_data(std::size_t row) const noexcept { return values_.data() + row * columns_; }
    [[nodiscard]] std::vector<double> row(std::size_t row) const;
    [[nodiscard]] double at(std::size_t row, std::size_t column) const;

    [[nodiscard]] const std::vector<double>& values() const noexcept { return values_; }

private:
    std::size_t rows_{0};
    std::size_t columns_{0};
    std::vector<double> values_{};
    std::string source_{};
};

/**
 * \brief Reads plain-text numeric tables.
 *
 * Format:
 *   - The first `skip_header_rows` physical lines are discarded unconditionally.
 *   - Text after `comment_char` is ignored; blank lines are ignored.
 *   - Without a delimiter, commas and whitespace both separate cells. With a delimiter,
 *     empty cells are kept and read as NaN.
 *   - Non-numeric cells are read as NaN and rejected afterwards, so the error names
 *     the first offending cell.
 *
 * Errors: DataFileError when the file is missing/unreadable or shorter than the header
 * skip, DataValidationError on NaN cells, ragged rows or an empty table,
 * InvalidParameterError when the delimiter collides with the comment character.
 *
 * Example:
 * \code{.txt}
 * # k      c     m
 * 1.2, 0.4, 3.1
 * 1.3, 0.4, 3.1
 * \endcode
 */
class DataTableReader {
public:
    struct Options {
        std::size_t skip_header_rows{0};
        std::optional<char> delimiter{};
        char comment_char{'#'};
    };

    DataTableReader() = default;
    explicit DataTableReader(Options options);

    [[nodiscard]] DataTable read(const std::filesystem::path& file) const;

    [[nodiscard]] DataTable parse(std::istream& input, const std::string& source_name) const;

    [[nodiscard]] const Options& options() const noexcept { return options_; }

private:
    Options options_{};
};

}  // namespace mlmc::model
