/**
 * @file test_data_table.cpp
 * @brief Tests for the plain-text numeric table reader
 *
 * Covers delimiters, comments, header skipping, "one row per sample" shapes and the
 * errors raised for unreadable or malformed tables.
 */

#include <catch2/catch_test_macros.hpp>

#include "mlmc_model/data_table.hpp"
#include "mlmc_model/errors.hpp"

#include "support/test_data.hpp"

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using mlmc::model::DataTable;
using mlmc::model::DataTableReader;
using mlmc::model::testing::data_path;

namespace {

DataTable parse_text(const std::string& text, DataTableReader::Options options = {}) {
    std::istringstream input(text);
    return DataTableReader(options).parse(input, "inline");
}

} // namespace

TEST_CASE("Single column file yields one row per line", "[data_table][shape]")
{
    const auto table = DataTableReader{}.read(data_path("spring_mass_1D_inputs.txt"));
    REQUIRE(table.rows() == 20);
    REQUIRE(table.columns() == 1);
    REQUIRE(table.at(0, 0) == 1.647666);
    REQUIRE(table.source() == data_path("spring_mass_1D_inputs.txt").string());
}

TEST_CASE("Single line file yields one row", "[data_table][shape]")
{
    const auto table = parse_text("1 2 3 4 5\n");
    REQUIRE(table.rows() == 1);
    REQUIRE(table.columns() == 5);
    REQUIRE(table.row(0) == std::vector<double>{1, 2, 3, 4, 5});
}

TEST_CASE("Commas and whitespace both separate cells by default", "[data_table][delimiter]")
{
    const auto table = parse_text("1,2 3\n4 , 5\t6\n");
    REQUIRE(table.rows() == 2);
    REQUIRE(table.columns() == 3);
    REQUIRE(table.row(1) == std::vector<double>{4, 5, 6});
}

TEST_CASE("Explicit delimiter keeps empty cells and rejects them as missing", "[data_table][delimiter]")
{
    DataTableReader::Options options;
    options.delimiter = ',';

    const auto table = parse_text("1.5,2.5\n3.5, 4.5\n", options);
    REQUIRE(table.row(1) == std::vector<double>{3.5, 4.5});

    REQUIRE_THROWS_AS(parse_text("1,,3\n4,5,6\n", options), mlmc::model::DataValidationError);
}

TEST_CASE("Comments and blank lines are ignored", "[data_table][comments]")
{
    const auto table = parse_text("# header comment\n\n1 2  # trailing\n   \n3 4\n");
    REQUIRE(table.rows() == 2);
    REQUIRE(table.row(0) == std::vector<double>{1, 2});
}

TEST_CASE("Header rows are skipped before parsing", "[data_table][skip_header]")
{
    DataTableReader::Options options;
    options.skip_header_rows = 1;

    const auto table = DataTableReader(options).read(data_path("2D_test_data_header.csv"));
    REQUIRE(table.rows() == 2);
    REQUIRE(table.row(0) == std::vector<double>{1, 2, 3, 4, 5});

    // The textual header is not numeric when it is not skipped.
    REQUIRE_THROWS_AS(DataTableReader{}.read(data_path("2D_test_data_header.csv")),
                      mlmc::model::DataValidationError);
}

TEST_CASE("Skipping more rows than the file holds is an error", "[data_table][skip_header]")
{
    DataTableReader::Options options;
    options.skip_header_rows = 50;
    REQUIRE_THROWS_AS(DataTableReader(options).read(data_path("2D_test_data.csv")), mlmc::model::DataFileError);

    options.skip_header_rows = 6;
    REQUIRE_THROWS_AS(DataTableReader(options).read(data_path("2D_test_data.csv")),
                      mlmc::model::DataValidationError);
}

TEST_CASE("Malformed tables are rejected", "[data_table][errors]")
{
    SECTION("ragged rows")
    {
        REQUIRE_THROWS_AS(parse_text("1 2 3\n4 5\n"), mlmc::model::DataValidationError);
    }

    SECTION("non-numeric cell")
    {
        REQUIRE_THROWS_AS(parse_text("1 2\n3 four\n"), mlmc::model::DataValidationError);
    }

    SECTION("explicit NaN")
    {
        REQUIRE_THROWS_AS(parse_text("1 nan\n"), mlmc::model::DataValidationError);
    }

    SECTION("empty file")
    {
        REQUIRE_THROWS_AS(parse_text("# only a comment\n\n"), mlmc::model::DataValidationError);
    }

    SECTION("delimiter equal to the comment character")
    {
        DataTableReader::Options options;
        options.delimiter = '#';
        REQUIRE_THROWS_AS(parse_text("1#2\n", options), mlmc::model::InvalidParameterError);
    }
}

TEST_CASE("Missing files raise DataFileError", "[data_table][errors]")
{
    REQUIRE_THROWS_AS(DataTableReader{}.read(data_path("does_not_exist.txt")), mlmc::model::DataFileError);
    REQUIRE_THROWS_AS(DataTableReader{}.read(data_path("models")), mlmc::model::DataFileError);
}

TEST_CASE("In-memory tables validate their shape", "[data_table][memory]")
{
    const auto table = DataTable::from_rows({{1, 2}, {3, 4}}, "memory");
    REQUIRE(table.rows() == 2);
    REQUIRE(table.columns() == 2);
    REQUIRE(table.at(1, 0) == 3);
    REQUIRE_THROWS_AS(table.at(2, 0), std::out_of_range);

    REQUIRE_THROWS_AS(DataTable::from_rows({{1, 2}, {3}}), mlmc::model::DataValidationError);
    REQUIRE_THROWS_AS(DataTable(2, 2, std::vector<double>{1, 2, 3}), mlmc::model::DataValidationError);
}
