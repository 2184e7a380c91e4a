/**
 * @file test_report_writer.cpp
 * @brief Tests for the JSON summary and CSV output reports
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "mlmc_model/evaluation_runner.hpp"
#include "mlmc_model/report_writer.hpp"

#include "support/test_data.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

using mlmc::model::EvaluationOutcome;
using mlmc::model::ReportWriter;
using mlmc::model::testing::ScratchDir;
using mlmc::model::testing::read_text;

namespace {

std::vector<EvaluationOutcome> sample_outcomes() {
    EvaluationOutcome hit{};
    hit.model_id = "coarse";
    hit.query = {1, "1 2"};
    hit.status = "OK";
    hit.output = {0.25, 3.0};
    hit.elapsed_s = 0.5;

    EvaluationOutcome miss{};
    miss.model_id = "coarse";
    miss.query = {2, "9 9"};
    miss.status = "NOT_FOUND";
    miss.elapsed_s = 0.25;
    miss.message = "Input [9, 9] not found";

    EvaluationOutcome fine{};
    fine.model_id = "fine";
    fine.query = {1, "1 2"};
    fine.status = "OK";
    fine.output = {0.1};
    fine.elapsed_s = 2.0;

    return {hit, miss, fine};
}

} // namespace

TEST_CASE("Summary JSON carries counts and per-query results", "[report][json]")
{
    const ScratchDir dir("report_json");
    const auto destination = dir.path() / "nested" / "summary.json";

    ReportWriter{}.write_summary(destination, sample_outcomes());

    const auto summary = nlohmann::json::parse(read_text(destination));
    REQUIRE(summary["total"] == 3);
    REQUIRE(summary["by_status"]["OK"] == 2);
    REQUIRE(summary["by_status"]["NOT_FOUND"] == 1);
    REQUIRE(summary["by_model"]["coarse"]["evaluations"] == 2);
    REQUIRE(summary["by_model"]["coarse"]["elapsed_s"].get<double>() == Catch::Approx(0.75));

    const auto& evaluations = summary["evaluations"];
    REQUIRE(evaluations.size() == 3);
    REQUIRE(evaluations[0]["output"] == nlohmann::json::array({0.25, 3.0}));
    REQUIRE_FALSE(evaluations[0].contains("message"));
    REQUIRE(evaluations[1]["message"] == "Input [9, 9] not found");
    REQUIRE_FALSE(evaluations[1].contains("output"));
    REQUIRE(evaluations[2]["query_index"] == 1);
}

TEST_CASE("Outputs CSV lists one line per evaluation", "[report][csv]")
{
    const ScratchDir dir("report_csv");
    const auto destination = dir.path() / "outputs.csv";

    ReportWriter{}.write_outputs(destination, sample_outcomes());

    const auto text = read_text(destination);
    REQUIRE(text ==
            "model,query,status,elapsed_s,output\n"
            "coarse,1,OK,0.5,0.25,3\n"
            "coarse,2,NOT_FOUND,0.25\n"
            "fine,1,OK,2,0.10000000000000001\n");
}

TEST_CASE("Outputs CSV quotes model ids holding separators or quotes", "[report][csv]")
{
    const ScratchDir dir("report_csv_quoting");
    const auto destination = dir.path() / "outputs.csv";

    auto outcomes = sample_outcomes();
    outcomes[0].model_id = "a,b";
    outcomes[2].model_id = "say \"fine\"";

    ReportWriter{}.write_outputs(destination, outcomes);

    REQUIRE(read_text(destination) ==
            "model,query,status,elapsed_s,output\n"
            "\"a,b\",1,OK,0.5,0.25,3\n"
            "coarse,2,NOT_FOUND,0.25\n"
            "\"say \"\"fine\"\"\",1,OK,2,0.10000000000000001\n");
}
