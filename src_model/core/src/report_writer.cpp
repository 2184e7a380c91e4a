#include "mlmc_model/report_writer.hpp"

#include "mlmc_model/errors.hpp"

#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace {

using nlohmann::json;

json outcome_to_json(const mlmc::model::EvaluationOutcome& outcome) {
    json result = {
        {"model", outcome.model_id},
        {"query_index", outcome.query.index},
        {"query", outcome.query.text},
        {"status", outcome.status},
        {"elapsed_s", outcome.elapsed_s},
    };
    if (outcome.status == "OK") {
        result["output"] = outcome.output;
    } else {
        result["message"] = outcome.message;
    }
    return result;
}

json build_summary(const std::vector<mlmc::model::EvaluationOutcome>& outcomes) {
    json summary = {
        {"total", outcomes.size()},
        {"by_status", json::object()},
        {"by_model", json::object()},
        {"evaluations", json::array()},
    };

    auto& by_status = summary["by_status"];
    auto& by_model = summary["by_model"];
    for (const auto& outcome : outcomes) {
        summary["evaluations"].push_back(outcome_to_json(outcome));

        auto& counter = by_status[outcome.status];
        if (!counter.is_number()) {
            counter = 0;
        }
        counter = counter.get<std::size_t>() + 1;

        auto& model = by_model[outcome.model_id];
        if (!model.is_object()) {
            model = {{"evaluations", 0}, {"elapsed_s", 0.0}};
        }
        model["evaluations"] = model["evaluations"].get<std::size_t>() + 1;
        model["elapsed_s"] = model["elapsed_s"].get<double>() + outcome.elapsed_s;
    }

    return summary;
}

// RFC 4180 quoting for free-text fields.
std::string csv_field(const std::string& text) {
    if (text.find_first_of(",\"\r\n") == std::string::npos) {
        return text;
    }
    std::string quoted = "\"";
    for (char ch : text) {
        if (ch == '"') {
            quoted.push_back('"');
        }
        quoted.push_back(ch);
    }
    quoted.push_back('"');
    return quoted;
}

std::string render_csv(const std::vector<mlmc::model::EvaluationOutcome>& outcomes) {
    std::ostringstream oss;
    oss.precision(std::numeric_limits<double>::max_digits10);
    oss << "model,query,status,elapsed_s,output\n";
    for (const auto& outcome : outcomes) {
        oss << csv_field(outcome.model_id) << ',' << outcome.query.index << ',' << csv_field(outcome.status)
            << ',' << outcome.elapsed_s;
        for (double value : outcome.output) {
            oss << ',' << value;
        }
        oss << '\n';
    }
    return oss.str();
}

void ensure_parent(const std::filesystem::path& destination) {
    const auto parent = destination.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        std::filesystem::create_directories(parent);
    }
}

void write_file(const std::filesystem::path& destination, const std::string& content) {
    ensure_parent(destination);
    std::ofstream output(destination, std::ios::binary);
    if (!output.is_open()) {
        throw mlmc::model::DataFileError("Unable to open output file: " + destination.string());
    }
    output << content;
    if (!output) {
        throw mlmc::model::DataFileError("Write failure on output file: " + destination.string());
    }
}

}  // namespace

namespace mlmc::model {

void ReportWriter::write_summary(const std::filesystem::path& destination,
                                 const std::vector<EvaluationOutcome>& outcomes) const {
    const json summary = build_summary(outcomes);
    write_file(destination, summary.dump(2));
}

void ReportWriter::write_outputs(const std::filesystem::path& destination,
                                 const std::vector<EvaluationOutcome>& outcomes) const {
    write_file(destination, render_csv(outcomes));
}

}  // namespace mlmc::model
