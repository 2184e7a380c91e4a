#include "mlmc_model/evaluation_runner.hpp"

#include "mlmc_model/errors.hpp"
#include "mlmc_model/model_from_data.hpp"
#include "text_utils.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mlmc::model {

std::vector<Query> load_queries(const std::filesystem::path& file) {
    if (!std::filesystem::is_regular_file(file)) {
        throw DataFileError("Query file does not exist or is not a regular file: " + file.string());
    }
    std::ifstream input(file);
    if (!input.is_open()) {
        throw DataFileError("Unable to open query file: " + file.string());
    }

    std::vector<Query> queries;
    std::string raw_line;
    while (std::getline(input, raw_line)) {
        const auto comment = raw_line.find('#');
        auto text = detail::trim_copy(std::string_view{raw_line}.substr(0, comment));
        if (text.empty()) {
            continue;
        }
        queries.push_back(Query{queries.size() + 1, std::move(text)});
    }
    if (input.bad()) {
        throw DataFileError("Read failure on query file: " + file.string());
    }
    return queries;
}

EvaluationRunner::EvaluationRunner(Config config) : config_(config) {}

std::vector<EvaluationOutcome> EvaluationRunner::run(const ModelSpecPack& pack,
                                                     const std::vector<Query>& queries) const {
    std::vector<EvaluationOutcome> outcomes;
    outcomes.reserve(pack.models.size() * queries.size());

    for (const auto& spec : pack.models) {
        auto model_config = spec.config;
        if (!config_.honor_cost_delay) {
            model_config.wait_cost_duration = false;
        }
        const ModelFromData model(model_config);

        auto partial = evaluate_queries(spec.id, model, queries);
        outcomes.insert(outcomes.end(),
                        std::make_move_iterator(partial.begin()),
                        std::make_move_iterator(partial.end()));
    }
    return outcomes;
}

std::vector<EvaluationOutcome> EvaluationRunner::evaluate_queries(const std::string& model_id,
                                                                  const Model& model,
                                                                  const std::vector<Query>& queries) const {
    using clock = std::chrono::steady_clock;

    std::vector<EvaluationOutcome> outcomes;
    outcomes.reserve(queries.size());

    for (const auto& query : queries) {
        EvaluationOutcome outcome{};
        outcome.model_id = model_id;
        outcome.query = query;

        const auto start = clock::now();
        try {
            outcome.output = model.evaluate(parse_sample(query.text));
            outcome.status = "OK";
        } catch (const SampleTypeError& ex) {
            outcome.status = "TYPE_ERROR";
            outcome.message = ex.what();
        } catch (const SampleShapeError& ex) {
            outcome.status = "SHAPE_ERROR";
            outcome.message = ex.what();
        } catch (const SampleNotFoundError& ex) {
            outcome.status = "NOT_FOUND";
            outcome.message = ex.what();
        }
        outcome.elapsed_s = std::chrono::duration<double>(clock::now() - start).count();

        outcomes.push_back(std::move(outcome));
    }
    return outcomes;
}

}  // namespace mlmc::model
