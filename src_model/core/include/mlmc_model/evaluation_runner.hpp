#pragma once

#include "model.hpp"
#include "model_spec_loader.hpp"
#include "sample.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace mlmc::model {

/// One query line as read from a query file.
struct Query {
    std::size_t index{0};  ///< 1-based position in the query file
    std::string text;
};

struct EvaluationOutcome {
    std::string model_id;
    Query query{};
    std::string status;   ///< OK / NOT_FOUND / TYPE_ERROR / SHAPE_ERROR
    Output output{};      ///< Empty unless status is OK
    double elapsed_s{0.0};
    std::string message;  ///< Diagnostics for failed queries
};

/**
 * \brief Reads one query per non-blank line; `#` starts a comment.
 *
 * Query lines are kept as text so that malformed queries surface as TYPE_ERROR outcomes
 * instead of aborting the run. Throws DataFileError when the file cannot be read.
 */
[[nodiscard]] std::vector<Query> load_queries(const std::filesystem::path& file);

/**
 * \brief Replays queries against data-backed models and records one outcome per query.
 *
 * Per-query failures (type, shape, missing input) become outcomes. Errors raised while
 * building a model from its description propagate: they are configuration problems.
 */
class EvaluationRunner {
public:
    struct Config {
        bool honor_cost_delay{true};  ///< false disables wait_cost_duration for every model
    };

    explicit EvaluationRunner(Config config);

    [[nodiscard]] std::vector<EvaluationOutcome> run(const ModelSpecPack& pack,
                                                     const std::vector<Query>& queries) const;

    [[nodiscard]] std::vector<EvaluationOutcome> evaluate_queries(const std::string& model_id,
                                                                  const Model& model,
                                                                  const std::vector<Query>& queries) const;

private:
    Config config_;
};

}  // namespace mlmc::model
