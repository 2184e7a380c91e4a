#pragma once

#include "evaluation_runner.hpp"

#include <filesystem>
#include <vector>

namespace mlmc::model {

/**
 * \brief Emits machine-readable reports for evaluation runs.
 *
 * - write_summary(): JSON document with aggregate counts and per-query results.
 * - write_outputs(): CSV table `model,query,status,elapsed_s,output_1,...` for feeding
 *   recorded outputs back into downstream estimators.
 *
 * Parent directories are created on demand; failures raise DataFileError.
 */
class ReportWriter {
public:
    ReportWriter() = default;

    void write_summary(const std::filesystem::path& destination,
                       const std::vector<EvaluationOutcome>& outcomes) const;

    void write_outputs(const std::filesystem::path& destination,
                       const std::vector<EvaluationOutcome>& outcomes) const;
};

}  // namespace mlmc::model
