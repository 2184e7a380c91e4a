#pragma once

#include "data_table.hpp"
#include "model.hpp"
#include "sample.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace mlmc::model {

/**
 * \brief Surrogate model answering queries from previously recorded input/output pairs.
 *
 * Both tables are loaded and validated once, at construction:
 *   - no NaN cells in either table,
 *   - identical row counts (row i of the outputs belongs to row i of the inputs),
 *   - no two identical input rows,
 *   - a finite, non-negative cost that fits the steady clock (about 146 years at most).
 *
 * evaluate() performs an exact-match lookup; it never interpolates. When
 * `wait_cost_duration` is set, a successful lookup blocks the calling thread for `cost`
 * seconds before returning, to emulate the run time of the model the data came from.
 *
 * The object is immutable after construction and may be evaluated concurrently.
 */
class ModelFromData : public Model {
public:
    struct Config {
        std::filesystem::path input_file{};
        std::filesystem::path output_file{};
        double cost{0.0};
        std::size_t skip_header_rows{0};
        std::optional<char> delimiter{};  ///< Unset: commas and whitespace both separate cells
        bool wait_cost_duration{false};
    };

    explicit ModelFromData(const Config& config);

    ModelFromData(DataTable inputs, DataTable outputs, double cost, bool wait_cost_duration = false);

    [[nodiscard]] Output evaluate(const Sample& sample) const override;

    /// Convenience for single-column input tables.
    [[nodiscard]] Output evaluate(double value) const;

    /// Accepts a matrix holding exactly one row; anything else raises SampleShapeError.
    [[nodiscard]] Output evaluate(const SampleMatrix& sample) const;

    /// Parses \p text with parse_sample(); non-numeric text raises SampleTypeError.
    [[nodiscard]] Output evaluate(std::string_view text) const;

    [[nodiscard]] const DataTable& inputs() const noexcept { return inputs_; }
    [[nodiscard]] const DataTable& outputs() const noexcept { return outputs_; }
    [[nodiscard]] double cost() const noexcept { return cost_; }
    [[nodiscard]] bool waits_cost_duration() const noexcept { return wait_cost_duration_; }

private:
    DataTable inputs_;
    DataTable outputs_;
    double cost_{0.0};
    bool wait_cost_duration_{false};
    std::vector<std::size_t> order_;  ///< Input row indices in lexicographic row order

    void validate() const;
    void build_index();
    [[nodiscard]] std::size_t find_row(const Sample& sample) const;
    void wait_for_cost() const;
};

}  // namespace mlmc::model
