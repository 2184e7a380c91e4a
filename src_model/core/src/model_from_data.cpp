#include "mlmc_model/model_from_data.hpp"

#include "mlmc_model/errors.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <sstream>
#include <string>
#include <thread>
#include <utility>

namespace {

using mlmc::model::DataTable;

// Sleeping is only accurate to a few milliseconds; the tail of the delay is spun.
constexpr auto kSpinWindow = std::chrono::milliseconds(2);

using Clock = std::chrono::steady_clock;

// Half the clock range keeps now() + cost representable for any realistic uptime.
double max_cost_seconds() {
    return std::chrono::duration<double>(Clock::duration::max()).count() / 2.0;
}

void check_cost(double cost) {
    if (!std::isfinite(cost) || cost < 0.0) {
        std::ostringstream oss;
        oss << "Model cost must be a finite, non-negative number (got " << cost << ")";
        throw mlmc::model::InvalidParameterError(oss.str());
    }
    if (cost > max_cost_seconds()) {
        std::ostringstream oss;
        oss << "Model cost " << cost << " s exceeds the longest supported delay of " << max_cost_seconds()
            << " s";
        throw mlmc::model::InvalidParameterError(oss.str());
    }
}

void check_no_nan(const DataTable& table) {
    const auto& values = table.values();
    const auto it = std::find_if(values.begin(), values.end(), [](double v) { return std::isnan(v); });
    if (it != values.end()) {
        const auto index = static_cast<std::size_t>(it - values.begin());
        throw mlmc::model::DataValidationError("NaN value in " + table.source() + " at row " +
                                               std::to_string(index / table.columns() + 1) + " column " +
                                               std::to_string(index % table.columns() + 1));
    }
}

std::string describe(const double* row, std::size_t columns) {
    std::ostringstream oss;
    oss << '[';
    for (std::size_t c = 0; c < columns; ++c) {
        if (c != 0) {
            oss << ", ";
        }
        oss << row[c];
    }
    oss << ']';
    return oss.str();
}

}  // namespace

namespace mlmc::model {

ModelFromData::ModelFromData(const Config& config)
    : cost_(config.cost), wait_cost_duration_(config.wait_cost_duration) {
    check_cost(cost_);
    if (config.input_file.empty()) {
        throw InvalidParameterError("Input data file name is empty");
    }
    if (config.output_file.empty()) {
        throw InvalidParameterError("Output data file name is empty");
    }

    DataTableReader::Options options;
    options.skip_header_rows = config.skip_header_rows;
    options.delimiter = config.delimiter;
    const DataTableReader reader(options);

    inputs_ = reader.read(config.input_file);
    outputs_ = reader.read(config.output_file);

    validate();
    build_index();
}

ModelFromData::ModelFromData(DataTable inputs, DataTable outputs, double cost, bool wait_cost_duration)
    : inputs_(std::move(inputs)),
      outputs_(std::move(outputs)),
      cost_(cost),
      wait_cost_duration_(wait_cost_duration) {
    check_cost(cost_);
    validate();
    build_index();
}

void ModelFromData::validate() const {
    if (inputs_.empty() || inputs_.columns() == 0) {
        throw DataValidationError("Input table " + inputs_.source() + " is empty");
    }
    if (outputs_.empty() || outputs_.columns() == 0) {
        throw DataValidationError("Output table " + outputs_.source() + " is empty");
    }

    check_no_nan(inputs_);
    check_no_nan(outputs_);

    if (inputs_.rows() != outputs_.rows()) {
        throw DataValidationError("Input table " + inputs_.source() + " has " + std::to_string(inputs_.rows()) +
                                  " rows but output table " + outputs_.source() + " has " +
                                  std::to_string(outputs_.rows()));
    }
}

void ModelFromData::build_index() {
    const std::size_t columns = inputs_.columns();
    order_.resize(inputs_.rows());
    for (std::size_t i = 0; i < order_.size(); ++i) {
        order_[i] = i;
    }

    std::stable_sort(order_.begin(), order_.end(), [&](std::size_t a, std::size_t b) {
        const double* ra = inputs_.row_data(a);
        const double* rb = inputs_.row_data(b);
        return std::lexicographical_compare(ra, ra + columns, rb, rb + columns);
    });

    const auto duplicate = std::adjacent_find(order_.begin(), order_.end(), [&](std::size_t a, std::size_t b) {
        const double* ra = inputs_.row_data(a);
        return std::equal(ra, ra + columns, inputs_.row_data(b));
    });
    if (duplicate != order_.end()) {
        throw DataValidationError("Duplicate input rows " + std::to_string(*duplicate + 1) + " and " +
                                  std::to_string(*(duplicate + 1) + 1) + " in " + inputs_.source() + ": " +
                                  describe(inputs_.row_data(*duplicate), columns));
    }
}

std::size_t ModelFromData::find_row(const Sample& sample) const {
    const std::size_t columns = inputs_.columns();
    if (sample.empty()) {
        throw SampleShapeError("Sample contains no values");
    }
    if (sample.size() != columns) {
        throw SampleShapeError("Sample has " + std::to_string(sample.size()) + " values but " +
                               inputs_.source() + " rows have " + std::to_string(columns));
    }

    const auto it = std::lower_bound(order_.begin(), order_.end(), sample, [&](std::size_t index, const Sample& s) {
        const double* row = inputs_.row_data(index);
        return std::lexicographical_compare(row, row + columns, s.begin(), s.end());
    });
    if (it == order_.end() || !std::equal(sample.begin(), sample.end(), inputs_.row_data(*it))) {
        throw SampleNotFoundError("Input " + describe(sample.data(), columns) + " not found in " +
                                  inputs_.source());
    }
    return *it;
}

void ModelFromData::wait_for_cost() const {
    const auto start = Clock::now();
    const auto budget = std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(cost_));
    const auto deadline = budget < Clock::time_point::max() - start ? start + budget : Clock::time_point::max();

    if (deadline - Clock::now() > kSpinWindow) {
        std::this_thread::sleep_until(deadline - kSpinWindow);
    }
    while (Clock::now() < deadline) {
        std::this_thread::yield();
    }
}

Output ModelFromData::evaluate(const Sample& sample) const {
    const std::size_t row = find_row(sample);
    if (wait_cost_duration_) {
        wait_for_cost();
    }
    return outputs_.row(row);
}

Output ModelFromData::evaluate(double value) const {
    return evaluate(Sample{value});
}

Output ModelFromData::evaluate(const SampleMatrix& sample) const {
    if (sample.size() != 1) {
        throw SampleShapeError("Sample matrix must hold exactly one row (got " + std::to_string(sample.size()) +
                               ")");
    }
    return evaluate(sample.front());
}

Output ModelFromData::evaluate(std::string_view text) const {
    return evaluate(parse_sample(text));
}

}  // namespace mlmc::model
