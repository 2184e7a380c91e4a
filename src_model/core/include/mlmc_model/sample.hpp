#pragma once

#include <string_view>
#include <vector>

namespace mlmc::model {

/// One query row handed to a model.
using Sample = std::vector<double>;

/// One recorded result row returned by a model.
using Output = std::vector<double>;

/// Two-dimensional query; models accept it only when it holds exactly one row.
using SampleMatrix = std::vector<std::vector<double>>;

/**
 * \brief Parses a textual query such as `"1, 2, 3"` or `"0.5 1.5"` into a Sample.
 *
 * Commas and whitespace both separate values. Throws SampleTypeError when a token is
 * not a number and SampleShapeError when the text holds no values.
 */
[[nodiscard]] Sample parse_sample(std::string_view text);

}  // namespace mlmc::model
