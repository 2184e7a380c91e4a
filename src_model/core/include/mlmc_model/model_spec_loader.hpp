#pragma once

#include "model_from_data.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace mlmc::model {

/**
 * \brief One data-backed model described in a model file.
 *
 * Paths inside `config` are already resolved against the directory of the model file.
 */
struct ModelSpec {
    std::string id;
    ModelFromData::Config config{};
};

/**
 * \brief All model descriptions read from one file.
 */
struct ModelSpecPack {
    std::string source_file;
    std::vector<ModelSpec> models;
};

/**
 * \brief Parses a cost given as text. Exactly one numeric token is accepted.
 *
 * Lists ("1,2", "[1, 2]", "0 0 0"), words ("one"), NaN and negative values raise
 * InvalidParameterError.
 */
[[nodiscard]] double parse_cost(std::string_view raw);

/**
 * \brief Loads declarative data model descriptions from disk.
 *
 * The format is line oriented. Each file holds one or more model blocks separated by a
 * line containing three dashes (`---`). Within a block, entries take the form
 * `key=value` with leading/trailing whitespace ignored.
 *
 * Recognised keys:
 *   - `id`: Optional model identifier. Falls back to `<file-stem>#<index>`.
 *   - `inputs`: Required input table, relative to the model file.
 *   - `outputs`: Required output table, relative to the model file.
 *   - `cost`: Required scalar cost (see parse_cost()).
 *   - `skip_header`: Optional count of leading lines skipped in both tables.
 *   - `delimiter`: Optional cell separator. `auto` (default), `whitespace`, `comma`,
 *                  `tab`, `semicolon`, or a single character.
 *   - `wait_cost_duration`: Optional boolean. Honours `true/false`, `yes/no` and `1/0`
 *                           (case-insensitive).
 *
 * Example:
 * \code{.txt}
 * id=spring_mass_h0.1
 * inputs=data/spring_mass_1D_inputs.txt
 * outputs=data/spring_mass_1D_outputs_0.1.txt
 * cost=0.1
 * ---
 * id=spring_mass_h0.01
 * inputs=data/spring_mass_1D_inputs.txt
 * outputs=data/spring_mass_1D_outputs_0.01.txt
 * cost=1.0
 * wait_cost_duration=yes
 * \endcode
 *
 * Lines starting with `#` or empty lines are ignored. Unknown keys, malformed lines and
 * blocks missing a required key raise InvalidParameterError naming file and line.
 */
class ModelSpecLoader {
public:
    ModelSpecLoader() = default;

    [[nodiscard]] ModelSpecPack load(const std::filesystem::path& file) const;

    /// Loads every `*.model` file below \p root in sorted order; a file path loads that file.
    [[nodiscard]] std::vector<ModelSpecPack> load_directory(const std::filesystem::path& root) const;
};

}  // namespace mlmc::model
