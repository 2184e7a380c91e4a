#include "mlmc_model/model_spec_loader.hpp"

#include "mlmc_model/errors.hpp"
#include "text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

using mlmc::model::InvalidParameterError;

constexpr std::string_view kModelExtension = ".model";

std::string location(const std::filesystem::path& file, std::size_t line_no) {
    return file.string() + ":" + std::to_string(line_no);
}

bool parse_boolean(std::string_view raw,
                   const std::filesystem::path& file,
                   std::size_t line_no) {
    const auto lowered = mlmc::model::detail::to_lower_copy(raw);
    if (lowered == "true" || lowered == "yes" || lowered == "1") {
        return true;
    }
    if (lowered == "false" || lowered == "no" || lowered == "0") {
        return false;
    }
    throw InvalidParameterError("Invalid boolean value '" + std::string{raw} + "' at " +
                                location(file, line_no));
}

std::size_t parse_count(std::string_view raw,
                        const std::filesystem::path& file,
                        std::size_t line_no) {
    const bool digits_only = !raw.empty() && std::all_of(raw.begin(), raw.end(), [](unsigned char ch) {
        return std::isdigit(ch) != 0;
    });
    if (!digits_only || raw.size() > 9) {
        throw InvalidParameterError("Invalid row count '" + std::string{raw} + "' at " +
                                    location(file, line_no));
    }
    std::size_t value = 0;
    for (char ch : raw) {
        value = value * 10 + static_cast<std::size_t>(ch - '0');
    }
    return value;
}

std::optional<char> parse_delimiter(std::string_view raw,
                                    const std::filesystem::path& file,
                                    std::size_t line_no) {
    const auto lowered = mlmc::model::detail::to_lower_copy(raw);
    if (lowered.empty() || lowered == "auto") {
        return std::nullopt;
    }
    if (lowered == "whitespace" || lowered == "space") {
        return ' ';
    }
    if (lowered == "comma") {
        return ',';
    }
    if (lowered == "tab") {
        return '\t';
    }
    if (lowered == "semicolon") {
        return ';';
    }
    if (raw.size() == 1 && raw.front() != '#') {
        return raw.front();
    }
    throw InvalidParameterError("Invalid delimiter '" + std::string{raw} + "' at " +
                                location(file, line_no));
}

std::filesystem::path resolve(const std::filesystem::path& base, const std::string& value) {
    std::filesystem::path path{value};
    if (path.is_relative()) {
        path = base / path;
    }
    return path.lexically_normal();
}

}  // namespace

namespace mlmc::model {

double parse_cost(std::string_view raw) {
    const auto fields = detail::split_fields(raw, std::nullopt);
    if (fields.size() != 1) {
        throw InvalidParameterError("Cost must be a single number (got '" + std::string{raw} + "')");
    }
    const auto value = detail::parse_double(fields.front());
    if (!value) {
        throw InvalidParameterError("Cost must be a number (got '" + std::string{raw} + "')");
    }
    if (!std::isfinite(*value) || *value < 0.0) {
        throw InvalidParameterError("Cost must be finite and non-negative (got '" + std::string{raw} + "')");
    }
    return *value;
}

ModelSpecPack ModelSpecLoader::load(const std::filesystem::path& file) const {
    if (!std::filesystem::exists(file)) {
        throw InvalidParameterError("Model file does not exist: " + file.string());
    }
    if (!std::filesystem::is_regular_file(file)) {
        throw InvalidParameterError("Model path is not a regular file: " + file.string());
    }

    std::ifstream input(file);
    if (!input.is_open()) {
        throw InvalidParameterError("Unable to open model file: " + file.string());
    }

    ModelSpecPack pack;
    pack.source_file = file.string();

    std::string id_prefix = file.stem().string();
    if (id_prefix.empty()) {
        id_prefix = file.filename().string();
    }
    const auto base_dir = file.parent_path();

    ModelSpec current;
    bool touched = false;
    bool has_inputs = false;
    bool has_outputs = false;
    bool has_cost = false;
    std::size_t block_line = 0;

    auto reset_current = [&]() {
        current = ModelSpec{};
        touched = false;
        has_inputs = false;
        has_outputs = false;
        has_cost = false;
    };

    auto push_current = [&]() {
        if (!touched) {
            reset_current();
            return;
        }
        const char* missing = !has_inputs ? "inputs" : !has_outputs ? "outputs" : !has_cost ? "cost" : nullptr;
        if (missing != nullptr) {
            throw InvalidParameterError("Model block starting at " + location(file, block_line) +
                                        " is missing required key '" + missing + "'");
        }
        if (current.id.empty()) {
            current.id = id_prefix + "#" + std::to_string(pack.models.size() + 1);
        }
        pack.models.emplace_back(std::move(current));
        reset_current();
    };

    std::string raw_line;
    std::size_t line_no = 0;
    while (std::getline(input, raw_line)) {
        ++line_no;

        const auto trimmed = detail::trim_copy(raw_line);
        if (trimmed.empty() || trimmed.front() == '#') {
            continue;
        }

        if (trimmed == "---") {
            push_current();
            continue;
        }

        const auto separator = trimmed.find('=');
        if (separator == std::string::npos) {
            throw InvalidParameterError("Expected 'key=value' entry at " + location(file, line_no));
        }

        const auto key = detail::to_lower_copy(detail::trim_copy(trimmed.substr(0, separator)));
        auto value = detail::trim_copy(trimmed.substr(separator + 1));

        if (key.empty()) {
            throw InvalidParameterError("Empty key at " + location(file, line_no));
        }

        if (!touched) {
            block_line = line_no;
        }
        touched = true;

        if (key == "id") {
            current.id = std::move(value);
        } else if (key == "inputs") {
            current.config.input_file = resolve(base_dir, value);
            has_inputs = true;
        } else if (key == "outputs") {
            current.config.output_file = resolve(base_dir, value);
            has_outputs = true;
        } else if (key == "cost") {
            try {
                current.config.cost = parse_cost(value);
            } catch (const InvalidParameterError& ex) {
                throw InvalidParameterError(std::string{ex.what()} + " at " + location(file, line_no));
            }
            has_cost = true;
        } else if (key == "skip_header") {
            current.config.skip_header_rows = parse_count(value, file, line_no);
        } else if (key == "delimiter") {
            current.config.delimiter = parse_delimiter(value, file, line_no);
        } else if (key == "wait_cost_duration") {
            current.config.wait_cost_duration = parse_boolean(value, file, line_no);
        } else {
            throw InvalidParameterError("Unknown key '" + key + "' at " + location(file, line_no));
        }
    }

    push_current();
    return pack;
}

std::vector<ModelSpecPack> ModelSpecLoader::load_directory(const std::filesystem::path& root) const {
    if (!std::filesystem::exists(root)) {
        throw InvalidParameterError("Model root does not exist: " + root.string());
    }

    if (!std::filesystem::is_directory(root)) {
        return {load(root)};
    }

    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(root)) {
        if (entry.is_regular_file() && entry.path().extension() == kModelExtension) {
            files.emplace_back(entry.path());
        }
    }

    std::sort(files.begin(), files.end());

    std::vector<ModelSpecPack> packs;
    packs.reserve(files.size());
    for (const auto& path : files) {
        packs.emplace_back(load(path));
    }
    return packs;
}

}  // namespace mlmc::model
