#include "mlmc_model/sample.hpp"

#include "mlmc_model/errors.hpp"
#include "text_utils.hpp"

#include <string>

namespace mlmc::model {

Sample parse_sample(std::string_view text) {
    const auto fields = detail::split_fields(text, std::nullopt);
    if (fields.empty()) {
        throw SampleShapeError("Sample contains no values");
    }

    Sample sample;
    sample.reserve(fields.size());
    for (const auto& field : fields) {
        const auto value = detail::parse_double(field);
        if (!value) {
            throw SampleTypeError("Sample value '" + field + "' is not numeric");
        }
        sample.push_back(*value);
    }
    return sample;
}

}  // namespace mlmc::model
