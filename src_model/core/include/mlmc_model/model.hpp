#pragma once

#include "sample.hpp"

namespace mlmc::model {

/**
 * \brief Capability consumed by the MLMC sampling driver.
 *
 * A model maps one sample to one output row. Implementations that hold no mutable
 * state may be evaluated from several threads at once.
 */
class Model {
public:
    virtual ~Model() = default;

    [[nodiscard]] virtual Output evaluate(const Sample& sample) const = 0;
};

}  // namespace mlmc::model
