#pragma once

#include "mlmc_model/model.hpp"

namespace mlmc::model::testing {

/// Trivial model used to exercise code written against the Model interface.
class ModelForTesting : public Model {
public:
    enum class Kind { Ones, Repeat };

    explicit ModelForTesting(Kind kind = Kind::Ones) : kind_(kind) {}

    [[nodiscard]] Output evaluate(const Sample& sample) const override {
        if (kind_ == Kind::Repeat) {
            return sample;
        }
        return Output{1.0};
    }

private:
    Kind kind_;
};

}  // namespace mlmc::model::testing
