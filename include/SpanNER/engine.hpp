#pragma once

#include <string>

#include "spanner_structs.hpp"

namespace spanner {
    // Opaque tensor computation: named inputs in, named outputs out.
    // Implementations must not keep references to the inputs after returning.
    class Engine {
    public:
        virtual ~Engine() {};
        virtual TensorMap run(const TensorMap& inputs) = 0;
    };

    const Tensor& requireOutput(const TensorMap& outputs, const std::string& name);
    // For single-output sessions whose output name is not fixed.
    const Tensor& firstOutput(const TensorMap& outputs, const std::string& session);
    const std::vector<float>& floatData(const Tensor& tensor, const std::string& name);
}
