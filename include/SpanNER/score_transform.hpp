#pragma once

#include <vector>

namespace spanner {
    float sigmoid(float x);
    std::vector<float> sigmoid(const std::vector<float>& values);

    // Empty input gives empty output.
    std::vector<float> softmax(const std::vector<float>& values);
}
