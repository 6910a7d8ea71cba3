#include <cmath>
#include <algorithm>

#include "SpanNER/score_transform.hpp"

using namespace spanner;

float spanner::sigmoid(float x) {
    if (x >= 0) {
        return 1.0f / (1.0f + std::exp(-x));
    }
    float expX = std::exp(x);
    return expX / (1.0f + expX);
}

std::vector<float> spanner::sigmoid(const std::vector<float>& values) {
    std::vector<float> result(values.size());
    std::transform(values.begin(), values.end(), result.begin(), [](float x) { return sigmoid(x); });
    return result;
}

std::vector<float> spanner::softmax(const std::vector<float>& values) {
    if (values.empty()) {
        return {};
    }

    float maxVal = *std::max_element(values.begin(), values.end());

    std::vector<float> result(values.size());
    double sum = 0;
    for (size_t i = 0; i < values.size(); i++) {
        result[i] = std::exp(values[i] - maxVal);
        sum += result[i];
    }
    for (float& v : result) {
        v = static_cast<float>(v / sum);
    }
    return result;
}
