#include "SpanNER/engine.hpp"
#include "SpanNER/errors.hpp"

using namespace spanner;

const Tensor& spanner::requireOutput(const TensorMap& outputs, const std::string& name) {
    auto it = outputs.find(name);
    if (it == outputs.end()) {
        throw ConfigurationError("Model output missing " + name);
    }
    return it->second;
}

const Tensor& spanner::firstOutput(const TensorMap& outputs, const std::string& session) {
    if (outputs.empty()) {
        throw ConfigurationError(session + " returned no outputs");
    }
    return outputs.begin()->second;
}

const std::vector<float>& spanner::floatData(const Tensor& tensor, const std::string& name) {
    if (tensor.type != TensorType::FLOAT) {
        throw ConfigurationError(name + " is not a float tensor");
    }
    return tensor.floatData;
}
