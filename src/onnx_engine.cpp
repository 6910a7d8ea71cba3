#include <filesystem>

#include <spdlog/spdlog.h>

#include "SpanNER/onnx_engine.hpp"
#include "SpanNER/errors.hpp"

using namespace spanner;

namespace fs = std::filesystem;

std::string spanner::resolveModelPath(const std::string& path) {
    fs::path modelPath(path);
    if (fs::is_directory(modelPath)) {
        modelPath = modelPath / "onnx" / "model.onnx";
    }
    if (!fs::exists(modelPath)) {
        throw ModelNotFoundError("Model not found: " + modelPath.string());
    }
    return modelPath.string();
}

OnnxEngine::OnnxEngine(const std::string& path) : modelPath(resolveModelPath(path))
{
    Ort::SessionOptions sessionOptions;
    initialize(sessionOptions);
}

OnnxEngine::OnnxEngine(const std::string& path, const Ort::SessionOptions& session_options)
    : modelPath(resolveModelPath(path))
{
    initialize(session_options);
}

OnnxEngine::~OnnxEngine() = default;

void OnnxEngine::initialize(const Ort::SessionOptions& session_options) {
    env = std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "spanner");
    session = std::make_unique<Ort::Session>(*env, modelPath.c_str(), session_options);

    Ort::AllocatorWithDefaultOptions allocator;
    for (size_t i = 0; i < session->GetOutputCount(); i++) {
        outputNames.push_back(session->GetOutputNameAllocated(i, allocator).get());
    }
    spdlog::debug("loaded {} with {} inputs and {} outputs", modelPath, session->GetInputCount(), outputNames.size());
}

TensorMap OnnxEngine::run(const TensorMap& inputs) {
    Ort::MemoryInfo memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);

    std::vector<const char*> inputNames;
    std::vector<Ort::Value> inputTensors;
    // ORT wants bool*, Tensor keeps bytes
    std::vector<std::unique_ptr<bool[]>> boolBuffers;
    inputNames.reserve(inputs.size());
    inputTensors.reserve(inputs.size());

    for (const auto& [name, tensor] : inputs) {
        inputNames.push_back(name.c_str());
        const int64_t* shape = tensor.shape.data();
        const size_t rank = tensor.shape.size();

        switch (tensor.type) {
        case TensorType::INT64:
            inputTensors.push_back(Ort::Value::CreateTensor<int64_t>(
                memory_info, const_cast<int64_t*>(tensor.int64Data.data()), tensor.int64Data.size(), shape, rank
            ));
            break;
        case TensorType::FLOAT:
            inputTensors.push_back(Ort::Value::CreateTensor<float>(
                memory_info, const_cast<float*>(tensor.floatData.data()), tensor.floatData.size(), shape, rank
            ));
            break;
        case TensorType::BOOL: {
            auto buffer = std::make_unique<bool[]>(tensor.boolData.size());
            for (size_t i = 0; i < tensor.boolData.size(); i++) {
                buffer[i] = tensor.boolData[i] != 0;
            }
            inputTensors.push_back(Ort::Value::CreateTensor<bool>(
                memory_info, buffer.get(), tensor.boolData.size(), shape, rank
            ));
            boolBuffers.push_back(std::move(buffer));
            break;
        }
        }
    }

    std::vector<const char*> outputNamePtrs;
    outputNamePtrs.reserve(outputNames.size());
    for (const auto& name : outputNames) {
        outputNamePtrs.push_back(name.c_str());
    }

    std::vector<Ort::Value> modelOutputs = session->Run(
        Ort::RunOptions{nullptr}, inputNames.data(),
        inputTensors.data(), inputTensors.size(),
        outputNamePtrs.data(), outputNamePtrs.size()
    );

    TensorMap outputs;
    for (size_t i = 0; i < modelOutputs.size(); i++) {
        Ort::TensorTypeAndShapeInfo info = modelOutputs[i].GetTensorTypeAndShapeInfo();
        if (info.GetElementType() != ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT) {
            throw ConfigurationError("Output " + outputNames[i] + " of " + modelPath + " is not float32");
        }
        const float* data = modelOutputs[i].GetTensorData<float>();
        outputs[outputNames[i]] = Tensor::fromFloat(
            std::vector<float>(data, data + info.GetElementCount()), info.GetShape()
        );
    }
    return outputs;
}
