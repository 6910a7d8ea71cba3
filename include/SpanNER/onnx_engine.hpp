#pragma once

#include <onnxruntime_cxx_api.h>

#include <vector>
#include <string>
#include <memory>

#include "engine.hpp"

namespace spanner {
    // A model path naming a directory resolves to <dir>/onnx/model.onnx.
    std::string resolveModelPath(const std::string& path);

    class OnnxEngine : public Engine {
    protected:
        std::string modelPath;
        std::unique_ptr<Ort::Env> env;
        std::unique_ptr<Ort::Session> session;
        std::vector<std::string> outputNames;

        void initialize(const Ort::SessionOptions& session_options);
    public:
        explicit OnnxEngine(const std::string& path);
        OnnxEngine(const std::string& path, const Ort::SessionOptions& session_options);
        virtual ~OnnxEngine();

        virtual TensorMap run(const TensorMap& inputs);
        const std::string& path() const { return modelPath; }
    };
}
