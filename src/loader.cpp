#include <filesystem>

#include "SpanNER/loader.hpp"
#include "SpanNER/hf_tokenizer.hpp"
#include "SpanNER/onnx_engine.hpp"
#include "SpanNER/errors.hpp"

using namespace spanner;

namespace fs = std::filesystem;

std::unique_ptr<Model> spanner::loadModel(
    const std::string& model_path, const std::string& tokenizer_path, const Config& config
) {
    auto tokenizer = std::make_shared<HFTokenizer>(tokenizer_path);
    auto engine = std::make_unique<OnnxEngine>(model_path);
    return std::make_unique<Model>(tokenizer, std::move(engine), config);
}

std::unique_ptr<SchemaModel> spanner::loadSchemaModel(
    const std::string& model_dir, const SchemaModelFiles& files, const SchemaConfig& config
) {
    if (!fs::is_directory(model_dir)) {
        throw ModelNotFoundError("Model directory not found: " + model_dir);
    }
    const fs::path dir(model_dir);

    auto tokenizer = std::make_shared<HFTokenizer>(model_dir);

    SchemaConfig resolved = config;
    const SpecialTokens& special = config.specialTokens;
    if (special.prompt < 0 || special.entity < 0 || special.label < 0 || special.sepText < 0) {
        resolved.specialTokens = SpecialTokens::fromTokenizer(*tokenizer);
    }

    SchemaEngines engines;
    engines.encoder = std::make_unique<OnnxEngine>((dir / files.encoder).string());
    engines.classifier = std::make_unique<OnnxEngine>((dir / files.classifier).string());
    engines.spanRep = std::make_unique<OnnxEngine>((dir / files.spanRep).string());
    engines.countEmbed = std::make_unique<OnnxEngine>((dir / files.countEmbed).string());

    return std::make_unique<SchemaModel>(tokenizer, std::move(engines), resolved);
}
