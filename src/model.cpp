#include <spdlog/spdlog.h>

#include "SpanNER/model.hpp"
#include "SpanNER/errors.hpp"

using namespace spanner;

void spanner::checkInputs(const std::vector<std::string>& texts, const std::vector<std::string>& labels) {
    if (texts.empty()) {
        throw ValidationError("Texts cannot be empty");
    }
    for (const auto& text : texts) {
        if (isBlank(text)) {
            throw ValidationError("Text cannot be empty");
        }
    }
    if (labels.empty()) {
        throw ValidationError("Labels cannot be empty");
    }
}

Model::Model(
    std::shared_ptr<Tokenizer> tokenizer, std::unique_ptr<Engine> engine, const Config& config
) : config(config), tokenizer(std::move(tokenizer)), engine(std::move(engine))
{
    if (!this->tokenizer || !this->engine) {
        throw ConfigurationError("Model needs a tokenizer and an engine");
    }
    processor = std::make_unique<SpanProcessor>(this->tokenizer, config);
    decoder = std::make_unique<SpanDecoder>();
}

Model::~Model() = default;

void Model::run(const TensorMap& inputs, std::vector<float>& output) {
    TensorMap outputs = engine->run(inputs);
    const Tensor& logits = requireOutput(outputs, OUTPUT_LOGITS);
    output = floatData(logits, OUTPUT_LOGITS);
}

std::vector<std::vector<Entity>> Model::inference(
    const std::vector<std::string>& texts, const std::vector<std::string>& entities, bool flatNer, float threshold, bool multiLabel
) {
    checkInputs(texts, entities);

    std::unique_ptr<Batch> batch = processor->prepareBatch(texts, entities);

    std::vector<float> output;
    run(batch->tensors(), output);
    spdlog::debug("engine returned {} span scores", output.size());

    DecodeOptions options;
    options.threshold = threshold;
    options.flatNer = flatNer;
    options.multiLabel = multiLabel;
    return decoder->decode(*batch, texts, output, options);
}

std::vector<Entity> Model::extract(const std::string& text, const std::vector<std::string>& labels, float threshold) {
    auto result = inference({text}, labels, true, threshold, false);
    return result.front();
}

std::vector<std::vector<Entity>> Model::extractBatch(
    const std::vector<std::string>& texts, const std::vector<std::string>& labels, float threshold
) {
    return inference(texts, labels, true, threshold, false);
}
