#include <algorithm>

#include <spdlog/spdlog.h>

#include "SpanNER/schema_model.hpp"
#include "SpanNER/model.hpp"
#include "SpanNER/errors.hpp"

using namespace spanner;

std::vector<float> SchemaModel::HiddenStates::rows(int64_t example, const std::vector<int64_t>& positions) const {
    std::vector<float> result;
    result.reserve(positions.size() * hiddenSize);
    for (int64_t pos : positions) {
        auto first = data.begin() + (example * numTokens + pos) * hiddenSize;
        result.insert(result.end(), first, first + hiddenSize);
    }
    return result;
}

std::vector<float> SchemaModel::HiddenStates::slice(int64_t example, int64_t start, int64_t length) const {
    auto first = data.begin() + (example * numTokens + start) * hiddenSize;
    return std::vector<float>(first, first + length * hiddenSize);
}

SchemaModel::SchemaModel(
    std::shared_ptr<Tokenizer> tokenizer, SchemaEngines engines, const SchemaConfig& config
) : config(config), tokenizer(std::move(tokenizer)), engines(std::move(engines)),
    nerProcessor(this->tokenizer, config, SchemaTask::ENTITIES),
    classificationProcessor(this->tokenizer, config, SchemaTask::CLASSIFICATION)
{
    if (!this->tokenizer) {
        throw ConfigurationError("SchemaModel needs a tokenizer");
    }
    if (!this->engines.encoder || !this->engines.classifier || !this->engines.spanRep || !this->engines.countEmbed) {
        throw ConfigurationError("SchemaModel needs encoder, classifier, span_rep and count_embed engines");
    }
    const SpecialTokens& special = config.specialTokens;
    if (special.prompt < 0 || special.entity < 0 || special.label < 0 || special.sepText < 0) {
        throw ConfigurationError("SchemaModel special token ids are not set");
    }
}

SchemaModel::~SchemaModel() = default;

SchemaModel::HiddenStates SchemaModel::encode(const SchemaBatch& batch) {
    TensorMap outputs = engines.encoder->run(batch.tensors());
    const Tensor& output = firstOutput(outputs, "encoder");
    if (output.shape.size() != 3 || output.shape[0] != batch.batchSize || output.shape[1] != batch.numTokens) {
        throw ConfigurationError("Encoder output must be shaped [batch, tokens, hidden]");
    }

    HiddenStates hidden{floatData(output, "encoder output"), output.shape[1], output.shape[2]};
    if (static_cast<int64_t>(hidden.data.size()) != batch.batchSize * hidden.numTokens * hidden.hiddenSize) {
        throw ConfigurationError("Encoder output size does not match its shape");
    }
    spdlog::debug("encoder: {} examples, {} tokens, hidden size {}", batch.batchSize, hidden.numTokens, hidden.hiddenSize);
    return hidden;
}

std::vector<float> SchemaModel::scoreSpans(
    const SchemaBatch& batch, const HiddenStates& hidden, int64_t example, const std::vector<float>& labelEmbeddings
) {
    const int64_t textTokens = batch.textTokenCounts[example];
    const int64_t spanCount = batch.textLengths[example] * batch.maxWidth;
    const int64_t labelCount = batch.idToClass.size();

    const int64_t firstSpan = batch.layout().spanOffset(example, 0, 0);
    std::vector<int64_t> spanStart(spanCount);
    std::vector<int64_t> spanEnd(spanCount);
    for (int64_t s = 0; s < spanCount; s++) {
        const int64_t idx = firstSpan + s;
        spanStart[s] = batch.tokenSpanIdxs[2*idx];
        spanEnd[s] = batch.tokenSpanIdxs[2*idx+1];
    }

    TensorMap spanInputs;
    spanInputs["hidden_states"] = Tensor::fromFloat(
        hidden.slice(example, batch.schemaLength, textTokens), {1, textTokens, hidden.hiddenSize}
    );
    spanInputs["span_start_idx"] = Tensor::fromInt64(std::move(spanStart), {1, spanCount});
    spanInputs["span_end_idx"] = Tensor::fromInt64(std::move(spanEnd), {1, spanCount});
    TensorMap spanOutputs = engines.spanRep->run(spanInputs);
    const std::vector<float>& spanRep = floatData(firstOutput(spanOutputs, "span_rep"), "span_rep output");

    TensorMap labelInputs;
    labelInputs["label_embeddings"] = Tensor::fromFloat(labelEmbeddings, {labelCount, hidden.hiddenSize});
    TensorMap labelOutputs = engines.countEmbed->run(labelInputs);
    const std::vector<float>& labelRep = floatData(firstOutput(labelOutputs, "count_embed"), "count_embed output");

    return computeDotProductScores(spanRep, labelRep, spanCount, labelCount, hidden.hiddenSize);
}

std::vector<Entity> SchemaModel::extract(const std::string& text, const std::vector<std::string>& labels, float threshold) {
    return extractBatch({text}, labels, threshold).front();
}

std::vector<std::vector<Entity>> SchemaModel::extractBatch(
    const std::vector<std::string>& texts, const std::vector<std::string>& labels, float threshold
) {
    checkInputs(texts, labels);

    std::unique_ptr<SchemaBatch> batch = nerProcessor.prepareSchemaBatch(texts, labels);
    HiddenStates hidden = encode(*batch);

    const ScoreLayout layout = batch->layout();
    std::vector<float> scores(layout.size(), 0.0f);
    for (int64_t b = 0; b < batch->batchSize; b++) {
        if (batch->textLengths[b] == 0 || batch->textTokenCounts[b] == 0) {
            continue;
        }
        std::vector<float> labelEmbeddings = hidden.rows(b, batch->labelPositions);
        std::vector<float> exampleScores = scoreSpans(*batch, hidden, b, labelEmbeddings);
        std::copy(exampleScores.begin(), exampleScores.end(), scores.begin() + layout.offset(b, 0, 0, 0));
    }

    DecodeOptions options;
    options.threshold = threshold;
    return decoder.decode(*batch, texts, scores, options);
}

ClassificationResult SchemaModel::classify(
    const std::string& text, const std::vector<std::string>& labels, float threshold, bool multiLabel
) {
    return classifyBatch({text}, labels, threshold, multiLabel).front();
}

std::vector<ClassificationResult> SchemaModel::classifyBatch(
    const std::vector<std::string>& texts, const std::vector<std::string>& labels, float threshold, bool multiLabel
) {
    checkInputs(texts, labels);

    std::unique_ptr<SchemaBatch> batch = classificationProcessor.prepareSchemaBatch(texts, labels);
    HiddenStates hidden = encode(*batch);

    std::vector<ClassificationResult> results;
    results.reserve(batch->batchSize);
    for (int64_t b = 0; b < batch->batchSize; b++) {
        TensorMap inputs;
        inputs["hidden_state"] = Tensor::fromFloat(
            hidden.rows(b, batch->labelPositions), {static_cast<int64_t>(labels.size()), hidden.hiddenSize}
        );
        TensorMap outputs = engines.classifier->run(inputs);
        const std::vector<float>& logits = floatData(firstOutput(outputs, "classifier"), "classifier output");
        results.push_back(classificationDecoder.decode(logits, labels, multiLabel, threshold));
    }
    return results;
}
