#include "SpanNER/spanner_structs.hpp"
#include "SpanNER/errors.hpp"

using namespace spanner;

Tensor Tensor::fromInt64(std::vector<int64_t> data, std::vector<int64_t> shape) {
    Tensor t;
    t.type = TensorType::INT64;
    t.shape = std::move(shape);
    t.int64Data = std::move(data);
    return t;
}

Tensor Tensor::fromFloat(std::vector<float> data, std::vector<int64_t> shape) {
    Tensor t;
    t.type = TensorType::FLOAT;
    t.shape = std::move(shape);
    t.floatData = std::move(data);
    return t;
}

Tensor Tensor::fromBool(std::vector<uint8_t> data, std::vector<int64_t> shape) {
    Tensor t;
    t.type = TensorType::BOOL;
    t.shape = std::move(shape);
    t.boolData = std::move(data);
    return t;
}

size_t Tensor::elementCount() const {
    switch (type) {
    case TensorType::INT64:
        return int64Data.size();
    case TensorType::BOOL:
        return boolData.size();
    case TensorType::FLOAT:
        break;
    }
    return floatData.size();
}

std::vector<int64_t> ScoreLayout::shape() const {
    return {batchSize, numWords, maxWidth, numLabels};
}

int64_t ScoreLayout::spanOffset(int64_t batch, int64_t word, int64_t width) const {
    return batch * spansPerExample() + word * maxWidth + width;
}

int64_t ScoreLayout::offset(int64_t batch, int64_t word, int64_t width, int64_t label) const {
    return batch * batchStride() + word * wordStride() + width * widthStride() + label;
}

ScorePosition ScoreLayout::position(int64_t flatIndex) const {
    ScorePosition pos;
    pos.batch = flatIndex / batchStride();
    pos.start = (flatIndex / wordStride()) % numWords;
    pos.end = pos.start + (flatIndex / widthStride()) % maxWidth;
    pos.label = flatIndex % numLabels;
    return pos;
}

ScoreLayout Batch::layout() const {
    return {batchSize, numWords, maxWidth, static_cast<int64_t>(idToClass.size())};
}

const std::string& Batch::className(int64_t labelIndex) const {
    auto it = idToClass.find(labelIndex + 1);
    if (it == idToClass.end()) {
        throw ConfigurationError("Label index " + std::to_string(labelIndex) + " has no class");
    }
    return it->second;
}

TensorMap SpanBatch::tensors() const {
    TensorMap tensors;
    tensors["input_ids"] = Tensor::fromInt64(inputsIds, {batchSize, numTokens});
    tensors["attention_mask"] = Tensor::fromInt64(attentionMasks, {batchSize, numTokens});
    tensors["words_mask"] = Tensor::fromInt64(wordsMasks, {batchSize, numTokens});
    tensors["text_lengths"] = Tensor::fromInt64(textLengths, {batchSize, 1});
    tensors["span_idx"] = Tensor::fromInt64(spanIdxs, {batchSize, numSpans, 2});
    tensors["span_mask"] = Tensor::fromBool(spanMasks, {batchSize, numSpans});
    return tensors;
}

TensorMap SchemaBatch::tensors() const {
    TensorMap tensors;
    tensors["input_ids"] = Tensor::fromInt64(inputsIds, {batchSize, numTokens});
    tensors["attention_mask"] = Tensor::fromInt64(attentionMasks, {batchSize, numTokens});
    return tensors;
}
