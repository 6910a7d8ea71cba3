#pragma once

#include <vector>
#include <string>
#include <map>
#include <cstdint>
#include <cstddef>

namespace spanner {
    struct Token {
        size_t start;
        size_t end;
        std::string text;
    };

    struct SpanIndex {
        int64_t start;
        int64_t end;
        bool valid;
    };

    struct Entity {
        size_t startIdx;
        size_t endIdx;
        std::string text;
        std::string label;
        float score;
    };

    using ClassificationResult = std::map<std::string, float>;

    enum class TensorType {
        INT64,
        FLOAT,
        BOOL
    };

    struct Tensor {
        TensorType type = TensorType::FLOAT;
        std::vector<int64_t> shape;
        std::vector<int64_t> int64Data;
        std::vector<float> floatData;
        std::vector<uint8_t> boolData;

        static Tensor fromInt64(std::vector<int64_t> data, std::vector<int64_t> shape);
        static Tensor fromFloat(std::vector<float> data, std::vector<int64_t> shape);
        static Tensor fromBool(std::vector<uint8_t> data, std::vector<int64_t> shape);

        size_t elementCount() const;
    };

    using TensorMap = std::map<std::string, Tensor>;

    // Position of one cell of a span score tensor.
    struct ScorePosition {
        int64_t batch;
        int64_t start;
        int64_t end;
        int64_t label;
    };

    // Dimension order of span scores: [batch, word, width, label].
    // The span axis of a batch is the flattened [word, width] pair of this layout.
    struct ScoreLayout {
        int64_t batchSize = 0;
        int64_t numWords = 0;
        int64_t maxWidth = 0;
        int64_t numLabels = 0;

        int64_t widthStride() const { return numLabels; }
        int64_t wordStride() const { return maxWidth * numLabels; }
        int64_t batchStride() const { return numWords * wordStride(); }
        int64_t spansPerExample() const { return numWords * maxWidth; }
        int64_t size() const { return batchSize * batchStride(); }
        std::vector<int64_t> shape() const;

        int64_t spanOffset(int64_t batch, int64_t word, int64_t width) const;
        int64_t offset(int64_t batch, int64_t word, int64_t width, int64_t label) const;
        ScorePosition position(int64_t flatIndex) const;
    };

    struct Batch {
        int64_t batchSize = 0;
        int64_t numTokens = 0;
        int64_t numWords = 0;
        int64_t maxWidth = 0;
        int64_t numSpans = 0;

        std::vector<int64_t> inputsIds;       // [batchSize, numTokens]
        std::vector<int64_t> attentionMasks;  // [batchSize, numTokens]
        std::vector<int64_t> textLengths;     // [batchSize], words per example

        std::vector<int64_t> spanIdxs;        // [batchSize, numSpans, 2], word positions
        std::vector<uint8_t> spanMasks;       // [batchSize, numSpans]

        std::map<int64_t, std::string> idToClass;  // 1-based, 0 means no label
        std::vector<std::vector<Token>> batchTokens;

        virtual ~Batch() = default;
        virtual TensorMap tensors() const = 0;

        ScoreLayout layout() const;
        const std::string& className(int64_t labelIndex) const;
    };

    // Label prompt and text share one token sequence.
    struct SpanBatch : public Batch {
        std::vector<int64_t> wordsMasks;  // [batchSize, numTokens]

        virtual TensorMap tensors() const;
    };

    // Schema and text are encoded side by side; spans address sub-tokens of the text part.
    struct SchemaBatch : public Batch {
        int64_t schemaLength = 0;
        std::vector<int64_t> labelPositions;   // marker positions inside the schema
        std::vector<int64_t> textTokenCounts;  // [batchSize]
        std::vector<int64_t> tokenSpanIdxs;    // [batchSize, numSpans, 2], relative to schemaLength

        virtual TensorMap tensors() const;
    };
}
