#pragma once

#include <vector>
#include <string>

#include "spanner_config.hpp"
#include "spanner_structs.hpp"

namespace spanner {
    class Decoder {
    protected:
        static Entity makeEntity(
            const Batch& batch, const std::string& text, int64_t example,
            int64_t startWord, int64_t endWord, int64_t label, float score
        );
    public:
        virtual ~Decoder() {};
        // One entity list per example of the batch, in batch order.
        virtual std::vector<std::vector<Entity>> decode(
            const Batch& batch,
            const std::vector<std::string>& texts,
            const std::vector<float>& scores,
            const DecodeOptions& options = {}
        ) = 0;
    };

    // Raw logits laid out as batch.layout(); positions are recovered from the flat index.
    class SpanDecoder : public Decoder {
    public:
        virtual ~SpanDecoder() {};
        virtual std::vector<std::vector<Entity>> decode(
            const Batch& batch,
            const std::vector<std::string>& texts,
            const std::vector<float>& scores,
            const DecodeOptions& options = {}
        );
    };

    // Sigmoid scores [batch, span, label] from computeDotProductScores; the word pair of each
    // span comes from the batch span table. Overlaps are resolved per label.
    class DotProductDecoder : public Decoder {
    public:
        virtual ~DotProductDecoder() {};
        virtual std::vector<std::vector<Entity>> decode(
            const Batch& batch,
            const std::vector<std::string>& texts,
            const std::vector<float>& scores,
            const DecodeOptions& options = {}
        );
    };

    // sigmoid(spanRep . labelRep) for every (span, label), row-major [spanCount, labelCount].
    std::vector<float> computeDotProductScores(
        const std::vector<float>& spanRep,
        const std::vector<float>& labelRep,
        int64_t spanCount,
        int64_t labelCount,
        int64_t hiddenSize
    );

    class ClassificationDecoder {
    public:
        ClassificationResult decode(
            const std::vector<float>& logits,
            const std::vector<std::string>& labels,
            bool multiLabel = false,
            float threshold = 0.5
        ) const;

        ClassificationResult decodeSingleLabel(const std::vector<float>& logits, const std::vector<std::string>& labels) const;
        ClassificationResult decodeMultiLabel(
            const std::vector<float>& logits, const std::vector<std::string>& labels, float threshold
        ) const;
    };
}
