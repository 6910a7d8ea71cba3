#pragma once

#include <vector>
#include <string>
#include <memory>

#include "spanner_config.hpp"
#include "spanner_structs.hpp"
#include "engine.hpp"
#include "processor.hpp"
#include "decoder.hpp"

namespace spanner {
    struct SchemaEngines {
        std::unique_ptr<Engine> encoder;     // input_ids, attention_mask -> [batch, tokens, hidden]
        std::unique_ptr<Engine> classifier;  // hidden_state [labels, hidden] -> [labels]
        std::unique_ptr<Engine> spanRep;     // hidden_states, span_start_idx, span_end_idx -> [1, spans, hidden]
        std::unique_ptr<Engine> countEmbed;  // label_embeddings [labels, hidden] -> [labels, hidden]
    };

    // Schema-conditioned model: the encoder sees schema and text together, spans and labels
    // are projected by separate sessions and scored by dot product.
    class SchemaModel {
    protected:
        struct HiddenStates {
            std::vector<float> data;
            int64_t numTokens;
            int64_t hiddenSize;

            std::vector<float> rows(int64_t example, const std::vector<int64_t>& positions) const;
            std::vector<float> slice(int64_t example, int64_t start, int64_t length) const;
        };

        SchemaConfig config;
        std::shared_ptr<Tokenizer> tokenizer;
        SchemaEngines engines;
        SchemaProcessor nerProcessor;
        SchemaProcessor classificationProcessor;
        DotProductDecoder decoder;
        ClassificationDecoder classificationDecoder;

        HiddenStates encode(const SchemaBatch& batch);
        std::vector<float> scoreSpans(
            const SchemaBatch& batch, const HiddenStates& hidden, int64_t example, const std::vector<float>& labelEmbeddings
        );
    public:
        SchemaModel(std::shared_ptr<Tokenizer> tokenizer, SchemaEngines engines, const SchemaConfig& config);
        ~SchemaModel();

        std::vector<Entity> extract(const std::string& text, const std::vector<std::string>& labels, float threshold = 0.5);
        std::vector<std::vector<Entity>> extractBatch(
            const std::vector<std::string>& texts, const std::vector<std::string>& labels, float threshold = 0.5
        );

        ClassificationResult classify(
            const std::string& text, const std::vector<std::string>& labels,
            float threshold = 0.5, bool multiLabel = false
        );
        std::vector<ClassificationResult> classifyBatch(
            const std::vector<std::string>& texts, const std::vector<std::string>& labels,
            float threshold = 0.5, bool multiLabel = false
        );
    };
}
