#pragma once

#include <vector>
#include <string>
#include <memory>

#include "spanner_config.hpp"
#include "spanner_structs.hpp"
#include "tokenizer_utils.hpp"

namespace spanner {
    struct Prompt {
        int64_t textLength;
        int64_t promptLength;
        std::vector<std::string> prompt;
    };

    class Processor {
    protected:
        std::shared_ptr<Tokenizer> tokenizer;
        WordSplitter wordSplitter;
        int64_t maxWidth;

        void buildIdToClass(const std::vector<std::string>& entities, Batch* output);
        void prepareSpans(Batch* output);
        static void padSequences(const std::vector<std::vector<int64_t>>& sequences, Batch* output);
    public:
        Processor(std::shared_ptr<Tokenizer> tokenizer, SplitRules rules, int64_t maxWidth);
        virtual ~Processor() {};
        std::vector<Token> tokenizeText(const std::string& text);
        std::vector<std::vector<Token>> batchTokenizeText(const std::vector<std::string>& texts);

        virtual std::unique_ptr<Batch> prepareBatch(
            const std::vector<std::string>& texts, const std::vector<std::string>& entities
        ) = 0;
    };

    // <<ENT>> label ... <<SEP>> prompt words followed by the text words in one sequence.
    class SpanProcessor : public Processor {
    protected:
        void prepareTextInputs(
            const std::vector<std::string>& entities, SpanBatch* output, std::vector<Prompt>& prompts
        );
        void encodeInputs(const std::vector<Prompt>& prompts, SpanBatch* output);
    public:
        static constexpr int64_t CLS_TOKEN_ID = 1;

        SpanProcessor(std::shared_ptr<Tokenizer> tokenizer, const Config& config);
        virtual ~SpanProcessor() {};
        virtual std::unique_ptr<Batch> prepareBatch(
            const std::vector<std::string>& texts, const std::vector<std::string>& entities
        );
    };

    enum class SchemaTask {
        ENTITIES,
        CLASSIFICATION
    };

    // Schema "( [P] task ( [E] label ... ) ) [SEP_TEXT]" followed by the lower-cased text.
    class SchemaProcessor : public Processor {
    protected:
        SpecialTokens specialTokens;
        SchemaTask task;

        std::vector<int64_t> encodeSchema(const std::vector<std::string>& labels, std::vector<int64_t>& labelPositions);
    public:
        SchemaProcessor(std::shared_ptr<Tokenizer> tokenizer, const SchemaConfig& config, SchemaTask task);
        virtual ~SchemaProcessor() {};
        std::unique_ptr<SchemaBatch> prepareSchemaBatch(
            const std::vector<std::string>& texts, const std::vector<std::string>& labels
        );
        virtual std::unique_ptr<Batch> prepareBatch(
            const std::vector<std::string>& texts, const std::vector<std::string>& labels
        );
    };
}
