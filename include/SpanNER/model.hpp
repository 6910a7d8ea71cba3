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
    // Throws ValidationError for an empty text list, a blank text or an empty label list.
    void checkInputs(const std::vector<std::string>& texts, const std::vector<std::string>& labels);

    // Span-level model: the label prompt is prepended to the text and the engine returns
    // "logits" shaped [batch, words, maxWidth, labels].
    class Model {
    protected:
        Config config;
        std::shared_ptr<Tokenizer> tokenizer;
        std::unique_ptr<Engine> engine;
        std::unique_ptr<Processor> processor;
        std::unique_ptr<Decoder> decoder;

    public:
        static constexpr const char* OUTPUT_LOGITS = "logits";

        Model(std::shared_ptr<Tokenizer> tokenizer, std::unique_ptr<Engine> engine, const Config& config);
        ~Model();

        void run(const TensorMap& inputs, std::vector<float>& output);
        std::vector<std::vector<Entity>> inference(
            const std::vector<std::string>& texts, const std::vector<std::string>& entities,
            bool flatNer = true, float threshold = 0.5, bool multiLabel = false
        );

        std::vector<Entity> extract(const std::string& text, const std::vector<std::string>& labels, float threshold = 0.5);
        std::vector<std::vector<Entity>> extractBatch(
            const std::vector<std::string>& texts, const std::vector<std::string>& labels, float threshold = 0.5
        );
    };
}
