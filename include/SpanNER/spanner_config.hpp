#pragma once

#include <cstdint>

namespace spanner {
    class Tokenizer;

    struct Config {
        int64_t maxWidth = 12;
    };

    // Ids of the marker tokens the schema family adds to its vocabulary.
    struct SpecialTokens {
        int64_t prompt = -1;   // [P]
        int64_t entity = -1;   // [E]
        int64_t label = -1;    // [L]
        int64_t sepText = -1;  // [SEP_TEXT]

        static SpecialTokens fromTokenizer(const Tokenizer& tokenizer);
    };

    struct SchemaConfig {
        int64_t maxWidth = 12;
        SpecialTokens specialTokens;
    };

    struct DecodeOptions {
        float threshold = 0.5;
        bool flatNer = true;
        bool multiLabel = false;
    };
}
