#include <string>
#include <vector>
#include <utility>

#include "SpanNER/spanner_config.hpp"
#include "SpanNER/tokenizer_utils.hpp"
#include "SpanNER/errors.hpp"

using namespace spanner;

SpecialTokens SpecialTokens::fromTokenizer(const Tokenizer& tokenizer) {
    SpecialTokens tokens;
    tokens.prompt = tokenizer.tokenToId("[P]");
    tokens.entity = tokenizer.tokenToId("[E]");
    tokens.label = tokenizer.tokenToId("[L]");
    tokens.sepText = tokenizer.tokenToId("[SEP_TEXT]");

    std::string missing;
    const std::vector<std::pair<const char*, int64_t>> required = {
        {"[P]", tokens.prompt}, {"[L]", tokens.label}, {"[E]", tokens.entity}, {"[SEP_TEXT]", tokens.sepText}
    };
    for (const auto& [name, id] : required) {
        if (id < 0) {
            missing += missing.empty() ? name : std::string(", ") + name;
        }
    }
    if (!missing.empty()) {
        throw ConfigurationError("Tokenizer is missing special tokens: " + missing);
    }
    return tokens;
}
