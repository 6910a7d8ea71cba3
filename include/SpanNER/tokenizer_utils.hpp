#pragma once
#include <string>
#include <vector>
#include <memory>
#include <iterator>
#include <cstddef>
#include <cstdint>
#include "spanner_structs.hpp"

namespace spanner {

// Sub-word tokenizer the batch assemblers consume. Ids never include special tokens.
class Tokenizer {
public:
    virtual ~Tokenizer() {}
    virtual std::vector<int64_t> encode(const std::string& text) = 0;
    virtual int64_t sepTokenId() const = 0;
    // -1 when the token is not in the vocabulary.
    virtual int64_t tokenToId(const std::string& token) const = 0;
};

enum class SplitRules {
    FULL,   // urls, e-mails, @mentions, words, single symbols
    WORDS   // words, single symbols
};

class WordSplitter {
private:
    struct Pattern;
    struct MatchData;
    std::shared_ptr<const Pattern> pattern;

public:
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Token;
        using difference_type = std::ptrdiff_t;
        using pointer = const Token*;
        using reference = const Token&;

        Iterator() = default;

        reference operator*() const { return current; }
        pointer operator->() const { return &current; }
        Iterator& operator++();
        bool operator==(const Iterator& other) const;
        bool operator!=(const Iterator& other) const { return !(*this == other); }

    private:
        friend class WordSplitter;
        Iterator(std::shared_ptr<const Pattern> pattern, const std::string* text);
        void advance();

        std::shared_ptr<const Pattern> pattern;
        std::shared_ptr<MatchData> matchData;
        const std::string* text = nullptr;
        size_t offset = 0;
        Token current{0, 0, {}};
        bool done = true;
    };

    // Restartable view over the words of `text`; each begin() matches from the start
    // with its own match state. `text` must outlive the sequence.
    class WordSequence {
    public:
        Iterator begin() const { return Iterator(pattern, &text); }
        Iterator end() const { return Iterator(); }

    private:
        friend class WordSplitter;
        WordSequence(std::shared_ptr<const Pattern> pattern, const std::string& text)
            : pattern(std::move(pattern)), text(text) {}

        std::shared_ptr<const Pattern> pattern;
        const std::string& text;
    };

    explicit WordSplitter(SplitRules rules = SplitRules::FULL);
    ~WordSplitter();
    WordSplitter(const WordSplitter&) = default;
    WordSplitter& operator=(const WordSplitter&) = default;

    WordSequence split(const std::string& text) const;
    std::vector<Token> call(const std::string& text) const;
};

// ASCII lower-casing; byte offsets stay valid for the input text.
std::string toLowerAscii(const std::string& text);

bool isBlank(const std::string& text);

}
