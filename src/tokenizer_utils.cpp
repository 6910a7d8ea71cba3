#define PCRE2_CODE_UNIT_WIDTH 8
#include <pcre2.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include "SpanNER/tokenizer_utils.hpp"
#include "SpanNER/errors.hpp"

namespace spanner
{

    namespace
    {
        const char *WORDS_PATTERN = "\\w+(?:[-_]\\w+)*|\\S";

        const char *FULL_PATTERN =
            "(?:https?://\\S+|www\\.\\S+)"
            "|[a-z0-9._%+-]+@[a-z0-9.-]+\\.[a-z]{2,}"
            "|@[a-z0-9_]+"
            "|\\w+(?:[-_]\\w+)*"
            "|\\S";
    }

    // Compiled pattern; read-only after construction so sequences may share it.
    struct WordSplitter::Pattern
    {
        pcre2_code *code = nullptr;

        Pattern(const char *source, uint32_t options)
        {
            int errorcode;
            PCRE2_SIZE erroroffset;

            code = pcre2_compile(
                reinterpret_cast<PCRE2_SPTR>(source),
                PCRE2_ZERO_TERMINATED,
                PCRE2_UTF | PCRE2_UCP | options,
                &errorcode,
                &erroroffset,
                nullptr);

            if (!code)
            {
                PCRE2_UCHAR buffer[256];
                pcre2_get_error_message(errorcode, buffer, sizeof(buffer));
                throw std::runtime_error("PCRE2 compilation failed at offset " +
                                         std::to_string(erroroffset) + ": " +
                                         reinterpret_cast<char *>(buffer));
            }

            pcre2_jit_compile(code, PCRE2_JIT_COMPLETE);
        }

        ~Pattern()
        {
            if (code)
                pcre2_code_free(code);
        }

        Pattern(const Pattern &) = delete;
        Pattern &operator=(const Pattern &) = delete;
    };

    // Per-sequence match state.
    struct WordSplitter::MatchData
    {
        pcre2_match_data *data = nullptr;

        explicit MatchData(const Pattern &pattern)
        {
            data = pcre2_match_data_create_from_pattern(pattern.code, nullptr);
            if (!data)
            {
                throw std::runtime_error("Failed to create PCRE2 match data");
            }
        }

        ~MatchData()
        {
            if (data)
                pcre2_match_data_free(data);
        }

        MatchData(const MatchData &) = delete;
        MatchData &operator=(const MatchData &) = delete;
    };

    WordSplitter::WordSplitter(SplitRules rules)
    {
        if (rules == SplitRules::FULL)
        {
            pattern = std::make_shared<Pattern>(FULL_PATTERN, PCRE2_CASELESS);
        }
        else
        {
            pattern = std::make_shared<Pattern>(WORDS_PATTERN, 0);
        }
    }

    WordSplitter::~WordSplitter() = default;

    WordSplitter::WordSequence WordSplitter::split(const std::string &text) const
    {
        return WordSequence(pattern, text);
    }

    std::vector<Token> WordSplitter::call(const std::string &text) const
    {
        std::vector<Token> tokens;
        tokens.reserve(text.length() / 4); // Estimate initial capacity

        for (const Token &token : split(text))
        {
            tokens.push_back(token);
        }
        return tokens;
    }

    WordSplitter::Iterator::Iterator(std::shared_ptr<const Pattern> pattern, const std::string *text)
        : pattern(std::move(pattern)), text(text), done(false)
    {
        matchData = std::make_shared<MatchData>(*this->pattern);
        advance();
    }

    WordSplitter::Iterator &WordSplitter::Iterator::operator++()
    {
        advance();
        return *this;
    }

    bool WordSplitter::Iterator::operator==(const Iterator &other) const
    {
        if (done || other.done)
        {
            return done == other.done;
        }
        return text == other.text && current.start == other.current.start;
    }

    void WordSplitter::Iterator::advance()
    {
        if (done)
        {
            return;
        }

        int rc = pcre2_match(
            pattern->code,
            reinterpret_cast<PCRE2_SPTR>(text->c_str()),
            text->length(),
            offset,
            offset == 0 ? 0 : PCRE2_NO_UTF_CHECK, // subject validated by the first match
            matchData->data,
            nullptr);

        if (rc < 0)
        {
            if (rc <= PCRE2_ERROR_UTF8_ERR1 && rc >= PCRE2_ERROR_UTF8_ERR21)
            {
                throw ValidationError("Text is not valid UTF-8 at byte " +
                                      std::to_string(pcre2_get_startchar(matchData->data)));
            }
            if (rc != PCRE2_ERROR_NOMATCH)
            {
                throw std::runtime_error("PCRE2 matching error: " + std::to_string(rc));
            }
            done = true;
            matchData.reset();
            return;
        }

        PCRE2_SIZE *ovector = pcre2_get_ovector_pointer(matchData->data);
        const size_t start = ovector[0];
        const size_t end = ovector[1];

        current = {start, end, text->substr(start, end - start)};
        offset = end;
    }

    std::string toLowerAscii(const std::string &text)
    {
        std::string lower = text;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return lower;
    }

    bool isBlank(const std::string &text)
    {
        return std::all_of(text.begin(), text.end(),
                           [](unsigned char c) { return std::isspace(c) != 0; });
    }

}
