#pragma once

#include <tokenizers_cpp.h>

#include <vector>
#include <string>
#include <memory>

#include "tokenizer_utils.hpp"

namespace spanner {
    std::string LoadBytesFromFile(const std::string& path);

    // HuggingFace tokenizer.json through tokenizers-cpp.
    class HFTokenizer : public Tokenizer {
    protected:
        std::unique_ptr<tokenizers::Tokenizer> tokenizer;
        int64_t sepId;
    public:
        explicit HFTokenizer(const std::string& tokenizer_path);
        virtual ~HFTokenizer() {};

        virtual std::vector<int64_t> encode(const std::string& text);
        virtual int64_t sepTokenId() const;
        virtual int64_t tokenToId(const std::string& token) const;
    };
}
