#include <filesystem>
#include <fstream>

#include <spdlog/spdlog.h>

#include "SpanNER/hf_tokenizer.hpp"
#include "SpanNER/errors.hpp"

using namespace spanner;

namespace {
    const int64_t DEFAULT_SEP_TOKEN_ID = 2;
}

std::string spanner::LoadBytesFromFile(const std::string& path) {
    std::ifstream fs(path, std::ios::in | std::ios::binary);
    if (!fs) {
        throw ModelNotFoundError("Cannot open file: " + path);
    }

    fs.seekg(0, std::ios::end);
    std::string data;
    data.reserve(fs.tellg());
    fs.seekg(0, std::ios::beg);

    data.assign(
        std::istreambuf_iterator<char>(fs),
        std::istreambuf_iterator<char>());

    return data;
}

HFTokenizer::HFTokenizer(const std::string& tokenizer_path) {
    std::string path = tokenizer_path;
    if (std::filesystem::is_directory(path)) {
        path = (std::filesystem::path(path) / "tokenizer.json").string();
    }
    tokenizer = tokenizers::Tokenizer::FromBlobJSON(LoadBytesFromFile(path));

    sepId = tokenToId("[SEP]");
    if (sepId < 0) {
        sepId = tokenToId("</s>");
    }
    if (sepId < 0) {
        spdlog::warn("{} has no [SEP] or </s> token, using id {}", path, DEFAULT_SEP_TOKEN_ID);
        sepId = DEFAULT_SEP_TOKEN_ID;
    }
}

std::vector<int64_t> HFTokenizer::encode(const std::string& text) {
    std::vector<int32_t> ids = tokenizer->Encode(text);
    return std::vector<int64_t>(ids.begin(), ids.end());
}

int64_t HFTokenizer::sepTokenId() const {
    return sepId;
}

int64_t HFTokenizer::tokenToId(const std::string& token) const {
    return tokenizer->TokenToId(token);
}
