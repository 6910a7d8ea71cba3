#include <algorithm>

#include <spdlog/spdlog.h>

#include "SpanNER/processor.hpp"
#include "SpanNER/span_lattice.hpp"

using namespace spanner;

namespace {
    const char* ENTITY_MARKER = "<<ENT>>";
    const char* SEPARATOR_MARKER = "<<SEP>>";

    const char* SCHEMA_OPEN = "(";
    const char* SCHEMA_CLOSE = ")";
    const char* NER_TASK_NAME = "entities";
    const char* CLASSIFICATION_TASK_NAME = "category";
}

Processor::Processor(std::shared_ptr<Tokenizer> tokenizer, SplitRules rules, int64_t maxWidth)
    : tokenizer(std::move(tokenizer)), wordSplitter(rules), maxWidth(maxWidth) {}

std::vector<Token> Processor::tokenizeText(const std::string& text) {
    return wordSplitter.call(text);
}

std::vector<std::vector<Token>> Processor::batchTokenizeText(const std::vector<std::string>& texts) {
    std::vector<std::vector<Token>> res;
    res.reserve(texts.size());

    for (const auto& text : texts) {
        res.push_back(tokenizeText(text));
    }

    return res;
}

void Processor::buildIdToClass(const std::vector<std::string>& entities, Batch* output) {
    output->idToClass.clear();
    for (size_t i = 0; i < entities.size(); i++) {
        output->idToClass[static_cast<int64_t>(i) + 1] = entities[i];
    }
}

// Word-level lattice of every example, padded to the longest text of the batch.
void Processor::prepareSpans(Batch* output) {
    output->maxWidth = maxWidth;
    const ScoreLayout layout = output->layout();
    output->numSpans = layout.spansPerExample();
    output->spanIdxs.assign(output->batchSize*output->numSpans*2, 0);
    output->spanMasks.assign(output->batchSize*output->numSpans, 0);

    for (int64_t p = 0; p < output->batchSize; p++) {
        std::vector<SpanIndex> spans = generateSpans(output->textLengths[p], maxWidth);
        for (size_t k = 0; k < spans.size(); k++) {
            const int64_t idx = layout.spanOffset(p, spans[k].start, static_cast<int64_t>(k) % maxWidth);
            output->spanIdxs[2*idx] = spans[k].start;
            output->spanIdxs[2*idx+1] = spans[k].end;
            output->spanMasks[idx] = spans[k].valid;
        }
    }
}

void Processor::padSequences(const std::vector<std::vector<int64_t>>& sequences, Batch* output) {
    output->numTokens = 0;
    for (const auto& seq : sequences) {
        output->numTokens = std::max(output->numTokens, static_cast<int64_t>(seq.size()));
    }

    output->inputsIds.assign(output->batchSize*output->numTokens, 0);
    output->attentionMasks.assign(output->batchSize*output->numTokens, 0);
    for (size_t p = 0; p < sequences.size(); p++) {
        size_t row = p*output->numTokens;
        std::copy(sequences[p].begin(), sequences[p].end(), output->inputsIds.begin() + row);
        std::fill_n(output->attentionMasks.begin() + row, sequences[p].size(), 1);
    }
}

SpanProcessor::SpanProcessor(std::shared_ptr<Tokenizer> tokenizer, const Config& config)
    : Processor(std::move(tokenizer), SplitRules::WORDS, config.maxWidth) {};

void SpanProcessor::prepareTextInputs(
    const std::vector<std::string>& entities,
    SpanBatch* output,
    std::vector<Prompt>& prompts
) {
    std::vector<std::string> entities_prompt;
    entities_prompt.reserve(entities.size()*2+1);
    for (const auto& ent : entities) {
        entities_prompt.push_back(ENTITY_MARKER);
        entities_prompt.push_back(ent);
    }
    entities_prompt.push_back(SEPARATOR_MARKER);
    auto promptLength = entities_prompt.size();

    output->textLengths.assign(output->batchSize, 0);
    output->numWords = 0;
    for (size_t i = 0; i < static_cast<size_t>(output->batchSize); ++i) {
        const std::vector<Token>& currTokens = output->batchTokens[i];
        std::vector<std::string> inputText;
        inputText.reserve(currTokens.size() + promptLength);
        inputText.insert(inputText.end(), entities_prompt.begin(), entities_prompt.end());
        for (const auto& t : currTokens) {
            inputText.push_back(t.text);
        }

        output->textLengths[i] = int64_t(currTokens.size());
        prompts.push_back({
            int64_t(currTokens.size()),
            int64_t(promptLength),
            inputText,
        });
        output->numWords = std::max(prompts[i].textLength, output->numWords);
    }
}

void SpanProcessor::encodeInputs(const std::vector<Prompt>& prompts, SpanBatch* output) {
    std::vector<std::vector<int64_t>> ids;
    std::vector<std::vector<int64_t>> wordsMasks;
    ids.reserve(prompts.size());
    wordsMasks.reserve(prompts.size());

    const int64_t sepId = tokenizer->sepTokenId();
    for (const Prompt& p : prompts) {
        std::vector<int64_t> seq{CLS_TOKEN_ID};
        std::vector<int64_t> mask{0};

        int64_t wordId = 1;
        for (size_t wordIdx = 0; wordIdx < p.prompt.size(); ++wordIdx) {
            std::vector<int64_t> word = tokenizer->encode(p.prompt[wordIdx]);

            for (size_t tokenIdx = 0; tokenIdx < word.size(); ++tokenIdx) {
                seq.push_back(word[tokenIdx]);
                if (wordIdx >= static_cast<size_t>(p.promptLength) && tokenIdx == 0) {
                    mask.push_back(wordId++);
                } else {
                    mask.push_back(0);
                }
            }
        }
        seq.push_back(sepId);
        mask.push_back(0);

        ids.push_back(std::move(seq));
        wordsMasks.push_back(std::move(mask));
    }

    padSequences(ids, output);
    output->wordsMasks.assign(output->batchSize*output->numTokens, 0);
    for (size_t p = 0; p < wordsMasks.size(); p++) {
        std::copy(wordsMasks[p].begin(), wordsMasks[p].end(), output->wordsMasks.begin() + p*output->numTokens);
    }
}

std::unique_ptr<Batch> SpanProcessor::prepareBatch(
    const std::vector<std::string>& texts,
    const std::vector<std::string>& entities
) {
    auto output = std::make_unique<SpanBatch>();
    output->batchSize = texts.size();

    output->batchTokens = batchTokenizeText(texts);
    buildIdToClass(entities, output.get());

    std::vector<Prompt> prompts;
    prompts.reserve(output->batchSize);
    prepareTextInputs(entities, output.get(), prompts);
    encodeInputs(prompts, output.get());
    prepareSpans(output.get());

    spdlog::debug("span batch: {} examples, {} tokens, {} words, {} spans",
                  output->batchSize, output->numTokens, output->numWords, output->numSpans);
    return output;
}

SchemaProcessor::SchemaProcessor(std::shared_ptr<Tokenizer> tokenizer, const SchemaConfig& config, SchemaTask task)
    : Processor(std::move(tokenizer), SplitRules::FULL, config.maxWidth),
      specialTokens(config.specialTokens), task(task) {};

std::vector<int64_t> SchemaProcessor::encodeSchema(
    const std::vector<std::string>& labels, std::vector<int64_t>& labelPositions
) {
    const bool entities = task == SchemaTask::ENTITIES;
    const int64_t marker = entities ? specialTokens.entity : specialTokens.label;

    std::vector<int64_t> tokens;
    std::vector<int64_t> openTokens = tokenizer->encode(SCHEMA_OPEN);
    tokens.insert(tokens.end(), openTokens.begin(), openTokens.end());
    tokens.push_back(specialTokens.prompt);
    std::vector<int64_t> taskTokens = tokenizer->encode(entities ? NER_TASK_NAME : CLASSIFICATION_TASK_NAME);
    tokens.insert(tokens.end(), taskTokens.begin(), taskTokens.end());
    tokens.insert(tokens.end(), openTokens.begin(), openTokens.end());

    labelPositions.clear();
    for (const auto& label : labels) {
        labelPositions.push_back(tokens.size());
        tokens.push_back(marker);
        std::vector<int64_t> labelTokens = tokenizer->encode(label);
        tokens.insert(tokens.end(), labelTokens.begin(), labelTokens.end());
    }

    std::vector<int64_t> closeTokens = tokenizer->encode(SCHEMA_CLOSE);
    tokens.insert(tokens.end(), closeTokens.begin(), closeTokens.end());
    tokens.insert(tokens.end(), closeTokens.begin(), closeTokens.end());
    tokens.push_back(specialTokens.sepText);
    return tokens;
}

std::unique_ptr<SchemaBatch> SchemaProcessor::prepareSchemaBatch(
    const std::vector<std::string>& texts,
    const std::vector<std::string>& labels
) {
    auto output = std::make_unique<SchemaBatch>();
    output->batchSize = texts.size();
    buildIdToClass(labels, output.get());

    std::vector<int64_t> schema = encodeSchema(labels, output->labelPositions);
    output->schemaLength = schema.size();

    std::vector<std::vector<int64_t>> sequences;
    std::vector<std::vector<int64_t>> firstTokenPositions;
    sequences.reserve(texts.size());
    output->textLengths.assign(output->batchSize, 0);
    output->textTokenCounts.assign(output->batchSize, 0);
    output->batchTokens.resize(output->batchSize);
    output->numWords = 0;

    for (size_t p = 0; p < texts.size(); p++) {
        std::vector<int64_t> seq = schema;
        std::vector<int64_t> firstTokens;

        // the pattern is caseless, so words are found on the input text and lower-cased for encoding
        for (const Token& word : wordSplitter.split(texts[p])) {
            output->batchTokens[p].push_back(word);
            firstTokens.push_back(seq.size() - output->schemaLength);

            std::vector<int64_t> wordTokens = tokenizer->encode(toLowerAscii(word.text));
            seq.insert(seq.end(), wordTokens.begin(), wordTokens.end());
        }

        output->textLengths[p] = output->batchTokens[p].size();
        output->textTokenCounts[p] = seq.size() - output->schemaLength;
        output->numWords = std::max(output->numWords, output->textLengths[p]);
        sequences.push_back(std::move(seq));
        firstTokenPositions.push_back(std::move(firstTokens));
    }

    padSequences(sequences, output.get());
    prepareSpans(output.get());

    const ScoreLayout layout = output->layout();
    output->tokenSpanIdxs.assign(output->spanIdxs.size(), 0);
    for (int64_t p = 0; p < output->batchSize; p++) {
        const auto& firstTokens = firstTokenPositions[p];
        // a word that encodes to nothing points past the text; keep it on the last sub-token
        const int64_t lastToken = std::max<int64_t>(output->textTokenCounts[p] - 1, 0);
        for (int64_t k = 0; k < output->textLengths[p]*maxWidth; k++) {
            const int64_t idx = layout.spanOffset(p, 0, 0) + k;
            output->tokenSpanIdxs[2*idx] = std::min(firstTokens[output->spanIdxs[2*idx]], lastToken);
            output->tokenSpanIdxs[2*idx+1] = std::min(firstTokens[output->spanIdxs[2*idx+1]], lastToken);
        }
    }

    spdlog::debug("schema batch: {} examples, schema {} tokens, {} tokens, {} words",
                  output->batchSize, output->schemaLength, output->numTokens, output->numWords);
    return output;
}

std::unique_ptr<Batch> SchemaProcessor::prepareBatch(
    const std::vector<std::string>& texts,
    const std::vector<std::string>& labels
) {
    return prepareSchemaBatch(texts, labels);
}
