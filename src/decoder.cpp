#include <spdlog/spdlog.h>

#include "SpanNER/decoder.hpp"
#include "SpanNER/errors.hpp"
#include "SpanNER/overlap.hpp"
#include "SpanNER/score_transform.hpp"

using namespace spanner;

Entity Decoder::makeEntity(
    const Batch& batch, const std::string& text, int64_t example,
    int64_t startWord, int64_t endWord, int64_t label, float score
) {
    const auto& tokens = batch.batchTokens[example];

    Entity span;
    span.startIdx = tokens[startWord].start;
    span.endIdx = tokens[endWord].end;
    span.text = text.substr(span.startIdx, span.endIdx - span.startIdx);
    span.label = batch.className(label);
    span.score = score;
    return span;
}

std::vector<std::vector<Entity>> SpanDecoder::decode(
    const Batch& batch,
    const std::vector<std::string>& texts,
    const std::vector<float>& scores,
    const DecodeOptions& options
) {
    const ScoreLayout layout = batch.layout();
    if (static_cast<int64_t>(scores.size()) != layout.size()) {
        throw ConfigurationError(
            "Span scores hold " + std::to_string(scores.size()) + " values, expected " + std::to_string(layout.size())
        );
    }

    std::vector<std::vector<Entity>> spans(batch.batchSize);
    size_t outOfRange = 0;
    for (size_t id = 0; id < scores.size(); ++id) {
        float prob = sigmoid(scores[id]);
        if (prob < options.threshold) {
            continue;
        }

        ScorePosition pos = layout.position(id);
        const int64_t words = batch.textLengths[pos.batch];
        if (pos.start >= words || pos.end >= words) {
            ++outOfRange;
            continue;
        }

        spans[pos.batch].push_back(
            makeEntity(batch, texts[pos.batch], pos.batch, pos.start, pos.end, pos.label, prob)
        );
    }

    if (outOfRange > 0) {
        spdlog::debug("dropped {} span scores past the end of their text", outOfRange);
    }
    return batchGreedySearch(spans, options.flatNer, options.multiLabel);
}

std::vector<std::vector<Entity>> DotProductDecoder::decode(
    const Batch& batch,
    const std::vector<std::string>& texts,
    const std::vector<float>& scores,
    const DecodeOptions& options
) {
    const ScoreLayout layout = batch.layout();
    if (static_cast<int64_t>(scores.size()) != layout.size()) {
        throw ConfigurationError(
            "Span scores hold " + std::to_string(scores.size()) + " values, expected " + std::to_string(layout.size())
        );
    }

    std::vector<std::vector<Entity>> result;
    result.reserve(batch.batchSize);
    for (int64_t b = 0; b < batch.batchSize; b++) {
        const int64_t words = batch.textLengths[b];
        std::vector<Entity> entities;

        for (int64_t word = 0; word < layout.numWords; word++) {
            for (int64_t width = 0; width < layout.maxWidth; width++) {
                const int64_t spanId = layout.spanOffset(b, word, width);
                const int64_t startWord = batch.spanIdxs[2*spanId];
                const int64_t endWord = batch.spanIdxs[2*spanId+1];
                if (!batch.spanMasks[spanId] || startWord >= words || endWord >= words) {
                    continue;
                }

                for (int64_t label = 0; label < layout.numLabels; label++) {
                    float score = scores[layout.offset(b, word, width, label)];
                    if (score >= options.threshold) {
                        entities.push_back(makeEntity(batch, texts[b], b, startWord, endWord, label, score));
                    }
                }
            }
        }
        result.push_back(labelScopedSearch(entities));
    }
    return result;
}

std::vector<float> spanner::computeDotProductScores(
    const std::vector<float>& spanRep,
    const std::vector<float>& labelRep,
    int64_t spanCount,
    int64_t labelCount,
    int64_t hiddenSize
) {
    if (static_cast<int64_t>(spanRep.size()) < spanCount*hiddenSize ||
        static_cast<int64_t>(labelRep.size()) < labelCount*hiddenSize) {
        throw ConfigurationError("Span or label representations are smaller than their declared shape");
    }

    std::vector<float> scores(spanCount*labelCount);
    for (int64_t spanIdx = 0; spanIdx < spanCount; spanIdx++) {
        const float* span = spanRep.data() + spanIdx*hiddenSize;
        for (int64_t labelIdx = 0; labelIdx < labelCount; labelIdx++) {
            const float* label = labelRep.data() + labelIdx*hiddenSize;
            float dot = 0;
            for (int64_t h = 0; h < hiddenSize; h++) {
                dot += span[h] * label[h];
            }
            scores[spanIdx*labelCount + labelIdx] = sigmoid(dot);
        }
    }
    return scores;
}

ClassificationResult ClassificationDecoder::decode(
    const std::vector<float>& logits,
    const std::vector<std::string>& labels,
    bool multiLabel,
    float threshold
) const {
    if (logits.size() < labels.size()) {
        throw ConfigurationError(
            "Classifier returned " + std::to_string(logits.size()) + " logits for " +
            std::to_string(labels.size()) + " labels"
        );
    }
    return multiLabel ? decodeMultiLabel(logits, labels, threshold) : decodeSingleLabel(logits, labels);
}

ClassificationResult ClassificationDecoder::decodeSingleLabel(
    const std::vector<float>& logits, const std::vector<std::string>& labels
) const {
    if (labels.empty()) {
        return {};
    }

    // normalized over every logit; only the first labels.size() compete for the arg-max
    std::vector<float> probabilities = softmax(logits);

    size_t bestIdx = 0;
    for (size_t i = 1; i < labels.size(); i++) {
        if (probabilities[i] > probabilities[bestIdx]) {
            bestIdx = i;
        }
    }
    return {{labels[bestIdx], probabilities[bestIdx]}};
}

ClassificationResult ClassificationDecoder::decodeMultiLabel(
    const std::vector<float>& logits, const std::vector<std::string>& labels, float threshold
) const {
    ClassificationResult results;
    for (size_t i = 0; i < labels.size(); i++) {
        float prob = sigmoid(logits[i]);
        if (prob >= threshold) {
            results[labels[i]] = prob;
        }
    }
    return results;
}
