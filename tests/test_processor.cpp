#include <memory>
#include <numeric>

#include <gtest/gtest.h>

#include "SpanNER/processor.hpp"
#include "SpanNER/decoder.hpp"
#include "SpanNER/span_lattice.hpp"
#include "stubs.hpp"

using namespace spanner;
using spanner::stubs::StubTokenizer;

namespace {
    template <typename T>
    std::vector<T> row(const std::vector<T>& data, int64_t index, int64_t width) {
        return std::vector<T>(data.begin() + index * width, data.begin() + (index + 1) * width);
    }

    void expectPaddedShapes(const Batch& batch) {
        EXPECT_EQ(static_cast<int64_t>(batch.inputsIds.size()), batch.batchSize * batch.numTokens);
        EXPECT_EQ(static_cast<int64_t>(batch.attentionMasks.size()), batch.batchSize * batch.numTokens);
        EXPECT_EQ(static_cast<int64_t>(batch.textLengths.size()), batch.batchSize);
        EXPECT_EQ(batch.numSpans, batch.numWords * batch.maxWidth);
        EXPECT_EQ(static_cast<int64_t>(batch.spanIdxs.size()), batch.batchSize * batch.numSpans * 2);
        EXPECT_EQ(static_cast<int64_t>(batch.spanMasks.size()), batch.batchSize * batch.numSpans);
        for (int64_t length : batch.textLengths) {
            EXPECT_LE(length, batch.numWords);
        }
    }
}

TEST(ProcessorTest, TokenizeText) {
    auto tokenizer = std::make_shared<StubTokenizer>();
    SpanProcessor processor(tokenizer, Config{});

    auto batchTokens = processor.batchTokenizeText({"Hello world", "I love C++"});
    ASSERT_EQ(batchTokens.size(), 2u);
    EXPECT_EQ(batchTokens[0].size(), 2u);
    ASSERT_EQ(batchTokens[1].size(), 5u);
    EXPECT_EQ(batchTokens[1][2].text, "C");
    EXPECT_EQ(batchTokens[1][4].start, 9u);
}

TEST(ProcessorTest, SpanBatchLayout) {
    auto tokenizer = std::make_shared<StubTokenizer>();
    tokenizer->pieces["Seattle"] = {"Seat", "tle"};
    SpanProcessor processor(tokenizer, Config{3});

    std::unique_ptr<Batch> batch = processor.prepareBatch({"Hello world", "We love Seattle"}, {"person", "city"});
    const auto& spanBatch = dynamic_cast<const SpanBatch&>(*batch);
    expectPaddedShapes(spanBatch);

    // CLS, <<ENT>> person <<ENT>> city <<SEP>>, words, SEP
    EXPECT_EQ(spanBatch.batchSize, 2);
    EXPECT_EQ(spanBatch.numWords, 3);
    EXPECT_EQ(spanBatch.numTokens, 1 + 5 + 4 + 1);
    EXPECT_EQ(spanBatch.textLengths, (std::vector<int64_t>{2, 3}));
    ASSERT_EQ(spanBatch.wordsMasks.size(), spanBatch.inputsIds.size());

    std::vector<int64_t> ids0 = row(spanBatch.inputsIds, 0, spanBatch.numTokens);
    EXPECT_EQ(ids0.front(), SpanProcessor::CLS_TOKEN_ID);
    EXPECT_EQ(ids0[8], tokenizer->sepTokenId());
    EXPECT_EQ(ids0[9], 0);
    EXPECT_EQ(ids0[10], 0);
    EXPECT_EQ(ids0[1], ids0[3]);  // both <<ENT>>

    EXPECT_EQ(row(spanBatch.attentionMasks, 0, spanBatch.numTokens),
              (std::vector<int64_t>{1, 1, 1, 1, 1, 1, 1, 1, 1, 0, 0}));
    EXPECT_EQ(row(spanBatch.attentionMasks, 1, spanBatch.numTokens),
              (std::vector<int64_t>{1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1}));

    // 1-based word ids on the first sub-token of every text word
    EXPECT_EQ(row(spanBatch.wordsMasks, 0, spanBatch.numTokens),
              (std::vector<int64_t>{0, 0, 0, 0, 0, 0, 1, 2, 0, 0, 0}));
    EXPECT_EQ(row(spanBatch.wordsMasks, 1, spanBatch.numTokens),
              (std::vector<int64_t>{0, 0, 0, 0, 0, 0, 1, 2, 3, 0, 0}));

    EXPECT_EQ(spanBatch.idToClass.at(1), "person");
    EXPECT_EQ(spanBatch.idToClass.at(2), "city");
    EXPECT_EQ(spanBatch.className(1), "city");
}

TEST(ProcessorTest, SpanMasksFollowTextLength) {
    auto tokenizer = std::make_shared<StubTokenizer>();
    SpanProcessor processor(tokenizer, Config{2});

    std::unique_ptr<Batch> batch = processor.prepareBatch({"a b c", "d"}, {"x"});
    expectPaddedShapes(*batch);
    ASSERT_EQ(batch->numSpans, 6);

    EXPECT_EQ(row(batch->spanMasks, 0, batch->numSpans), (std::vector<uint8_t>{1, 1, 1, 1, 1, 0}));
    EXPECT_EQ(row(batch->spanMasks, 1, batch->numSpans), (std::vector<uint8_t>{1, 0, 0, 0, 0, 0}));
    EXPECT_EQ(row(batch->spanIdxs, 0, batch->numSpans * 2),
              (std::vector<int64_t>{0, 0, 0, 1, 1, 1, 1, 2, 2, 2, 2, 2}));
}

TEST(ProcessorTest, SpanBatchTensors) {
    auto tokenizer = std::make_shared<StubTokenizer>();
    SpanProcessor processor(tokenizer, Config{4});

    std::unique_ptr<Batch> batch = processor.prepareBatch({"one two"}, {"x"});
    TensorMap tensors = batch->tensors();

    ASSERT_EQ(tensors.size(), 6u);
    EXPECT_EQ(tensors.at("input_ids").shape, (std::vector<int64_t>{1, batch->numTokens}));
    EXPECT_EQ(tensors.at("words_mask").shape, (std::vector<int64_t>{1, batch->numTokens}));
    EXPECT_EQ(tensors.at("text_lengths").shape, (std::vector<int64_t>{1, 1}));
    EXPECT_EQ(tensors.at("span_idx").shape, (std::vector<int64_t>{1, 8, 2}));
    EXPECT_EQ(tensors.at("span_mask").type, TensorType::BOOL);
    for (const auto& [name, tensor] : tensors) {
        int64_t expected = std::accumulate(tensor.shape.begin(), tensor.shape.end(), int64_t{1}, std::multiplies<int64_t>());
        EXPECT_EQ(static_cast<int64_t>(tensor.elementCount()), expected) << name;
    }
}

TEST(ProcessorTest, SchemaBatchLayout) {
    auto tokenizer = std::make_shared<StubTokenizer>();
    tokenizer->pieces["seattle"] = {"seat", "tle"};
    SchemaProcessor processor(tokenizer, stubs::stubSchemaConfig(2), SchemaTask::ENTITIES);

    std::unique_ptr<SchemaBatch> batch = processor.prepareSchemaBatch({"Visit Seattle", "Hi"}, {"person", "city"});
    expectPaddedShapes(*batch);

    // ( [P] entities ( [E] person [E] city ) ) [SEP_TEXT]
    EXPECT_EQ(batch->schemaLength, 11);
    EXPECT_EQ(batch->labelPositions, (std::vector<int64_t>{4, 6}));
    std::vector<int64_t> ids0 = row(batch->inputsIds, 0, batch->numTokens);
    EXPECT_EQ(ids0[1], 10);
    EXPECT_EQ(ids0[4], 11);
    EXPECT_EQ(ids0[6], 11);
    EXPECT_EQ(ids0[10], 13);
    EXPECT_EQ(ids0[11], tokenizer->tokenToId("visit"));

    EXPECT_EQ(batch->textTokenCounts, (std::vector<int64_t>{3, 1}));
    EXPECT_EQ(batch->numTokens, 14);
    EXPECT_EQ(batch->textLengths, (std::vector<int64_t>{2, 1}));

    // words keep the input casing and offsets
    ASSERT_EQ(batch->batchTokens[0].size(), 2u);
    EXPECT_EQ(batch->batchTokens[0][1].text, "Seattle");
    EXPECT_EQ(batch->batchTokens[0][1].start, 6u);

    // (0,0) (0,1) (1,1) (1,1 invalid) over first sub-token positions 0 and 1
    EXPECT_EQ(row(batch->tokenSpanIdxs, 0, batch->numSpans * 2),
              (std::vector<int64_t>{0, 0, 0, 1, 1, 1, 1, 1}));
    EXPECT_EQ(row(batch->spanMasks, 0, batch->numSpans), (std::vector<uint8_t>{1, 1, 1, 0}));

    TensorMap tensors = batch->tensors();
    EXPECT_EQ(tensors.size(), 2u);
    EXPECT_EQ(tensors.at("attention_mask").shape, (std::vector<int64_t>{2, 14}));
}

TEST(ProcessorTest, ClassificationSchemaUsesLabelMarker) {
    auto tokenizer = std::make_shared<StubTokenizer>();
    SchemaProcessor processor(tokenizer, stubs::stubSchemaConfig(2), SchemaTask::CLASSIFICATION);

    std::unique_ptr<SchemaBatch> batch = processor.prepareSchemaBatch({"Great movie"}, {"positive", "negative"});

    EXPECT_EQ(batch->inputsIds[4], 12);
    EXPECT_EQ(batch->inputsIds[6], 12);
    EXPECT_EQ(batch->inputsIds[2], tokenizer->tokenToId("category"));
}

TEST(ProcessorTest, SpanTablesFollowScoreLayout) {
    auto tokenizer = std::make_shared<StubTokenizer>();
    SpanProcessor processor(tokenizer, Config{3});

    std::unique_ptr<Batch> batch = processor.prepareBatch({"a b c d", "e f"}, {"x", "y"});
    ScoreLayout layout = batch->layout();
    EXPECT_EQ(batch->numSpans, layout.spansPerExample());

    for (int64_t p = 0; p < batch->batchSize; p++) {
        std::vector<SpanIndex> spans = generateSpans(batch->textLengths[p], batch->maxWidth);
        for (size_t k = 0; k < spans.size(); k++) {
            const int64_t width = static_cast<int64_t>(k) % batch->maxWidth;
            const int64_t idx = layout.spanOffset(p, spans[k].start, width);
            EXPECT_EQ(batch->spanIdxs[2*idx], spans[k].start);
            EXPECT_EQ(batch->spanIdxs[2*idx+1], spans[k].end);
            EXPECT_EQ(batch->spanMasks[idx], spans[k].valid ? 1 : 0);
        }
    }
}

TEST(ProcessorTest, TextWithoutWordsGivesZeroLengthRow) {
    auto tokenizer = std::make_shared<StubTokenizer>();
    SpanProcessor spanProcessor(tokenizer, Config{2});
    SchemaProcessor schemaProcessor(tokenizer, stubs::stubSchemaConfig(2), SchemaTask::ENTITIES);

    std::unique_ptr<Batch> spanBatch = spanProcessor.prepareBatch({"", "a b"}, {"x"});
    std::unique_ptr<SchemaBatch> schemaBatch = schemaProcessor.prepareSchemaBatch({"", "a b"}, {"x"});

    for (const Batch* batch : {static_cast<const Batch*>(spanBatch.get()), static_cast<const Batch*>(schemaBatch.get())}) {
        expectPaddedShapes(*batch);
        EXPECT_EQ(batch->textLengths, (std::vector<int64_t>{0, 2}));
        EXPECT_TRUE(batch->batchTokens[0].empty());
        std::vector<uint8_t> masks = row(batch->spanMasks, 0, batch->numSpans);
        EXPECT_EQ(std::accumulate(masks.begin(), masks.end(), 0), 0);
    }
    EXPECT_EQ(schemaBatch->textTokenCounts[0], 0);
    // the schema alone, padded to the longer example
    std::vector<int64_t> expected(schemaBatch->schemaLength, 1);
    expected.resize(schemaBatch->numTokens, 0);
    EXPECT_EQ(row(schemaBatch->attentionMasks, 0, schemaBatch->numTokens), expected);
}

TEST(ProcessorTest, BatchWithoutWordsDecodesToEmptyLists) {
    auto tokenizer = std::make_shared<StubTokenizer>();
    SpanProcessor spanProcessor(tokenizer, Config{2});
    SchemaProcessor schemaProcessor(tokenizer, stubs::stubSchemaConfig(2), SchemaTask::ENTITIES);
    const std::vector<std::string> texts = {"", ""};

    std::unique_ptr<Batch> spanBatch = spanProcessor.prepareBatch(texts, {"x"});
    EXPECT_EQ(spanBatch->numWords, 0);
    EXPECT_EQ(spanBatch->numSpans, 0);
    EXPECT_EQ(spanBatch->layout().size(), 0);
    SpanDecoder spanDecoder;
    auto spanResult = spanDecoder.decode(*spanBatch, texts, {});
    ASSERT_EQ(spanResult.size(), 2u);
    EXPECT_TRUE(spanResult[0].empty());
    EXPECT_TRUE(spanResult[1].empty());

    std::unique_ptr<SchemaBatch> schemaBatch = schemaProcessor.prepareSchemaBatch(texts, {"x"});
    EXPECT_EQ(schemaBatch->numWords, 0);
    DotProductDecoder dotDecoder;
    auto dotResult = dotDecoder.decode(*schemaBatch, texts, {});
    ASSERT_EQ(dotResult.size(), 2u);
    EXPECT_TRUE(dotResult[0].empty());
    EXPECT_TRUE(dotResult[1].empty());
}

TEST(ProcessorTest, SchemaWordsEncodeLowerCasedWithInputOffsets) {
    auto tokenizer = std::make_shared<StubTokenizer>();
    SchemaProcessor processor(tokenizer, stubs::stubSchemaConfig(2), SchemaTask::ENTITIES);

    std::unique_ptr<SchemaBatch> upper = processor.prepareSchemaBatch({"VISIT Seattle"}, {"city"});
    std::unique_ptr<SchemaBatch> lower = processor.prepareSchemaBatch({"visit seattle"}, {"city"});

    EXPECT_EQ(upper->inputsIds, lower->inputsIds);
    ASSERT_EQ(upper->batchTokens[0].size(), 2u);
    EXPECT_EQ(upper->batchTokens[0][0].text, "VISIT");
    EXPECT_EQ(upper->batchTokens[0][1].start, 6u);
    EXPECT_EQ(tokenizer->tokenToId("VISIT"), -1);
}
