#include <filesystem>
#include <fstream>

#include <gtest/gtest.h>

#include "SpanNER/onnx_engine.hpp"
#include "SpanNER/hf_tokenizer.hpp"
#include "SpanNER/loader.hpp"
#include "SpanNER/errors.hpp"

using namespace spanner;

namespace fs = std::filesystem;

namespace {
    class TempDir {
    public:
        TempDir() {
            path = fs::temp_directory_path() / ("spanner_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                                                "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
            fs::create_directories(path);
        }
        ~TempDir() {
            std::error_code ec;
            fs::remove_all(path, ec);
        }

        fs::path path;
    };
}

TEST(OnnxBackendTest, DirectoryResolvesToDefaultModel) {
    TempDir dir;
    fs::create_directories(dir.path / "onnx");
    std::ofstream(dir.path / "onnx" / "model.onnx") << "onnx";

    EXPECT_EQ(fs::path(resolveModelPath(dir.path.string())), dir.path / "onnx" / "model.onnx");
}

TEST(OnnxBackendTest, MissingModel) {
    TempDir dir;

    EXPECT_THROW(resolveModelPath(dir.path.string()), ModelNotFoundError);
    EXPECT_THROW(resolveModelPath((dir.path / "missing.onnx").string()), ModelNotFoundError);
    EXPECT_THROW(OnnxEngine((dir.path / "missing.onnx").string()), ModelNotFoundError);
}

TEST(OnnxBackendTest, MissingTokenizer) {
    TempDir dir;

    EXPECT_THROW(LoadBytesFromFile((dir.path / "tokenizer.json").string()), ModelNotFoundError);
    EXPECT_THROW(HFTokenizer(dir.path.string()), ModelNotFoundError);
}

TEST(OnnxBackendTest, LoadBytes) {
    TempDir dir;
    std::ofstream(dir.path / "blob.bin", std::ios::binary) << "abc\ndef";

    EXPECT_EQ(LoadBytesFromFile((dir.path / "blob.bin").string()), "abc\ndef");
}

TEST(OnnxBackendTest, MissingSchemaModelDirectory) {
    EXPECT_THROW(loadSchemaModel("/nonexistent/spanner/model"), ModelNotFoundError);
}
