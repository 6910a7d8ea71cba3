#pragma once

#include <string>
#include <memory>

#include "spanner_config.hpp"
#include "model.hpp"
#include "schema_model.hpp"

namespace spanner {
    // File names of the four sessions of a schema model, relative to its directory.
    struct SchemaModelFiles {
        std::string encoder = "onnx/encoder.onnx";
        std::string classifier = "onnx/classifier.onnx";
        std::string spanRep = "onnx/span_rep.onnx";
        std::string countEmbed = "onnx/count_embed.onnx";
    };

    std::unique_ptr<Model> loadModel(
        const std::string& model_path, const std::string& tokenizer_path, const Config& config
    );

    // Special token ids left unset in `config` are read from the tokenizer vocabulary.
    std::unique_ptr<SchemaModel> loadSchemaModel(
        const std::string& model_dir, const SchemaModelFiles& files = {}, const SchemaConfig& config = {}
    );
}
