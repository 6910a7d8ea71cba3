#include <iostream>
#include <vector>
#include <string>

#include <spdlog/spdlog.h>

#include "SpanNER/spanner_config.hpp"
#include "SpanNER/loader.hpp"
#include "SpanNER/errors.hpp"

int main(int argc, char** argv) {
    spdlog::set_level(spdlog::level::debug);

    const std::string modelDir = argc > 1 ? argv[1] : "./gliner_small-v2.1";
    spanner::Config config{12};  // Set your maxWidth

    std::unique_ptr<spanner::Model> model;
    try {
        model = spanner::loadModel(modelDir, modelDir + "/tokenizer.json", config);
    } catch (const spanner::ModelNotFoundError& e) {
        spdlog::error("{}", e.what());
        return 1;
    }

    // A sample input
    std::vector<std::string> texts = {"Kyiv is the capital of Ukraine."};
    std::vector<std::string> entities = {"city", "country", "river", "person", "car"};

    auto output = model->inference(texts, entities);

    std::cout << "\nModel Inference:" << std::endl;
    for (size_t batch = 0; batch < output.size(); ++batch) {
        std::cout << "Batch " << batch << ":\n";
        for (const auto& span : output[batch]) {
            std::cout << "  Span: [" << span.startIdx << ", " << span.endIdx << "], "
                      << "Class: " << span.label << ", "
                      << "Text: " << span.text << ", "
                      << "Prob: " << span.score << std::endl;
        }
    }

    return 0;
}
