#include <iostream>
#include <vector>
#include <string>

#include <spdlog/spdlog.h>

#include "SpanNER/loader.hpp"
#include "SpanNER/errors.hpp"

int main(int argc, char** argv) {
    spdlog::set_level(spdlog::level::info);

    const std::string modelDir = argc > 1 ? argv[1] : "./gliner2-base";

    std::unique_ptr<spanner::SchemaModel> model;
    try {
        model = spanner::loadSchemaModel(modelDir);
    } catch (const spanner::Error& e) {
        spdlog::error("{}", e.what());
        return 1;
    }

    const std::string text = "Apple released the new iPhone in Cupertino last week and reviewers loved it.";

    auto entities = model->extract(text, {"company", "product", "location"});
    std::cout << "Entities:" << std::endl;
    for (const auto& span : entities) {
        std::cout << "  " << span.label << ": " << span.text
                  << " [" << span.startIdx << ", " << span.endIdx << "] " << span.score << std::endl;
    }

    auto sentiment = model->classify(text, {"positive", "negative", "neutral"});
    std::cout << "Sentiment:" << std::endl;
    for (const auto& [label, score] : sentiment) {
        std::cout << "  " << label << ": " << score << std::endl;
    }

    auto topics = model->classify(text, {"technology", "sports", "business"}, 0.5, true);
    std::cout << "Topics:" << std::endl;
    for (const auto& [label, score] : topics) {
        std::cout << "  " << label << ": " << score << std::endl;
    }

    return 0;
}
