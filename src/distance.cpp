#include <cstdio>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include "glove.hpp"

namespace {

constexpr int kTopWords = 40;

void PrintResults(const glove::SimilarWords& results) {
    std::cout << "\n                                              Word       Cosine similarity\n";
    std::cout << "------------------------------------------------------------------------\n";
    for (const auto& r : results) {
        printf("%50s\t\t%f\n", r.first.c_str(), r.second);
    }
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cout << "Usage: glove-distance <model_prefix> [num_components]\n";
        return 1;
    }

    std::string prefix = argv[1];
    glove::GloveModel::Config config;
    config.threads = 1;

    try {
        if (argc > 2) config.num_components = std::stoi(argv[2]);

        std::cout << "Loading model from " << prefix << "...\n";
        glove::GloveModel model(config);
        model.Load(glove::ModelFiles::FromPrefix(prefix));
        std::cout << "Vocabulary size: " << model.corpus().Size()
                  << ", Vector size: " << config.num_components << "\n";
        std::cout << "Model loaded successfully!\n\n";

        std::cout << "Enter word (EXIT to break): ";

        std::string input;
        while (std::getline(std::cin, input)) {
            if (input == "EXIT") break;

            std::istringstream iss(input);
            std::string word;
            if (!(iss >> word)) {
                std::cout << "\nEnter word (EXIT to break): ";
                continue;
            }

            auto results = model.MostSimilar(word, kTopWords);
            if (results.empty()) {
                std::cout << "Word \"" << word << "\" not found in vocabulary\n";
            } else {
                PrintResults(results);
            }

            std::cout << "\nEnter word (EXIT to break): ";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
