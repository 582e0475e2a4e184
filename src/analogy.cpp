#include <cstdio>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include "glove.hpp"

namespace {

constexpr int kTopWords = 40;
constexpr double kAccuracy = 0.0001;

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cout << "Usage: glove-analogy <model_prefix> [num_components]\n";
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

        std::cout << "Word analogy: Enter three words (e.g., 'quantum physics atom')\n";
        std::cout << "Ranks words by similarity to the third word, skipping those whose\n";
        std::cout << "similarity equals cos(first, second)\n";
        std::cout << "Enter EXIT to quit\n\n";
        std::cout << "Enter three words: ";

        std::string input;
        while (std::getline(std::cin, input)) {
            if (input == "EXIT") break;
            if (input.empty()) {
                std::cout << "\nEnter three words: ";
                continue;
            }

            std::istringstream iss(input);
            std::vector<std::string> words;
            std::string word;
            while (iss >> word) {
                words.push_back(word);
            }

            if (words.size() != 3) {
                std::cout << "Error: Please enter exactly three words\n";
                std::cout << "\nEnter three words: ";
                continue;
            }

            auto results = model.AnalogyWords(words[0], words[1], words[2], kTopWords, kAccuracy);
            // 结果可能因为三个词都被排除而为空，只有第三个词确实不在词表里才报告
            if (!model.Contains(words[2])) {
                std::cout << "Word \"" << words[2] << "\" not found in vocabulary\n";
            }

            std::cout << "\n                                              Word       Cosine similarity\n";
            std::cout << "------------------------------------------------------------------------\n";
            for (const auto& r : results) {
                printf("%50s\t\t%f\n", r.first.c_str(), r.second);
            }

            std::cout << "\nEnter three words: ";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
