#include <cstdio>
#include <iostream>
#include <sstream>
#include <string>
#include <getopt.h>
#include "glove.hpp"

void PrintUsage(const char* prog_name) {
    std::cout << "GloVe - C++ Implementation\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << prog_name << " -t <file> -o <prefix> [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -t, --train <file>          训练文件路径 (必需)\n";
    std::cout << "  -o, --output <prefix>       输出前缀，生成 .corpus/.cooc/.vec/.bias/.txt (必需)\n";
    std::cout << "  -s, --size <int>            向量维度 (默认: 30)\n";
    std::cout << "  -w, --window <int>          窗口大小 (默认: 2)\n";
    std::cout << "  -m, --min-count <int>       最小词频 (默认: 1)\n";
    std::cout << "  -p, --threads <int>         线程数 (默认: 4)\n";
    std::cout << "  -i, --iter <int>            迭代次数 (默认: 5)\n";
    std::cout << "  -r, --learning-rate <float> 初始学习率 (默认: 0.05)\n";
    std::cout << "  -a, --alpha <float>         加权函数指数 (默认: 0.75)\n";
    std::cout << "  -x, --max-count <float>     加权函数截断点 (默认: 100)\n";
    std::cout << "  -k, --stop-words <list>     逗号分隔的停用词\n";
    std::cout << "  -L, --row-locked            使用分段行锁更新 (默认: 无锁)\n";
    std::cout << "  -d, --deterministic         单线程训练，配合 --seed 结果可复现\n";
    std::cout << "  -S, --seed <int>            随机种子 (默认: 0=随机)\n";
    std::cout << "  -q, --query <word>          训练后打印最相似的词\n";
    std::cout << "  -n, --num <int>             查询结果个数 (默认: 10)\n";
    std::cout << "  -v, --verbose               显示训练进度\n";
    std::cout << "  -h, --help                  显示帮助信息\n";
}

int main(int argc, char** argv) {
    glove::GloveModel::Config config;
    std::string train_file;
    std::string output_prefix;
    std::string query;
    int num = 10;

    static struct option long_options[] = {
        {"train",         required_argument, 0, 't'},
        {"output",        required_argument, 0, 'o'},
        {"size",          required_argument, 0, 's'},
        {"window",        required_argument, 0, 'w'},
        {"min-count",     required_argument, 0, 'm'},
        {"threads",       required_argument, 0, 'p'},
        {"iter",          required_argument, 0, 'i'},
        {"learning-rate", required_argument, 0, 'r'},
        {"alpha",         required_argument, 0, 'a'},
        {"max-count",     required_argument, 0, 'x'},
        {"stop-words",    required_argument, 0, 'k'},
        {"row-locked",    no_argument,       0, 'L'},
        {"deterministic", no_argument,       0, 'd'},
        {"seed",          required_argument, 0, 'S'},
        {"query",         required_argument, 0, 'q'},
        {"num",           required_argument, 0, 'n'},
        {"verbose",       no_argument,       0, 'v'},
        {"help",          no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    int option_index = 0;

    try {
        while ((opt = getopt_long(argc, argv, "t:o:s:w:m:p:i:r:a:x:k:LdS:q:n:vh",
                                  long_options, &option_index)) != -1) {
            switch (opt) {
                case 't':
                    train_file = optarg;
                    break;
                case 'o':
                    output_prefix = optarg;
                    break;
                case 's':
                    config.num_components = std::stoi(optarg);
                    break;
                case 'w':
                    config.window = std::stoi(optarg);
                    break;
                case 'm':
                    config.min_count = std::stoi(optarg);
                    break;
                case 'p':
                    config.threads = std::stoi(optarg);
                    break;
                case 'i':
                    config.epochs = std::stoi(optarg);
                    break;
                case 'r':
                    config.learning_rate = std::stod(optarg);
                    break;
                case 'a':
                    config.alpha = std::stod(optarg);
                    break;
                case 'x':
                    config.max_count = std::stod(optarg);
                    break;
                case 'k': {
                    std::istringstream list(optarg);
                    std::string word;
                    while (std::getline(list, word, ',')) {
                        if (!word.empty()) config.stop_words.push_back(word);
                    }
                    break;
                }
                case 'L':
                    config.update_mode = glove::UpdateMode::kRowLocked;
                    break;
                case 'd':
                    config.update_mode = glove::UpdateMode::kDeterministic;
                    break;
                case 'S':
                    config.seed = std::stoull(optarg);
                    break;
                case 'q':
                    query = optarg;
                    break;
                case 'n':
                    num = std::stoi(optarg);
                    break;
                case 'v':
                    config.verbose = true;
                    break;
                case 'h':
                default:
                    PrintUsage(argv[0]);
                    return (opt == 'h') ? 0 : 1;
            }
        }
    } catch (const std::exception& e) {
        // std::stoi 等解析失败
        std::cerr << "Error: bad value for -" << static_cast<char>(opt) << ": " << e.what() << "\n";
        return 1;
    }

    // 验证必需参数
    if (train_file.empty() || output_prefix.empty()) {
        std::cerr << "Error: -train and -output are required\n";
        PrintUsage(argv[0]);
        return 1;
    }

    try {
        glove::GloveModel model(config);

        // 构建语料和共现矩阵
        model.Fit(glove::Corpus::BuildFromFile(train_file, config.CorpusOptions()));

        // 训练模型
        model.Train();

        model.Save(glove::ModelFiles::FromPrefix(output_prefix));
        model.SaveVectorsText(output_prefix + ".txt");
        std::cout << "Model saved with prefix " << output_prefix << "\n";

        if (!query.empty()) {
            auto results = model.MostSimilar(query, num);
            if (results.empty()) {
                std::cout << "Word \"" << query << "\" not found in vocabulary\n";
            }
            for (const auto& r : results) {
                printf("%50s\t\t%f\n", r.first.c_str(), r.second);
            }
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
