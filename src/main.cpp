#include <climits>
#include <iostream>
#include <string>
#include <vector>
#include <getopt.h>
#include "wordembed.hpp"

void PrintUsage(const char* prog_name) {
    std::cout << "wordembed - CBOW / Skip-gram embedding trainer (full softmax)\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << prog_name << " -t <file> -o <file> [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -t, --train <file>       训练文件路径 (必需)\n";
    std::cout << "  -o, --output <file>      输出向量文件路径 (必需)\n";
    std::cout << "  -V, --vocab-size <int>   词汇表大小，含 UNK (默认: 50000)\n";
    std::cout << "  -s, --size <int>         向量维度 (默认: 128)\n";
    std::cout << "  -w, --window <int>       单侧窗口大小 (默认: 1)\n";
    std::cout << "  -k, --num-skips <int>    每个中心词的样本数, 仅Skip-gram (默认: 2)\n";
    std::cout << "  -B, --batch-size <int>   批大小 (默认: 128)\n";
    std::cout << "  -n, --steps <int>        训练步数 (默认: 100001)\n";
    std::cout << "  -c, --cbow <0|1>         使用CBOW(1)或Skip-gram(0) (默认: 0)\n";
    std::cout << "  -a, --alpha <float>      AdaGrad学习率 (默认: 1.0)\n";
    std::cout << "  -r, --seed <int>         随机种子 (默认: 1)\n";
    std::cout << "  -l, --log-every <int>    每多少步输出平均损失 (默认: 2000)\n";
    std::cout << "  -b, --binary <0|1>       二进制格式保存 (默认: 0)\n";
    std::cout << "  -W, --save-vocab <file>  保存词汇表\n";
    std::cout << "  -h, --help               显示帮助信息\n";
}

int main(int argc, char** argv) {
    wordembed::Trainer::Config config;
    std::string vocab_file;

    static struct option long_options[] = {
        {"train",      required_argument, 0, 't'},
        {"output",     required_argument, 0, 'o'},
        {"vocab-size", required_argument, 0, 'V'},
        {"size",       required_argument, 0, 's'},
        {"window",     required_argument, 0, 'w'},
        {"num-skips",  required_argument, 0, 'k'},
        {"batch-size", required_argument, 0, 'B'},
        {"steps",      required_argument, 0, 'n'},
        {"cbow",       required_argument, 0, 'c'},
        {"alpha",      required_argument, 0, 'a'},
        {"seed",       required_argument, 0, 'r'},
        {"log-every",  required_argument, 0, 'l'},
        {"binary",     required_argument, 0, 'b'},
        {"save-vocab", required_argument, 0, 'W'},
        {"help",       no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    int opt = 0;
    int option_index = 0;

    try {
        while ((opt = getopt_long(argc, argv, "t:o:V:s:w:k:B:n:c:a:r:l:b:W:h",
                                  long_options, &option_index)) != -1) {
            switch (opt) {
                case 't':
                    config.train_file = optarg;
                    break;
                case 'o':
                    config.output_file = optarg;
                    break;
                case 'V':
                    config.vocab_size = std::stoi(optarg);
                    break;
                case 's':
                    config.model_config.vector_size = std::stoi(optarg);
                    break;
                case 'w':
                    config.window = std::stoi(optarg);
                    break;
                case 'k':
                    config.num_skips = std::stoi(optarg);
                    break;
                case 'B':
                    config.batch_size = std::stoi(optarg);
                    break;
                case 'n':
                    config.steps = std::stoll(optarg);
                    break;
                case 'c':
                    config.use_cbow = (std::stoi(optarg) != 0);
                    break;
                case 'a':
                    config.model_config.learning_rate = std::stof(optarg);
                    break;
                case 'r':
                    config.seed = std::stoull(optarg);
                    config.model_config.seed = config.seed;
                    break;
                case 'l':
                    config.report_interval = std::stoi(optarg);
                    config.neighbor_interval = config.report_interval > INT_MAX / 5
                                                   ? INT_MAX
                                                   : config.report_interval * 5;
                    break;
                case 'b':
                    config.binary = (std::stoi(optarg) != 0);
                    break;
                case 'W':
                    vocab_file = optarg;
                    break;
                case 'h':
                default:
                    PrintUsage(argv[0]);
                    return (opt == 'h') ? 0 : 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid value for -" << static_cast<char>(opt)
                  << ": " << optarg << " (" << e.what() << ")\n";
        return 1;
    }

    // 验证必需参数
    if (config.train_file.empty() || config.output_file.empty()) {
        std::cerr << "Error: -train and -output are required\n";
        PrintUsage(argv[0]);
        return 1;
    }

    try {
        // 学习词汇表
        wordembed::Vocabulary vocab;
        std::vector<std::string> tokens = vocab.LearnFromFile(config.train_file, config.vocab_size);
        if (!vocab_file.empty()) {
            vocab.Save(vocab_file);
        }

        std::vector<int> data = vocab.Encode(tokens);
        tokens.clear();
        tokens.shrink_to_fit();

        // 训练模型
        wordembed::Trainer trainer(vocab, config);
        trainer.Train(data);

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
