#pragma once

#include <string>
#include <memory>
#include <random>
#include <vector>
#include "batch.hpp"
#include "model.hpp"

namespace wordembed {

class Vocabulary;

struct TrainingSummary {
    long long steps = 0;
    size_t cursor = 0;           // 下一个批次的起始位置
    float average_loss = 0.0f;   // 最近一个统计区间的平均损失
    float last_loss = 0.0f;
};

class Trainer {
public:
    struct Config {
        std::string train_file;
        std::string output_file;
        int vocab_size = 50000;
        long long steps = 100001;
        int batch_size = 128;
        int window = 1;                  // skip_window / bag_window
        int num_skips = 2;               // 仅 skip-gram 使用
        bool use_cbow = false;           // 使用CBOW或Skip-gram (默认: Skip-gram)
        int report_interval = 2000;      // 每多少步输出平均损失 (0=不输出)
        int neighbor_interval = 10000;   // 每多少步输出验证词的近邻 (0=不输出)
        int valid_size = 16;             // 验证词数量
        int valid_window = 100;          // 验证词从前 valid_window 个高频词中抽取
        int top_k = 8;
        bool binary = false;             // 二进制输出
        unsigned long long seed = 1;     // 采样随机种子
        EmbeddingModel::Config model_config;

        Config() = default;
    };

    Trainer(const Vocabulary& vocab, const Config& config);

    // 在索引序列上训练 config.steps 步
    TrainingSummary Train(const std::vector<int>& data);

    // 从当前游标生成下一个批次并推进游标
    Batch NextBatch(const std::vector<int>& data);

    // 保存归一化后的词向量到 output_file
    void SaveVectors() const;

    const EmbeddingModel& Model() const { return *model_; }
    EmbeddingModel& Model() { return *model_; }
    size_t Cursor() const { return cursor_; }
    const std::vector<int>& ValidExamples() const { return valid_examples_; }

private:
    const Vocabulary& vocab_;
    Config config_;
    std::unique_ptr<EmbeddingModel> model_;

    // 二者只有一个非空，由 use_cbow 决定
    std::unique_ptr<CbowBatchGenerator> cbow_;
    std::unique_ptr<SkipGramBatchGenerator> skip_gram_;

    std::mt19937_64 rng_;
    size_t cursor_ = 0;
    std::vector<int> valid_examples_;

    void InitValidExamples();
    void ReportNeighbors() const;
};

} // namespace wordembed
