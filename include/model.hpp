#pragma once

#include <string>
#include <vector>
#include <random>

namespace wordembed {

class Vocabulary;
struct Batch;

// 归一化后的词向量表（每行单位长度），供余弦相似度使用
struct NormalizedEmbeddings {
    int vocab_size = 0;
    int vector_size = 0;
    std::vector<float> data;
    std::vector<int> degenerate_rows;   // 范数为 0 的行，保持零向量

    const float* Row(int index) const { return data.data() + static_cast<size_t>(index) * vector_size; }
    bool IsDegenerate(int index) const;
};

// 按行做 L2 归一化；零范数行记录到 degenerate_rows 并输出警告
NormalizedEmbeddings NormalizeRows(const std::vector<float>& table, int rows, int cols);

// word2vec 格式的向量文件内容
struct VectorFile {
    std::vector<std::string> words;
    int vector_size = 0;
    std::vector<float> data;
};

VectorFile ReadVectorFile(const std::string& filename, bool binary = false);

class EmbeddingModel {
public:
    struct Config {
        int vector_size = 128;           // 向量维度
        float init_range = 1.0f;         // 初始化区间 [-init_range, init_range]
        float learning_rate = 1.0f;      // AdaGrad 学习率
        float initial_accumulator = 0.1f;
        unsigned long long seed = 1;

        Config() = default;
    };

    EmbeddingModel(const Vocabulary& vocab, const Config& config);

    // 一步 AdaGrad 训练，返回更新前的平均交叉熵
    float TrainBatch(const Batch& batch);

    // 平均交叉熵（不更新参数）
    float Loss(const Batch& batch) const;

    // 平均交叉熵对词向量表的梯度，grad 与词向量表同形
    float ComputeGradient(const Batch& batch, std::vector<float>& grad) const;

    // 第 i 个样本的输入向量之和
    std::vector<float> Aggregate(const Batch& batch, size_t i) const;

    // [batch, vocab] 的内积得分矩阵
    std::vector<float> Scores(const Batch& batch) const;

    // 获取/设置词向量
    std::vector<float> GetWordVector(int word_index) const;
    void SetWordVector(int word_index, const std::vector<float>& vec);

    NormalizedEmbeddings Normalize() const;

    // 保存/加载模型
    void SaveVectors(const std::string& filename, bool binary = false, bool normalized = true) const;
    void LoadVectors(const std::string& filename, bool binary = false);

    int VocabSize() const { return vocab_size_; }
    int VectorSize() const { return config_.vector_size; }
    const std::vector<float>& Table() const { return syn0_; }

private:
    const Vocabulary& vocab_;
    Config config_;
    int vocab_size_;

    std::vector<float> syn0_;          // embedding 表 [vocab, vector_size]
    std::vector<float> accumulator_;   // AdaGrad 平方梯度累积

    std::mt19937_64 rng_;

    void InitNet();
    void ValidateBatch(const Batch& batch) const;
    void CheckIndex(int word_index) const;
};

} // namespace wordembed
