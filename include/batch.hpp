#pragma once

#include <cstddef>
#include <deque>
#include <random>
#include <vector>

namespace wordembed {

// 一个训练批次：inputs 按行存储，每个样本占 context_width 个索引
struct Batch {
    int context_width = 1;
    std::vector<int> inputs;
    std::vector<int> labels;

    size_t Size() const { return labels.size(); }
    const int* Input(size_t i) const { return inputs.data() + i * context_width; }
};

// 批次 + 下一次调用应当继续的游标
struct BatchResult {
    Batch batch;
    size_t cursor;
};

// 环形读取词序列的滑动窗口，容量固定为 span
// 游标 = 窗口最左侧元素在序列中的位置
class SlidingWindow {
public:
    SlidingWindow(const std::vector<int>& data, int span, size_t cursor);

    // 右移一个词：追加下一个词并淘汰最旧的词
    void Advance();

    int operator[](int slot) const { return buffer_[slot]; }
    int Span() const { return span_; }
    size_t Cursor() const { return cursor_; }

private:
    const std::vector<int>& data_;
    int span_;
    size_t cursor_;
    std::deque<int> buffer_;
};

// CBOW：用上下文窗口预测中心词
class CbowBatchGenerator {
public:
    struct Config {
        int batch_size = 128;
        int bag_window = 1;      // 单侧窗口大小

        Config() = default;
    };

    explicit CbowBatchGenerator(const Config& config);

    BatchResult Generate(const std::vector<int>& data, size_t cursor) const;

    int Span() const { return 2 * config_.bag_window + 1; }
    const Config& GetConfig() const { return config_; }

private:
    Config config_;
};

// Skip-gram：用中心词预测随机抽取的上下文词
class SkipGramBatchGenerator {
public:
    struct Config {
        int batch_size = 128;
        int skip_window = 1;     // 单侧窗口大小
        int num_skips = 2;       // 每个中心词生成的样本数

        Config() = default;
    };

    explicit SkipGramBatchGenerator(const Config& config);

    BatchResult Generate(const std::vector<int>& data, size_t cursor,
                         std::mt19937_64& rng) const;

    int Span() const { return 2 * config_.skip_window + 1; }
    const Config& GetConfig() const { return config_; }

private:
    Config config_;
};

} // namespace wordembed
