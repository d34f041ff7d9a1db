#include "batch.hpp"
#include <algorithm>
#include <climits>
#include <stdexcept>
#include <string>

namespace wordembed {

namespace {

// 窗口跨度 2 * window + 1 必须能用 int 表示
constexpr int kMaxWindow = (INT_MAX - 1) / 2;

} // namespace

SlidingWindow::SlidingWindow(const std::vector<int>& data, int span, size_t cursor)
    : data_(data), span_(span), cursor_(0) {
    if (data_.empty()) {
        throw std::invalid_argument("Cannot slide a window over an empty token stream");
    }
    if (span_ <= 0) {
        throw std::invalid_argument("Window span must be positive, got " + std::to_string(span_));
    }

    // 游标越界时按环形语义取模
    cursor_ = cursor % data_.size();
    for (int i = 0; i < span_; ++i) {
        buffer_.push_back(data_[(cursor_ + i) % data_.size()]);
    }
}

void SlidingWindow::Advance() {
    buffer_.push_back(data_[(cursor_ + span_) % data_.size()]);
    buffer_.pop_front();
    cursor_ = (cursor_ + 1) % data_.size();
}

CbowBatchGenerator::CbowBatchGenerator(const Config& config)
    : config_(config) {
    if (config_.batch_size <= 0) {
        throw std::invalid_argument("batch_size must be positive, got " +
                                    std::to_string(config_.batch_size));
    }
    if (config_.bag_window <= 0) {
        throw std::invalid_argument("bag_window must be positive, got " +
                                    std::to_string(config_.bag_window));
    }
    if (config_.bag_window > kMaxWindow) {
        throw std::invalid_argument("bag_window too large: " +
                                    std::to_string(config_.bag_window));
    }
}

BatchResult CbowBatchGenerator::Generate(const std::vector<int>& data, size_t cursor) const {
    const int span = Span();
    SlidingWindow window(data, span, cursor);

    Batch batch;
    batch.context_width = span - 1;
    batch.inputs.reserve(static_cast<size_t>(config_.batch_size) * batch.context_width);
    batch.labels.reserve(config_.batch_size);

    for (int i = 0; i < config_.batch_size; ++i) {
        // 左右上下文按原顺序拼接，只去掉中间的目标词
        for (int slot = 0; slot < span; ++slot) {
            if (slot == config_.bag_window) continue;
            batch.inputs.push_back(window[slot]);
        }
        batch.labels.push_back(window[config_.bag_window]);

        window.Advance();
    }

    return BatchResult{std::move(batch), window.Cursor()};
}

SkipGramBatchGenerator::SkipGramBatchGenerator(const Config& config)
    : config_(config) {
    if (config_.batch_size <= 0 || config_.skip_window <= 0 || config_.num_skips <= 0) {
        throw std::invalid_argument("batch_size, skip_window and num_skips must be positive");
    }
    if (config_.skip_window > kMaxWindow) {
        throw std::invalid_argument("skip_window too large: " +
                                    std::to_string(config_.skip_window));
    }
    if (config_.batch_size % config_.num_skips != 0) {
        throw std::invalid_argument("batch_size (" + std::to_string(config_.batch_size) +
                                    ") must be a multiple of num_skips (" +
                                    std::to_string(config_.num_skips) + ")");
    }
    // 否则拒绝采样无法选出 num_skips 个不同的上下文位置
    if (config_.num_skips > 2 * config_.skip_window) {
        throw std::invalid_argument("num_skips (" + std::to_string(config_.num_skips) +
                                    ") must not exceed 2 * skip_window (" +
                                    std::to_string(2 * config_.skip_window) + ")");
    }
}

BatchResult SkipGramBatchGenerator::Generate(const std::vector<int>& data, size_t cursor,
                                             std::mt19937_64& rng) const {
    const int span = Span();
    SlidingWindow window(data, span, cursor);

    Batch batch;
    batch.context_width = 1;
    batch.inputs.reserve(config_.batch_size);
    batch.labels.reserve(config_.batch_size);

    std::uniform_int_distribution<int> slot_dist(0, span - 1);
    std::vector<bool> used(span);

    for (int i = 0; i < config_.batch_size / config_.num_skips; ++i) {
        const int center = window[config_.skip_window];

        std::fill(used.begin(), used.end(), false);
        used[config_.skip_window] = true;

        for (int j = 0; j < config_.num_skips; ++j) {
            // 拒绝采样：跳过中心词和本组已选过的位置
            int slot = slot_dist(rng);
            while (used[slot]) {
                slot = slot_dist(rng);
            }
            used[slot] = true;

            batch.inputs.push_back(center);
            batch.labels.push_back(window[slot]);
        }

        window.Advance();
    }

    return BatchResult{std::move(batch), window.Cursor()};
}

} // namespace wordembed
