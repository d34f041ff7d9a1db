#include "trainer.hpp"
#include "similarity.hpp"
#include "vocabulary.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <iostream>
#include <numeric>
#include <stdexcept>

namespace wordembed {

Trainer::Trainer(const Vocabulary& vocab, const Config& config)
    : vocab_(vocab), config_(config), rng_(config.seed) {
    if (config_.steps < 0) {
        throw std::invalid_argument("steps must not be negative");
    }

    // 先校验采样配置，任何采样开始前失败
    if (config_.use_cbow) {
        CbowBatchGenerator::Config cbow_config;
        cbow_config.batch_size = config_.batch_size;
        cbow_config.bag_window = config_.window;
        cbow_ = std::make_unique<CbowBatchGenerator>(cbow_config);
    } else {
        SkipGramBatchGenerator::Config skip_config;
        skip_config.batch_size = config_.batch_size;
        skip_config.skip_window = config_.window;
        skip_config.num_skips = config_.num_skips;
        skip_gram_ = std::make_unique<SkipGramBatchGenerator>(skip_config);
    }

    model_ = std::make_unique<EmbeddingModel>(vocab_, config_.model_config);
    InitValidExamples();
}

void Trainer::InitValidExamples() {
    // 从前 valid_window 个高频词中不放回地抽取 valid_size 个验证词
    int window = std::min(config_.valid_window, static_cast<int>(vocab_.Size()));
    if (window <= 0 || config_.valid_size <= 0) return;

    std::vector<int> candidates(window);
    std::iota(candidates.begin(), candidates.end(), 0);
    std::shuffle(candidates.begin(), candidates.end(), rng_);

    candidates.resize(std::min(window, config_.valid_size));
    valid_examples_ = std::move(candidates);
}

Batch Trainer::NextBatch(const std::vector<int>& data) {
    BatchResult result = config_.use_cbow
        ? cbow_->Generate(data, cursor_)
        : skip_gram_->Generate(data, cursor_, rng_);
    cursor_ = result.cursor;
    return std::move(result.batch);
}

TrainingSummary Trainer::Train(const std::vector<int>& data) {
    if (data.empty()) {
        throw std::invalid_argument("Cannot train on an empty token stream");
    }

    auto start_time = std::chrono::steady_clock::now();

    std::cout << "Starting training...\n";
    std::cout << "Vocabulary size: " << vocab_.Size() << "\n";
    std::cout << "Tokens: " << data.size() << "\n";
    std::cout << "Mode: " << (config_.use_cbow ? "CBOW" : "Skip-gram")
              << ", window " << config_.window << ", batch " << config_.batch_size << "\n";

    TrainingSummary summary;
    double average_loss = 0.0;
    long long interval_steps = 0;

    for (long long step = 0; step < config_.steps; ++step) {
        Batch batch = NextBatch(data);
        float loss = model_->TrainBatch(batch);

        summary.last_loss = loss;
        average_loss += loss;
        interval_steps++;

        if (config_.report_interval > 0 && step % config_.report_interval == 0) {
            // 第 0 步只统计了一个批次
            average_loss /= interval_steps;
            summary.average_loss = static_cast<float>(average_loss);
            printf("Average loss at step %lld: %f\n", step, average_loss);
            fflush(stdout);
            average_loss = 0.0;
            interval_steps = 0;
        }

        if (config_.neighbor_interval > 0 && step % config_.neighbor_interval == 0) {
            ReportNeighbors();
        }

        summary.steps = step + 1;
    }

    if (interval_steps > 0) {
        summary.average_loss = static_cast<float>(average_loss / interval_steps);
    }
    summary.cursor = cursor_;

    auto end_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::seconds>(end_time - start_time);

    std::cout << "Training completed in " << duration.count() << " seconds\n";

    if (!config_.output_file.empty()) {
        SaveVectors();
        std::cout << "Vectors saved to " << config_.output_file << "\n";
    }

    return summary;
}

void Trainer::ReportNeighbors() const {
    if (valid_examples_.empty()) return;

    NormalizedEmbeddings embeddings = model_->Normalize();
    for (int index : valid_examples_) {
        std::cout << "Nearest to " << vocab_.GetWord(index).word << ":";
        for (const auto& neighbor : NearestNeighbors(embeddings, index, config_.top_k)) {
            std::cout << " " << vocab_.GetWord(neighbor.first).word << ",";
        }
        std::cout << "\n";
    }
}

void Trainer::SaveVectors() const {
    if (config_.output_file.empty()) {
        throw std::runtime_error("No output file configured");
    }
    model_->SaveVectors(config_.output_file, config_.binary, true);
}

} // namespace wordembed
