#include "model.hpp"
#include "batch.hpp"
#include "vocabulary.hpp"
#include <cmath>
#include <algorithm>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace wordembed {

namespace {

// 对一行得分做 softmax，probs 输出概率，返回 -log p(label)
double SoftmaxCrossEntropy(const float* scores, int size, int label, std::vector<double>& probs) {
    float max_score = *std::max_element(scores, scores + size);

    double sum = 0.0;
    for (int v = 0; v < size; ++v) {
        probs[v] = std::exp(static_cast<double>(scores[v]) - max_score);
        sum += probs[v];
    }
    for (int v = 0; v < size; ++v) {
        probs[v] /= sum;
    }

    // log-sum-exp - score[label]
    return std::log(sum) + max_score - scores[label];
}

} // namespace

bool NormalizedEmbeddings::IsDegenerate(int index) const {
    return std::find(degenerate_rows.begin(), degenerate_rows.end(), index) != degenerate_rows.end();
}

NormalizedEmbeddings NormalizeRows(const std::vector<float>& table, int rows, int cols) {
    if (rows < 0 || cols <= 0 || table.size() != static_cast<size_t>(rows) * cols) {
        throw std::invalid_argument("Embedding table shape does not match its data");
    }

    NormalizedEmbeddings result;
    result.vocab_size = rows;
    result.vector_size = cols;
    result.data.assign(table.size(), 0.0f);

    for (int i = 0; i < rows; ++i) {
        size_t offset = static_cast<size_t>(i) * cols;

        double norm = 0.0;
        for (int c = 0; c < cols; ++c) {
            norm += static_cast<double>(table[offset + c]) * table[offset + c];
        }
        norm = std::sqrt(norm);

        // 零范数（或非有限值）行保持零向量，不产生 NaN
        if (norm == 0.0 || !std::isfinite(norm)) {
            result.degenerate_rows.push_back(i);
            continue;
        }

        for (int c = 0; c < cols; ++c) {
            result.data[offset + c] = static_cast<float>(table[offset + c] / norm);
        }
    }

    if (!result.degenerate_rows.empty()) {
        std::cerr << "Warning: " << result.degenerate_rows.size()
                  << " embedding row(s) have zero norm and were left as zero vectors"
                  << " (first index " << result.degenerate_rows.front() << ")\n";
    }

    return result;
}

VectorFile ReadVectorFile(const std::string& filename, bool binary) {
    std::ifstream file(filename, binary ? std::ios::binary : std::ios::in);
    if (!file) {
        throw std::runtime_error("Cannot open vector file: " + filename);
    }

    // 读取头部信息：词汇量和向量维度
    long long vocab_size = 0;
    long long vector_size = 0;
    if (!(file >> vocab_size >> vector_size) || vocab_size <= 0 || vector_size <= 0) {
        throw std::runtime_error("Malformed vector file header: " + filename);
    }

    VectorFile result;
    result.vector_size = static_cast<int>(vector_size);
    result.words.resize(vocab_size);
    result.data.resize(vocab_size * vector_size);

    for (long long i = 0; i < vocab_size; ++i) {
        float* row = result.data.data() + i * vector_size;

        if (!(file >> result.words[i])) {
            throw std::runtime_error("Vector file ended after " + std::to_string(i) +
                                     " of " + std::to_string(vocab_size) + " words");
        }

        if (binary) {
            // 词后紧跟一个空格，然后是 vector_size 个 float
            file.get();
            file.read(reinterpret_cast<char*>(row), vector_size * sizeof(float));
        } else {
            for (long long j = 0; j < vector_size; ++j) {
                file >> row[j];
            }
        }

        if (!file) {
            throw std::runtime_error("Truncated vector for word \"" + result.words[i] +
                                     "\" in " + filename);
        }
    }

    return result;
}

EmbeddingModel::EmbeddingModel(const Vocabulary& vocab, const Config& config)
    : vocab_(vocab), config_(config), vocab_size_(static_cast<int>(vocab.Size())),
      rng_(config.seed) {
    if (vocab_size_ == 0) {
        throw std::invalid_argument("Cannot create an embedding model for an empty vocabulary");
    }
    if (config_.vector_size <= 0) {
        throw std::invalid_argument("vector_size must be positive, got " +
                                    std::to_string(config_.vector_size));
    }
    if (!(config_.init_range > 0.0f) || !(config_.learning_rate > 0.0f) ||
        !(config_.initial_accumulator > 0.0f)) {
        throw std::invalid_argument("init_range, learning_rate and initial_accumulator must be positive");
    }
    InitNet();
}

void EmbeddingModel::InitNet() {
    size_t layer_size = config_.vector_size;

    // 初始化 syn0，分量均匀分布在 [-init_range, init_range]
    syn0_.resize(vocab_size_ * layer_size);
    std::uniform_real_distribution<float> dist(-config_.init_range, config_.init_range);
    for (auto& val : syn0_) {
        val = dist(rng_);
    }

    accumulator_.assign(syn0_.size(), config_.initial_accumulator);
}

void EmbeddingModel::CheckIndex(int word_index) const {
    if (word_index < 0 || word_index >= vocab_size_) {
        throw std::out_of_range("Word index " + std::to_string(word_index) +
                                " outside vocabulary of size " + std::to_string(vocab_size_));
    }
}

void EmbeddingModel::ValidateBatch(const Batch& batch) const {
    if (batch.Size() == 0) {
        throw std::invalid_argument("Empty batch");
    }
    if (batch.context_width <= 0 ||
        batch.inputs.size() != batch.Size() * static_cast<size_t>(batch.context_width)) {
        throw std::invalid_argument("Batch inputs do not match labels * context_width");
    }
    for (int index : batch.inputs) CheckIndex(index);
    for (int index : batch.labels) CheckIndex(index);
}

std::vector<float> EmbeddingModel::Aggregate(const Batch& batch, size_t i) const {
    int layer_size = config_.vector_size;
    std::vector<float> neu1(layer_size, 0.0f);

    if (i >= batch.Size() || batch.inputs.size() < (i + 1) * batch.context_width) {
        throw std::out_of_range("Sample " + std::to_string(i) + " outside batch of size " +
                                std::to_string(batch.Size()));
    }

    // 上下文向量直接求和，不取平均
    const int* context = batch.Input(i);
    for (int a = 0; a < batch.context_width; ++a) {
        CheckIndex(context[a]);
        size_t offset = static_cast<size_t>(context[a]) * layer_size;
        for (int c = 0; c < layer_size; ++c) {
            neu1[c] += syn0_[offset + c];
        }
    }
    return neu1;
}

std::vector<float> EmbeddingModel::Scores(const Batch& batch) const {
    ValidateBatch(batch);

    int layer_size = config_.vector_size;
    std::vector<float> scores(batch.Size() * vocab_size_);

    for (size_t i = 0; i < batch.Size(); ++i) {
        std::vector<float> neu1 = Aggregate(batch, i);
        float* row = scores.data() + i * vocab_size_;

        // 与整个词向量表做内积
        for (int v = 0; v < vocab_size_; ++v) {
            size_t offset = static_cast<size_t>(v) * layer_size;
            float f = 0.0f;
            for (int c = 0; c < layer_size; ++c) {
                f += neu1[c] * syn0_[offset + c];
            }
            row[v] = f;
        }
    }
    return scores;
}

float EmbeddingModel::Loss(const Batch& batch) const {
    std::vector<float> scores = Scores(batch);
    std::vector<double> probs(vocab_size_);

    double total = 0.0;
    for (size_t i = 0; i < batch.Size(); ++i) {
        total += SoftmaxCrossEntropy(scores.data() + i * vocab_size_, vocab_size_,
                                     batch.labels[i], probs);
    }
    return static_cast<float>(total / batch.Size());
}

float EmbeddingModel::ComputeGradient(const Batch& batch, std::vector<float>& grad) const {
    std::vector<float> scores = Scores(batch);

    int layer_size = config_.vector_size;
    double scale = 1.0 / batch.Size();

    grad.assign(syn0_.size(), 0.0f);
    std::vector<double> probs(vocab_size_);
    std::vector<double> neu1e(layer_size);

    double total = 0.0;
    for (size_t i = 0; i < batch.Size(); ++i) {
        std::vector<float> neu1 = Aggregate(batch, i);
        total += SoftmaxCrossEntropy(scores.data() + i * vocab_size_, vocab_size_,
                                     batch.labels[i], probs);

        // d loss / d score = softmax - onehot(label)
        probs[batch.labels[i]] -= 1.0;

        std::fill(neu1e.begin(), neu1e.end(), 0.0);
        for (int v = 0; v < vocab_size_; ++v) {
            double g = probs[v] * scale;
            size_t offset = static_cast<size_t>(v) * layer_size;
            for (int c = 0; c < layer_size; ++c) {
                // 输出侧：score_v = row_v . neu1
                grad[offset + c] += static_cast<float>(g * neu1[c]);
                neu1e[c] += g * syn0_[offset + c];
            }
        }

        // 输入侧：误差回传到每个上下文词（重复出现的词累加多次）
        const int* context = batch.Input(i);
        for (int a = 0; a < batch.context_width; ++a) {
            size_t offset = static_cast<size_t>(context[a]) * layer_size;
            for (int c = 0; c < layer_size; ++c) {
                grad[offset + c] += static_cast<float>(neu1e[c]);
            }
        }
    }

    return static_cast<float>(total * scale);
}

float EmbeddingModel::TrainBatch(const Batch& batch) {
    std::vector<float> grad;
    float loss = ComputeGradient(batch, grad);

    // AdaGrad: acc += g^2, w -= lr * g / sqrt(acc)
    for (size_t k = 0; k < syn0_.size(); ++k) {
        float g = grad[k];
        if (g == 0.0f) continue;
        accumulator_[k] += g * g;
        syn0_[k] -= config_.learning_rate * g / std::sqrt(accumulator_[k]);
    }

    return loss;
}

std::vector<float> EmbeddingModel::GetWordVector(int word_index) const {
    CheckIndex(word_index);
    size_t layer_size = config_.vector_size;
    size_t offset = word_index * layer_size;
    return std::vector<float>(syn0_.begin() + offset,
                              syn0_.begin() + offset + layer_size);
}

void EmbeddingModel::SetWordVector(int word_index, const std::vector<float>& vec) {
    CheckIndex(word_index);
    if (vec.size() != static_cast<size_t>(config_.vector_size)) {
        throw std::invalid_argument("Vector size mismatch: got " + std::to_string(vec.size()) +
                                    ", model has " + std::to_string(config_.vector_size));
    }
    std::copy(vec.begin(), vec.end(), syn0_.begin() + static_cast<size_t>(word_index) * config_.vector_size);
}

NormalizedEmbeddings EmbeddingModel::Normalize() const {
    return NormalizeRows(syn0_, vocab_size_, config_.vector_size);
}

void EmbeddingModel::SaveVectors(const std::string& filename, bool binary, bool normalized) const {
    std::ofstream file(filename, binary ? std::ios::binary : std::ios::out);
    if (!file) {
        throw std::runtime_error("Cannot open vector file for writing: " + filename);
    }

    NormalizedEmbeddings unit;
    if (normalized) {
        unit = Normalize();
    }
    const std::vector<float>& table = normalized ? unit.data : syn0_;

    // 文本格式也要能无损读回
    file.precision(std::numeric_limits<float>::max_digits10);
    file << vocab_size_ << " " << config_.vector_size << "\n";

    for (int i = 0; i < vocab_size_; ++i) {
        file << vocab_.GetWord(i).word << " ";
        const float* row = table.data() + static_cast<size_t>(i) * config_.vector_size;

        if (binary) {
            file.write(reinterpret_cast<const char*>(row),
                       config_.vector_size * sizeof(float));
        } else {
            for (int c = 0; c < config_.vector_size; ++c) {
                file << row[c] << " ";
            }
        }
        file << "\n";
    }

    file.flush();
    if (!file) {
        throw std::runtime_error("Failed writing vector file: " + filename);
    }
}

void EmbeddingModel::LoadVectors(const std::string& filename, bool binary) {
    VectorFile vectors = ReadVectorFile(filename, binary);

    if (vectors.vector_size != config_.vector_size) {
        throw std::runtime_error("Vector size mismatch: file has " +
                                 std::to_string(vectors.vector_size) + ", config has " +
                                 std::to_string(config_.vector_size));
    }
    if (vectors.words.size() != static_cast<size_t>(vocab_size_)) {
        throw std::runtime_error("Vocabulary size mismatch: file has " +
                                 std::to_string(vectors.words.size()) + ", model has " +
                                 std::to_string(vocab_size_));
    }
    for (int i = 0; i < vocab_size_; ++i) {
        if (vectors.words[i] != vocab_.GetWord(i).word) {
            throw std::runtime_error("Word at index " + std::to_string(i) + " is \"" +
                                     vectors.words[i] + "\", vocabulary has \"" +
                                     vocab_.GetWord(i).word + "\"");
        }
    }

    // 加载后的向量重新开始累积梯度
    syn0_ = std::move(vectors.data);
    accumulator_.assign(syn0_.size(), config_.initial_accumulator);
}

} // namespace wordembed
