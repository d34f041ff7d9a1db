#include "vocabulary.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace wordembed {

const char* const Vocabulary::kUnknownWord = "UNK";

void Vocabulary::Build(const std::vector<std::string>& tokens, int vocab_size) {
    if (tokens.empty()) {
        throw std::invalid_argument("Cannot build vocabulary from an empty token stream");
    }
    if (vocab_size <= 1) {
        throw std::invalid_argument("Vocabulary size must be at least 2, got " +
                                    std::to_string(vocab_size));
    }

    // 初始化
    vocab_.clear();
    word_to_index_.clear();
    train_words_ = 0;

    // 索引 0 保留给 UNK
    vocab_.emplace_back(kUnknownWord, 0);
    word_to_index_[kUnknownWord] = kUnknownIndex;

    // 统计词频，新词按首次出现的顺序追加
    for (const auto& word : tokens) {
        if (word.empty()) continue;

        train_words_++;

        auto it = word_to_index_.find(word);
        if (it == word_to_index_.end()) {
            word_to_index_[word] = vocab_.size();
            vocab_.emplace_back(word, 1);
        } else {
            // 语料中出现的字面 UNK 也计入未登录桶
            vocab_[it->second].count++;
        }
    }

    if (train_words_ == 0) {
        throw std::invalid_argument("Token stream contains only empty tokens");
    }

    SortAndTruncate(vocab_size);
}

void Vocabulary::SortAndTruncate(int vocab_size) {
    // 按词频降序排序（UNK 固定在第一位）
    // stable_sort 保证同频词保持首次出现的先后顺序
    std::stable_sort(vocab_.begin() + 1, vocab_.end(),
                     [](const VocabWord& a, const VocabWord& b) {
                         return a.count > b.count;
                     });

    // 超出 vocab_size 的词全部并入 UNK
    size_t keep = std::min(vocab_.size(), static_cast<size_t>(vocab_size));
    for (size_t i = keep; i < vocab_.size(); ++i) {
        vocab_[kUnknownIndex].count += vocab_[i].count;
    }
    vocab_.resize(keep);

    // 重建哈希表
    word_to_index_.clear();
    for (size_t i = 0; i < vocab_.size(); ++i) {
        word_to_index_[vocab_[i].word] = static_cast<int>(i);
    }
}

std::vector<std::string> Vocabulary::LearnFromFile(const std::string& filename, int vocab_size) {
    std::ifstream file(filename);
    if (!file) {
        throw std::runtime_error("Cannot open training file: " + filename);
    }

    std::cout << "Learning vocabulary from " << filename << "...\n";

    std::vector<std::string> tokens;
    std::string word;
    while (file >> word) {
        tokens.push_back(word);

        // 进度显示（每10万词）
        if (tokens.size() % 100000 == 0) {
            std::cout << tokens.size() / 1000 << "K\r" << std::flush;
        }
    }

    Build(tokens, vocab_size);

    std::cout << "\nVocabulary size: " << vocab_.size() << "\n";
    std::cout << "Words in train file: " << train_words_ << "\n";
    std::cout << "Unknown words: " << UnknownCount() << "\n";

    return tokens;
}

std::vector<int> Vocabulary::Encode(const std::vector<std::string>& tokens) const {
    std::vector<int> data;
    data.reserve(tokens.size());
    for (const auto& word : tokens) {
        if (word.empty()) continue;
        data.push_back(GetWordIndex(word));
    }
    return data;
}

int Vocabulary::GetWordIndex(const std::string& word) const {
    auto it = word_to_index_.find(word);
    return it != word_to_index_.end() ? it->second : kUnknownIndex;
}

bool Vocabulary::Contains(const std::string& word) const {
    return word != kUnknownWord && word_to_index_.count(word) > 0;
}

void Vocabulary::Save(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file) {
        throw std::runtime_error("Cannot open vocabulary file for writing: " + filename);
    }
    for (const auto& word : vocab_) {
        file << word.word << " " << word.count << "\n";
    }

    file.flush();
    if (!file) {
        throw std::runtime_error("Failed writing vocabulary file: " + filename);
    }
}

void Vocabulary::Load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file) {
        throw std::runtime_error("Cannot open vocabulary file: " + filename);
    }

    std::vector<VocabWord> vocab;
    std::unordered_map<std::string, int> word_to_index;
    long long total = 0;

    std::string line;
    while (std::getline(file, line)) {
        if (line.empty()) continue;

        std::istringstream iss(line);
        VocabWord entry;
        if (!(iss >> entry.word >> entry.count) || entry.count < 0) {
            throw std::runtime_error("Malformed vocabulary line " +
                                     std::to_string(vocab.size() + 1) + ": " + line);
        }
        if (vocab.empty() && entry.word != kUnknownWord) {
            throw std::runtime_error("Vocabulary file must start with " +
                                     std::string(kUnknownWord));
        }
        if (!word_to_index.emplace(entry.word, static_cast<int>(vocab.size())).second) {
            throw std::runtime_error("Duplicate word in vocabulary file: " + entry.word);
        }
        total += entry.count;
        vocab.push_back(std::move(entry));
    }

    if (vocab.size() < 2) {
        throw std::runtime_error("Vocabulary file has no words: " + filename);
    }

    vocab_ = std::move(vocab);
    word_to_index_ = std::move(word_to_index);
    train_words_ = total;
}

} // namespace wordembed
