#pragma once

#include <string>
#include <vector>
#include <unordered_map>

namespace wordembed {

struct VocabWord {
    std::string word;
    long long count;

    VocabWord(const std::string& w = "", long long c = 0)
        : word(w), count(c) {}
};

class Vocabulary {
public:
    static constexpr int kUnknownIndex = 0;
    static const char* const kUnknownWord;

    Vocabulary() = default;

    // 从词序列构建词汇表：保留频率最高的 vocab_size-1 个词，其余归入 UNK
    void Build(const std::vector<std::string>& tokens, int vocab_size);

    // 从训练文件学习词汇表，返回读到的全部词（供后续编码）
    std::vector<std::string> LearnFromFile(const std::string& filename, int vocab_size);

    // 词序列 -> 索引序列（未登录词映射为 kUnknownIndex）
    std::vector<int> Encode(const std::vector<std::string>& tokens) const;

    // 保存/加载词汇表
    void Save(const std::string& filename) const;
    void Load(const std::string& filename);

    // 查询
    int GetWordIndex(const std::string& word) const;
    bool Contains(const std::string& word) const;
    const VocabWord& GetWord(int index) const { return vocab_.at(index); }
    size_t Size() const { return vocab_.size(); }
    long long TotalWords() const { return train_words_; }
    long long UnknownCount() const { return vocab_.empty() ? 0 : vocab_[kUnknownIndex].count; }

private:
    std::vector<VocabWord> vocab_;
    std::unordered_map<std::string, int> word_to_index_;
    long long train_words_ = 0;

    void SortAndTruncate(int vocab_size);
};

} // namespace wordembed
