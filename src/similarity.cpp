#include "similarity.hpp"
#include <algorithm>
#include <cmath>
#include <queue>
#include <stdexcept>
#include <string>

namespace wordembed {

std::vector<Neighbor> NearestNeighbors(const NormalizedEmbeddings& embeddings,
                                       const std::vector<float>& query, int top_k,
                                       const std::vector<int>& exclude) {
    if (query.size() != static_cast<size_t>(embeddings.vector_size)) {
        throw std::invalid_argument("Query has " + std::to_string(query.size()) +
                                    " dimensions, embeddings have " +
                                    std::to_string(embeddings.vector_size));
    }

    std::vector<Neighbor> results;
    if (top_k <= 0) return results;

    double norm = 0.0;
    for (float v : query) {
        norm += static_cast<double>(v) * v;
    }
    norm = std::sqrt(norm);
    if (norm == 0.0 || !std::isfinite(norm)) {
        throw std::invalid_argument("Query vector has zero norm");
    }

    // 小根堆，保留 top_k
    auto cmp = [](const Neighbor& a, const Neighbor& b) {
        return a.second > b.second;
    };
    std::priority_queue<Neighbor, std::vector<Neighbor>, decltype(cmp)> top_words(cmp);

    // 退化行和排除的词只标记一次
    std::vector<bool> skip(embeddings.vocab_size, false);
    for (int v : embeddings.degenerate_rows) {
        if (v >= 0 && v < embeddings.vocab_size) skip[v] = true;
    }
    for (int v : exclude) {
        if (v >= 0 && v < embeddings.vocab_size) skip[v] = true;
    }

    for (int v = 0; v < embeddings.vocab_size; ++v) {
        if (skip[v]) continue;

        const float* row = embeddings.Row(v);
        double dot = 0.0;
        for (int c = 0; c < embeddings.vector_size; ++c) {
            dot += static_cast<double>(row[c]) * query[c];
        }

        top_words.push({v, static_cast<float>(dot / norm)});
        if (top_words.size() > static_cast<size_t>(top_k)) {
            top_words.pop();
        }
    }

    // 从小根堆中取出，需要反转
    while (!top_words.empty()) {
        results.push_back(top_words.top());
        top_words.pop();
    }
    std::reverse(results.begin(), results.end());
    return results;
}

std::vector<Neighbor> NearestNeighbors(const NormalizedEmbeddings& embeddings,
                                       int word_index, int top_k) {
    if (word_index < 0 || word_index >= embeddings.vocab_size) {
        throw std::out_of_range("Word index " + std::to_string(word_index) +
                                " outside vocabulary of size " +
                                std::to_string(embeddings.vocab_size));
    }
    if (embeddings.IsDegenerate(word_index)) {
        return {};
    }

    const float* row = embeddings.Row(word_index);
    std::vector<float> query(row, row + embeddings.vector_size);
    return NearestNeighbors(embeddings, query, top_k, {word_index});
}

} // namespace wordembed
