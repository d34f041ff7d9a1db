#pragma once

#include <utility>
#include <vector>
#include "model.hpp"

namespace wordembed {

// (词索引, 余弦相似度)，按相似度降序
using Neighbor = std::pair<int, float>;

// 与 query 最相似的 top_k 个词，跳过 exclude 中的词和零范数行
// query 不要求是单位向量
std::vector<Neighbor> NearestNeighbors(const NormalizedEmbeddings& embeddings,
                                       const std::vector<float>& query, int top_k,
                                       const std::vector<int>& exclude = {});

// 与第 word_index 个词最相似的 top_k 个词（不含自身）
std::vector<Neighbor> NearestNeighbors(const NormalizedEmbeddings& embeddings,
                                       int word_index, int top_k);

} // namespace wordembed
