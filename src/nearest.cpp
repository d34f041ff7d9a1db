#include <iostream>
#include <string>
#include <vector>
#include <sstream>
#include <cstdio>
#include "model.hpp"
#include "similarity.hpp"

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cout << "Usage: nearest <vector_file> [top_k] [binary 0|1]\n";
        return 1;
    }

    std::string vector_file = argv[1];
    int top_k = 40;
    bool binary = false;

    try {
        if (argc > 2) top_k = std::stoi(argv[2]);
        if (argc > 3) binary = (std::stoi(argv[3]) != 0);
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid argument (" << e.what() << ")\n";
        return 1;
    }

    std::cout << "Loading vectors from " << vector_file << "...\n";

    std::vector<std::string> words;
    wordembed::NormalizedEmbeddings embeddings;
    try {
        wordembed::VectorFile vectors = wordembed::ReadVectorFile(vector_file, binary);
        words = std::move(vectors.words);
        embeddings = wordembed::NormalizeRows(vectors.data, static_cast<int>(words.size()),
                                              vectors.vector_size);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "Vocabulary size: " << embeddings.vocab_size
              << ", Vector size: " << embeddings.vector_size << "\n";
    std::cout << "Vectors loaded successfully!\n\n";
    std::cout << "Enter word or sentence (EXIT to break): ";

    std::string input;
    while (std::getline(std::cin, input)) {
        if (input == "EXIT") break;
        if (input.empty()) {
            std::cout << "\nEnter word or sentence (EXIT to break): ";
            continue;
        }

        std::istringstream iss(input);
        std::string word;

        // 多个词则向量求和（归一化后的行，方向与平均一致）
        std::vector<float> query(embeddings.vector_size, 0.0f);
        std::vector<int> found;

        while (iss >> word) {
            int index = -1;
            for (size_t i = 0; i < words.size(); ++i) {
                if (words[i] == word) {
                    index = static_cast<int>(i);
                    break;
                }
            }
            if (index < 0 || embeddings.IsDegenerate(index)) {
                std::cout << "Word \"" << word << "\" not found in vocabulary\n";
                continue;
            }

            const float* row = embeddings.Row(index);
            for (int c = 0; c < embeddings.vector_size; ++c) {
                query[c] += row[c];
            }
            found.push_back(index);
        }

        // 没有可用的词时不做查询
        if (found.empty()) {
            std::cout << "\nEnter word or sentence (EXIT to break): ";
            continue;
        }

        std::vector<wordembed::Neighbor> results;
        try {
            results = wordembed::NearestNeighbors(embeddings, query, top_k, found);
        } catch (const std::invalid_argument& e) {
            // 各词向量相加后为零向量
            std::cout << "Cannot search: " << e.what() << "\n";
            std::cout << "\nEnter word or sentence (EXIT to break): ";
            continue;
        }

        std::cout << "\n                                              Word       Cosine distance\n";
        std::cout << "------------------------------------------------------------------------\n";
        for (const auto& r : results) {
            printf("%50s\t\t%f\n", words[r.first].c_str(), r.second);
        }

        std::cout << "\nEnter word or sentence (EXIT to break): ";
    }

    return 0;
}
