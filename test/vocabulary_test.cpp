#include <gtest/gtest.h>
#include "vocabulary.hpp"
#include "test_corpus.hpp"
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <unistd.h>

using namespace wordembed;

// 测试 Vocabulary 基本功能
class VocabularyTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_path_ = TestTempPath("test_vocab_saved");
    }

    void TearDown() override {
        std::remove(saved_path_.c_str());
    }

    long long SumOfCounts(const Vocabulary& vocab) const {
        long long total = 0;
        for (size_t i = 0; i < vocab.Size(); ++i) {
            total += vocab.GetWord(i).count;
        }
        return total;
    }

    std::string saved_path_;
};

TEST_F(VocabularyTest, BasicConstruction) {
    Vocabulary vocab;
    EXPECT_EQ(vocab.Size(), 0u);
    EXPECT_EQ(vocab.TotalWords(), 0);
    EXPECT_EQ(vocab.UnknownCount(), 0);
}

TEST_F(VocabularyTest, RanksByFrequency) {
    Vocabulary vocab;
    vocab.Build({"b", "a", "c", "a", "b", "a", "d"}, 3);

    ASSERT_EQ(vocab.Size(), 3u);
    EXPECT_EQ(vocab.GetWord(0).word, Vocabulary::kUnknownWord);
    EXPECT_EQ(vocab.GetWordIndex("a"), 1);
    EXPECT_EQ(vocab.GetWordIndex("b"), 2);

    // c, d 超出词汇表，归入 UNK
    EXPECT_EQ(vocab.GetWordIndex("c"), Vocabulary::kUnknownIndex);
    EXPECT_EQ(vocab.GetWordIndex("d"), Vocabulary::kUnknownIndex);
    EXPECT_FALSE(vocab.Contains("c"));
    EXPECT_EQ(vocab.UnknownCount(), 2);
    EXPECT_EQ(vocab.TotalWords(), 7);
}

TEST_F(VocabularyTest, TiesKeepFirstEncounterOrder) {
    Vocabulary vocab;
    vocab.Build({"x", "y", "z", "y", "x", "z"}, 10);

    // 词数少于 vocab_size-1 时词汇表更小
    ASSERT_EQ(vocab.Size(), 4u);
    EXPECT_EQ(vocab.GetWordIndex("x"), 1);
    EXPECT_EQ(vocab.GetWordIndex("y"), 2);
    EXPECT_EQ(vocab.GetWordIndex("z"), 3);
    EXPECT_EQ(vocab.UnknownCount(), 0);
}

TEST_F(VocabularyTest, LiteralUnknownTokenCountsAsUnknown) {
    Vocabulary vocab;
    vocab.Build({"UNK", "a", "UNK", "b"}, 5);

    EXPECT_EQ(vocab.Size(), 3u);
    EXPECT_EQ(vocab.UnknownCount(), 2);
    EXPECT_FALSE(vocab.Contains("UNK"));
    EXPECT_EQ(vocab.GetWordIndex("UNK"), Vocabulary::kUnknownIndex);
    EXPECT_EQ(SumOfCounts(vocab), vocab.TotalWords());
}

TEST_F(VocabularyTest, CountsAddUpAndIndicesInRange) {
    std::vector<std::string> tokens = {
        "to", "be", "or", "not", "to", "be", "that", "is", "the", "question",
        "whether", "tis", "nobler", "in", "the", "mind", "to", "suffer"
    };

    Vocabulary vocab;
    vocab.Build(tokens, 6);

    EXPECT_EQ(vocab.Size(), 6u);
    EXPECT_EQ(vocab.TotalWords(), static_cast<long long>(tokens.size()));
    EXPECT_EQ(SumOfCounts(vocab), vocab.TotalWords());

    std::vector<int> data = vocab.Encode(tokens);
    ASSERT_EQ(data.size(), tokens.size());
    for (int index : data) {
        EXPECT_GE(index, 0);
        EXPECT_LT(index, static_cast<int>(vocab.Size()));
    }
    EXPECT_EQ(data[0], vocab.GetWordIndex("to"));
    EXPECT_EQ(vocab.GetWordIndex("to"), 1);
}

TEST_F(VocabularyTest, DegenerateInputThrows) {
    Vocabulary vocab;
    EXPECT_THROW(vocab.Build({}, 10), std::invalid_argument);
    EXPECT_THROW(vocab.Build({"a", "b"}, 1), std::invalid_argument);
    EXPECT_THROW(vocab.Build({"a", "b"}, 0), std::invalid_argument);
    EXPECT_THROW(vocab.Build({"", ""}, 5), std::invalid_argument);
}

TEST_F(VocabularyTest, LearnFromFile) {
    Vocabulary vocab;
    std::vector<std::string> tokens = vocab.LearnFromFile(TestCorpusPath(), 5);

    EXPECT_EQ(tokens.size(), 322u);
    EXPECT_EQ(vocab.TotalWords(), 322);
    ASSERT_EQ(vocab.Size(), 5u);

    EXPECT_EQ(vocab.GetWordIndex("the"), 1);
    EXPECT_EQ(vocab.GetWord(1).count, 80);
    // fox 与 dog 同频，fox 先出现
    EXPECT_EQ(vocab.GetWordIndex("fox"), 2);
    EXPECT_EQ(vocab.GetWordIndex("dog"), 3);
    EXPECT_EQ(vocab.GetWordIndex("quick"), 4);
    EXPECT_EQ(vocab.GetWordIndex("aardvark"), Vocabulary::kUnknownIndex);
    EXPECT_EQ(vocab.UnknownCount(), 142);
}

TEST_F(VocabularyTest, LearnFromMissingFileThrows) {
    Vocabulary vocab;
    EXPECT_THROW(vocab.LearnFromFile("no_such_corpus.txt", 5), std::runtime_error);
}

TEST_F(VocabularyTest, SaveAndLoad) {
    Vocabulary vocab1;
    vocab1.LearnFromFile(TestCorpusPath(), 8);
    vocab1.Save(saved_path_);

    Vocabulary vocab2;
    vocab2.Load(saved_path_);

    ASSERT_EQ(vocab1.Size(), vocab2.Size());
    EXPECT_EQ(vocab1.TotalWords(), vocab2.TotalWords());
    EXPECT_EQ(vocab1.UnknownCount(), vocab2.UnknownCount());
    for (size_t i = 0; i < vocab1.Size(); ++i) {
        EXPECT_EQ(vocab1.GetWord(i).word, vocab2.GetWord(i).word);
        EXPECT_EQ(vocab1.GetWord(i).count, vocab2.GetWord(i).count);
        EXPECT_EQ(vocab2.GetWordIndex(vocab1.GetWord(i).word), static_cast<int>(i));
    }
}

TEST_F(VocabularyTest, SaveToFullDeviceThrows) {
    if (access("/dev/full", W_OK) != 0) {
        GTEST_SKIP() << "/dev/full not available";
    }
    Vocabulary vocab;
    vocab.Build({"a", "b", "a"}, 5);
    EXPECT_THROW(vocab.Save("/dev/full"), std::runtime_error);
}

TEST_F(VocabularyTest, LoadRejectsMalformedFiles) {
    Vocabulary vocab;

    {
        std::ofstream file(saved_path_);
        file << "the 10\nUNK 3\n";
    }
    EXPECT_THROW(vocab.Load(saved_path_), std::runtime_error);

    {
        std::ofstream file(saved_path_);
        file << "UNK 3\nthe 10\nthe 4\n";
    }
    EXPECT_THROW(vocab.Load(saved_path_), std::runtime_error);

    {
        std::ofstream file(saved_path_);
        file << "UNK 3\nthe ten\n";
    }
    EXPECT_THROW(vocab.Load(saved_path_), std::runtime_error);

    EXPECT_THROW(vocab.Load("no_such_vocab.txt"), std::runtime_error);
}
