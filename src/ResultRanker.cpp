// Deterministic ordering of candidate pairs.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "ResultRanker.hpp"
#include "UnitTest.hpp"
#include <algorithm>
#include <tuple>

SortMode parseSortMode(const std::string& name)
{
    if (name == "similarity")
    {
        return SortMode::Similarity;
    }
    if (name == "size")
    {
        return SortMode::Size;
    }
    if (name == "name")
    {
        return SortMode::Name;
    }
    throw ConfigurationError("Unknown sort mode '" + name + "' (expected similarity, size or name).");
}

std::string getSortModeName(SortMode mode)
{
    switch (mode)
    {
        case SortMode::Similarity: return "similarity";
        case SortMode::Size: return "size";
        case SortMode::Name: return "name";
    }
    return "similarity";
}

bool rankBefore(const CandidatePair& a, const CandidatePair& b, SortMode mode)
{
    // Descending keys are negated by swapping a and b in the tuple.
    uint64_t sizeA = a.totalSize();
    uint64_t sizeB = b.totalSize();
    switch (mode)
    {
        case SortMode::Size:
            return std::tie(sizeB, b.similarity, a.folderA.path, a.folderB.path)
                 < std::tie(sizeA, a.similarity, b.folderA.path, b.folderB.path);
        case SortMode::Name:
            return std::tie(a.folderA.path, a.folderB.path, b.similarity, sizeB)
                 < std::tie(b.folderA.path, b.folderB.path, a.similarity, sizeA);
        case SortMode::Similarity:
            break;
    }
    return std::tie(b.similarity, sizeB, a.folderA.path, a.folderB.path)
         < std::tie(a.similarity, sizeA, b.folderA.path, b.folderB.path);
}

void rankCandidates(std::vector<CandidatePair>& pairs, SortMode mode)
{
    std::stable_sort(pairs.begin(), pairs.end(), [mode](const CandidatePair& a, const CandidatePair& b)
    {
        return rankBefore(a, b, mode);
    });
}

/// Build a pair without touching the filesystem.
static CandidatePair makePair(const std::string& pathA, uint64_t sizeA, const std::string& pathB, uint64_t sizeB, double similarity)
{
    return CandidatePair{FolderRecord{pathA, sizeA, 1}, FolderRecord{pathB, sizeB, 1}, similarity};
}

static std::vector<CandidatePair> makeRankTestPairs()
{
    return {
        makePair("/r/c", 10, "/r/d", 10, 0.5),
        makePair("/r/a", 100, "/r/b", 100, 0.5),
        makePair("/r/a", 5, "/r/c", 5, 1.0),
        makePair("/r/b", 50, "/r/c", 50, 0.5),
        makePair("/r/a", 100, "/r/d", 100, 0.5),
        makePair("/r/e", 1000, "/r/f", 1000, 0.75)};
}

UNIT_TEST(ResultRankerSimilarity)
{
    std::vector<CandidatePair> pairs = makeRankTestPairs();
    rankCandidates(pairs, SortMode::Similarity);
    ASSERT_EQ(pairs[0].folderB.path, "/r/c");
    ASSERT_EQ(pairs[1].folderA.path, "/r/e");
    // Equal similarity and size: ordered by path.
    ASSERT_EQ(pairs[2].folderB.path, "/r/b");
    ASSERT_EQ(pairs[3].folderB.path, "/r/d");
    ASSERT_EQ(pairs[4].folderA.path, "/r/b");
    ASSERT_EQ(pairs[5].folderA.path, "/r/c");
}

UNIT_TEST(ResultRankerSize)
{
    std::vector<CandidatePair> pairs = makeRankTestPairs();
    rankCandidates(pairs, SortMode::Size);
    ASSERT_EQ(pairs[0].folderA.path, "/r/e");
    ASSERT_EQ(pairs[1].folderB.path, "/r/b");
    ASSERT_EQ(pairs[2].folderB.path, "/r/d");
    ASSERT_EQ(pairs[3].folderA.path, "/r/b");
    ASSERT_EQ(pairs[4].folderA.path, "/r/c");
    ASSERT_EQ(pairs[5].totalSize(), uint64_t(10));
}

UNIT_TEST(ResultRankerName)
{
    std::vector<CandidatePair> pairs = makeRankTestPairs();
    rankCandidates(pairs, SortMode::Name);
    ASSERT_EQ(pairs[0].folderB.path, "/r/b");
    ASSERT_EQ(pairs[1].folderB.path, "/r/c");
    ASSERT_EQ(pairs[2].folderB.path, "/r/d");
    ASSERT_EQ(pairs[3].folderA.path, "/r/b");
    ASSERT_EQ(pairs[4].folderA.path, "/r/c");
    ASSERT_EQ(pairs[5].folderA.path, "/r/e");
}

UNIT_TEST(ResultRankerTotalOrder)
{
    for (SortMode mode : {SortMode::Similarity, SortMode::Size, SortMode::Name})
    {
        std::vector<CandidatePair> pairs = makeRankTestPairs();
        rankCandidates(pairs, mode);
        for (size_t i = 0; i + 1 < pairs.size(); i++)
        {
            ASSERT_TRUE(rankBefore(pairs[i], pairs[i + 1], mode));
            ASSERT_TRUE(!rankBefore(pairs[i + 1], pairs[i], mode));
        }
        ASSERT_TRUE(parseSortMode(getSortModeName(mode)) == mode);
    }
}

UNIT_TEST(ResultRankerUnknownMode)
{
    bool thrown = false;
    try
    {
        parseSortMode("date");
    }
    catch (const ConfigurationError&)
    {
        thrown = true;
    }
    ASSERT_TRUE(thrown);
}
