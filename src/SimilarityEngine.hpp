// All-pairs similarity of folder fingerprints.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "FolderScanner.hpp"
#include <vector>
#include <cstdint>

class ProgressSink;

/// Two folders and their similarity in [0, 1].
struct CandidatePair
{
    FolderRecord folderA;
    FolderRecord folderB;
    double similarity{};

    /// Combined size of both folders.
    uint64_t totalSize() const
    {
        return folderA.byteSize + folderB.byteSize;
    }
};

struct CompareOptions
{
    double minSimilarity = 50.0; // Percent, 0..100.
    unsigned depth = 1;
    unsigned numJobs = 1;
};

struct CompareResult
{
    std::vector<CandidatePair> pairs;
    uint64_t numComparisons{};
    uint64_t numSkipped{}; // Pairs skipped because a folder vanished.
};

/// Similarity of two fingerprints: |a & b| / max(|a|, |b|), 0.0 if both are empty.
double calcSimilarity(const Fingerprint& a, const Fingerprint& b);

/// Number of comparisons between two progress notifications for the given total.
uint64_t getProgressInterval(uint64_t totalComparisons);

/// Compare all pairs (i, j) with i < j of folders and return those at or above options.minSimilarity.
/// Comparing all pairs is quadratic in the number of folders. Any two folders may be similar, so there is no pruning.
CompareResult findSimilarFolders(const std::vector<FolderRecord>& folders, const CompareOptions& options, ProgressSink& progress);
