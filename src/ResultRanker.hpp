// Deterministic ordering of candidate pairs.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "SimilarityEngine.hpp"
#include <string>
#include <vector>

enum class SortMode
{
    Similarity,
    Size,
    Name
};

/// Parse "similarity", "size" or "name". Throws ConfigurationError for anything else.
SortMode parseSortMode(const std::string& name);

/// Name of a sort mode as accepted by parseSortMode().
std::string getSortModeName(SortMode mode);

/// Return true if a sorts strictly before b in the given mode.
/// All keys together form a total order for distinct path pairs.
bool rankBefore(const CandidatePair& a, const CandidatePair& b, SortMode mode);

/// Stable sort of pairs according to mode.
void rankCandidates(std::vector<CandidatePair>& pairs, SortMode mode);
