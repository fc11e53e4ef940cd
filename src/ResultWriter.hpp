// Console report and CSV file output of candidate pairs.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "SimilarityEngine.hpp"
#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/// Results are printed to the console below this count, saved to a file otherwise.
static constexpr size_t kMaxConsoleResults = 200;

/// Current local time formatted with strftime().
std::string getLocalTimeStr(const char* format);

/// Default result file: folder_diffs_YYYYMMDD-HHMMSS.csv in the temp dir.
fs::path getDefaultOutputPath();

/// Similarity as percentage with two decimals, e.g. "66.67".
std::string formatSimilarityPercent(double similarity);

/// Quote a CSV field if it contains a comma, quote or line break.
std::string quoteCsvField(const std::string& field);

/// Return true if the results must be saved to getDefaultOutputPath(): there are too many for the
/// console (or they are not printed at all in interactive mode) and no output file was given.
bool needsDefaultOutput(size_t numResults, bool interactive, bool forcePrint, bool outputGiven);

/// Print all pairs in human readable form.
void printResults(const std::vector<CandidatePair>& pairs, std::ostream& os);

/// Format all pairs as CSV including a header line.
std::string formatCsv(const std::vector<CandidatePair>& pairs);

/// Write all pairs as CSV to destination. The file is written to a temporary name first and then
/// renamed, so destination is either complete or untouched.
void saveResults(const std::vector<CandidatePair>& pairs, const fs::path& destination);
