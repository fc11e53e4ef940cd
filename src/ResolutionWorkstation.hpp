// Interactive resolution of similar folder pairs (merge or mark for deletion).
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "SimilarityEngine.hpp"
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <cstdint>

namespace fs = std::filesystem;

/// Operator choice at the prompt. "Up" is the primary (larger) folder, "down" the secondary one.
enum class Action
{
    MergeUp,    // Copy secondary onto primary, mark secondary for deletion.
    MergeDown,  // Copy primary onto secondary, mark primary for deletion.
    DeleteUp,   // Mark primary for deletion.
    DeleteDown, // Mark secondary for deletion.
    Skip,
    Quit
};

/// What happened to one candidate.
enum class Outcome
{
    Suppressed, // A folder of the pair was already resolved. Not presented.
    Merged,
    Deleted,
    Skipped,
    Quit
};

/// Map a prompt token ("mu", "md", "du", "dd", "s", "q") to an action.
std::optional<Action> parseAction(const std::string& token);

struct CopyStats
{
    uint64_t files{};
    uint64_t dirs{};
    std::vector<std::string> conflicts; // Entries which could not be copied without removing something.
};

/// Copy all entries below src onto dst. Existing files in dst are overwritten, entries only in dst are kept.
/// Symlinks are copied as symlinks. Nothing is ever removed: entries which would require removing a
/// dir, a symlink or a file of another type in dst are left alone and reported in conflicts.
/// Throws MissingPathError if src or dst is not a directory and std::runtime_error on copy errors.
CopyStats copyTreeOnto(const fs::path& src, const fs::path& dst);

/// Interactive session over ranked candidate pairs.
/// Folders are never removed. Deletion intents are appended to a log file for an external tool.
class ResolutionWorkstation
{
public:
    struct Stats
    {
        uint64_t presented{};
        uint64_t suppressed{};
        uint64_t merged{};
        uint64_t deleted{};
        uint64_t skipped{};
        bool quit{};
    };

    explicit ResolutionWorkstation(fs::path logPath_, std::istream& in_, std::ostream& out_);

    /// Present candidates in order until all are processed or the operator quits.
    Stats run(const std::vector<CandidatePair>& pairs);

    /// Present one candidate and apply the operator's choice.
    Outcome resolve(const CandidatePair& pair);

    /// Return true if path is at or below an already resolved folder.
    bool isResolved(const std::string& path) const;

    const std::set<std::string>& getResolvedPrefixes() const { return resolvedPrefixes; }
    const fs::path& getLogPath() const { return logPath; }

    /// Deletion log for today in the temp dir: dirsim_delete_YYYYMMDD.txt.
    static fs::path getDefaultLogPath();

private:
    /// Copy from into to and mark from for deletion. Returns false if the merge failed.
    bool merge(const std::string& from, const std::string& to);

    /// Append path to the deletion log and mark it as resolved.
    void registerDeletion(const std::string& path);

    std::set<std::string> resolvedPrefixes;
    fs::path logPath;
    bool warningShown = false;
    std::istream& in;
    std::ostream& out;
};
