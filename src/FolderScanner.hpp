// Folder scanning: sizes and depth-limited name fingerprints of all dirs below the roots.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <filesystem>
#include <limits>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include <cstdint>

namespace fs = std::filesystem;

class ProgressSink;

/// Set of entry names relative to a folder, e.g. "file.txt" and "sub/file.txt".
using Fingerprint = std::set<std::string>;

/// A directory which passed the size and entry count filters.
struct FolderRecord
{
    std::string path;
    uint64_t byteSize{};
    size_t numEntries{}; // Fingerprint size at scan time.
};

struct ScanOptions
{
    uint64_t minSize = 0;
    uint64_t maxSize = std::numeric_limits<uint64_t>::max();
    size_t minEntries = 1;
    unsigned depth = 1;
};

/// Invalid configuration (e.g. overlapping roots). Fatal.
class ConfigurationError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/// A directory vanished after it was scanned.
class MissingPathError : public std::runtime_error
{
public:
    explicit MissingPathError(const std::string& path_)
        : std::runtime_error("Directory does not exist anymore: " + path_),
          path(path_) {}

    std::string path;
};

/// Normalize a path for consistent comparisons (absolute, lexically normal, no trailing slash).
fs::path normalizePath(const fs::path& path);

/// Return true if path is equal to root or below root (component-wise).
bool isPathWithin(const fs::path& root, const fs::path& path);

/// Throw ConfigurationError if any root is equal to or an ancestor of another root.
void checkRootsDisjoint(const std::vector<fs::path>& roots);

/// Gather the names of all entries of dir up to maxDepth levels (1 = immediate entries only).
/// Symlinks are ignored. Unreadable subdirs report a warning and contribute nothing.
/// Throws MissingPathError if dir itself does not exist.
Fingerprint getFingerprint(const fs::path& dir, unsigned maxDepth, ProgressSink& progress);

/// Sum of the sizes of all regular files below dir, not following symlinks.
uint64_t getFolderSize(const fs::path& dir);

/// Walk all roots and return all dirs below them which pass the filters in options.
std::vector<FolderRecord> scanFolders(const std::vector<fs::path>& roots, const ScanOptions& options, ProgressSink& progress);
