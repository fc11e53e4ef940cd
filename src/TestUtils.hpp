// Helpers for unit tests which need real directory trees.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "ProgressTracker.hpp"
#include "MiscUtils.hpp"
#include <filesystem>
#include <string>
#include <utility>
#include <vector>
#include <unistd.h>

/// Temporary directory tree which is removed again when going out of scope.
class ScratchDir
{
public:
    ScratchDir()
    {
        static unsigned counter = 0;
        root = std::filesystem::temp_directory_path() / ("dirsim_unittest_" + ut1::toStr(::getpid()) + "_" + ut1::toStr(counter++));
        std::filesystem::remove_all(root);
        std::filesystem::create_directories(root);
    }

    ~ScratchDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    /// Create a file (and its parent dirs) with the given contents.
    std::filesystem::path addFile(const std::string& relPath, const std::string& contents = std::string()) const
    {
        std::filesystem::path path = root / relPath;
        std::filesystem::create_directories(path.parent_path());
        ut1::writeFile(path.string(), contents);
        return path;
    }

    /// Create a dir (and its parent dirs).
    std::filesystem::path addDir(const std::string& relPath) const
    {
        std::filesystem::path path = root / relPath;
        std::filesystem::create_directories(path);
        return path;
    }

    /// Full path of an entry below the scratch root.
    std::filesystem::path operator/(const std::string& relPath) const
    {
        return root / relPath;
    }

    std::filesystem::path root;
};

/// Progress sink which records everything it receives.
class RecordingProgress : public ProgressSink
{
public:
    void notify(double fraction, const std::string& label) override
    {
        notifications.emplace_back(fraction, label);
    }

    void warning(const std::string& message) override
    {
        warnings.push_back(message);
    }

    std::vector<std::pair<double, std::string>> notifications;
    std::vector<std::string> warnings;
};
