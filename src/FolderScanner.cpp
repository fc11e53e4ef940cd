// Folder scanning: sizes and depth-limited name fingerprints of all dirs below the roots.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "FolderScanner.hpp"
#include "ProgressTracker.hpp"
#include "MiscUtils.hpp"
#include "UnitTest.hpp"
#include "TestUtils.hpp"
#include <iostream>
#include <system_error>
#include <utility>

fs::path normalizePath(const fs::path& path)
{
    std::error_code ec;
    fs::path abs = fs::absolute(path, ec);
    fs::path normalized = ec ? path.lexically_normal() : abs.lexically_normal();
    if (normalized.has_filename() == false && normalized != normalized.root_path())
    {
        normalized = normalized.parent_path();
    }
    return normalized;
}

bool isPathWithin(const fs::path& root, const fs::path& path)
{
    auto rootIt = root.begin();
    auto pathIt = path.begin();
    for (; rootIt != root.end() && pathIt != path.end(); ++rootIt, ++pathIt)
    {
        if (*rootIt != *pathIt)
        {
            return false;
        }
    }
    return rootIt == root.end();
}

/// Return path with all symlinks resolved, or the lexically normalized path if that fails.
static fs::path getPhysicalPath(const fs::path& path)
{
    std::error_code ec;
    fs::path physical = fs::weakly_canonical(path, ec);
    return ec ? normalizePath(path) : normalizePath(physical);
}

void checkRootsDisjoint(const std::vector<fs::path>& roots)
{
    // Compare physical locations so a symlinked root cannot alias another root.
    std::vector<fs::path> physical;
    for (const auto& root : roots)
    {
        physical.push_back(getPhysicalPath(root));
    }
    for (size_t i = 0; i < roots.size(); i++)
    {
        for (size_t j = i + 1; j < roots.size(); j++)
        {
            const fs::path& a = physical[i];
            const fs::path& b = physical[j];
            if (a == b)
            {
                throw ConfigurationError("Root path '" + roots[j].string() + "' refers to the same dir as '" + roots[i].string() + "'.");
            }
            if (isPathWithin(a, b) || isPathWithin(b, a))
            {
                throw ConfigurationError("Root paths '" + roots[i].string() + "' and '" + roots[j].string() + "' overlap. Roots must not contain each other.");
            }
        }
    }
}

/// Recursive part of getFingerprint(). depth is the depth of dir relative to the fingerprinted folder.
static void gatherNames(const fs::path& dir, const std::string& prefix, unsigned depth, unsigned maxDepth, Fingerprint& names, ProgressSink& progress)
{
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec)
    {
        if (depth == 0 && (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory))
        {
            throw MissingPathError(dir.string());
        }
        progress.warning("Cannot read directory " + dir.string() + ": " + ec.message());
        return;
    }

    fs::directory_iterator end;
    while (it != end)
    {
        fs::file_status status = it->symlink_status(ec);
        if (!ec && !fs::is_symlink(status))
        {
            std::string name = prefix + it->path().filename().string();
            if (fs::is_directory(status) && depth + 1 < maxDepth)
            {
                gatherNames(it->path(), name + "/", depth + 1, maxDepth, names, progress);
            }
            names.insert(std::move(name));
        }
        ec.clear();
        it.increment(ec);
        if (ec)
        {
            progress.warning("Error while reading directory " + dir.string() + ": " + ec.message());
            break;
        }
    }
}

Fingerprint getFingerprint(const fs::path& dir, unsigned maxDepth, ProgressSink& progress)
{
    Fingerprint names;
    if (maxDepth > 0)
    {
        gatherNames(dir, std::string(), 0, maxDepth, names, progress);
    }
    return names;
}

uint64_t getFolderSize(const fs::path& dir)
{
    uint64_t totalSize = 0;
    std::error_code ec;
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    fs::recursive_directory_iterator end;
    while (it != end)
    {
        if (ec)
        {
            ec.clear();
            it.increment(ec);
            continue;
        }
        if (ut1::getFileType(*it, false) == ut1::FT_REGULAR)
        {
            uintmax_t size = it->file_size(ec);
            if (!ec)
            {
                totalSize += size;
            }
            ec.clear();
        }
        it.increment(ec);
    }
    return totalSize;
}

/// Call func for each dir below root (not for root itself), not following symlinks.
template <class FUNC>
static void forEachDir(const fs::path& root, FUNC func)
{
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    fs::recursive_directory_iterator end;
    while (it != end)
    {
        if (ec)
        {
            if (clVerbose && it != end)
            {
                std::cerr << "Skipping entry due to error: " << it->path() << "\n";
            }
            ec.clear();
            it.increment(ec);
            continue;
        }
        if (ut1::getFileType(*it, false) == ut1::FT_DIR)
        {
            func(it->path());
        }
        it.increment(ec);
    }
}

std::vector<FolderRecord> scanFolders(const std::vector<fs::path>& roots, const ScanOptions& options, ProgressSink& progress)
{
    uint64_t totalDirs = 0;
    for (const auto& root : roots)
    {
        forEachDir(root, [&](const fs::path&) { totalDirs++; });
    }

    std::vector<FolderRecord> folders;
    uint64_t processedDirs = 0;
    for (const auto& root : roots)
    {
        forEachDir(root, [&](const fs::path& dirPath)
        {
            progress.notify((totalDirs == 0) ? 1.0 : (double(processedDirs) / double(totalDirs)), dirPath.string());
            processedDirs++;

            uint64_t size = getFolderSize(dirPath);
            if (size < options.minSize || size > options.maxSize)
            {
                return;
            }
            Fingerprint names;
            try
            {
                names = getFingerprint(dirPath, options.depth, progress);
            }
            catch (const MissingPathError& e)
            {
                progress.warning(e.what());
                return;
            }
            if (names.size() < options.minEntries)
            {
                return;
            }
            folders.push_back(FolderRecord{dirPath.string(), size, names.size()});
        });
    }
    return folders;
}

UNIT_TEST(FolderScannerOverlappingRoots)
{
    bool thrown = false;
    try
    {
        checkRootsDisjoint({"/a", "/a/b"});
    }
    catch (const ConfigurationError&)
    {
        thrown = true;
    }
    ASSERT_TRUE(thrown);

    thrown = false;
    try
    {
        checkRootsDisjoint({"/data/x", "/other", "/data/x"});
    }
    catch (const ConfigurationError&)
    {
        thrown = true;
    }
    ASSERT_TRUE(thrown);

    // Common name prefix is not an overlap.
    checkRootsDisjoint({"/data/photos", "/data/photos2", "/backup"});

    // A symlink to a dir below another root overlaps that root.
    ScratchDir tmp;
    tmp.addFile("data/photos/a.jpg");
    tmp.addDir("other");
    fs::create_directory_symlink(tmp / "data/photos", tmp / "link");
    fs::create_directory_symlink(tmp / "other", tmp / "same");
    thrown = false;
    try
    {
        checkRootsDisjoint({normalizePath(tmp / "data"), normalizePath(tmp / "link")});
    }
    catch (const ConfigurationError&)
    {
        thrown = true;
    }
    ASSERT_TRUE(thrown);

    thrown = false;
    try
    {
        checkRootsDisjoint({normalizePath(tmp / "other"), normalizePath(tmp / "same")});
    }
    catch (const ConfigurationError&)
    {
        thrown = true;
    }
    ASSERT_TRUE(thrown);

    checkRootsDisjoint({normalizePath(tmp / "data"), normalizePath(tmp / "other")});
}

UNIT_TEST(FolderScannerIsPathWithin)
{
    ASSERT_TRUE(isPathWithin("/a", "/a"));
    ASSERT_TRUE(isPathWithin("/a", "/a/b/c"));
    ASSERT_TRUE(!isPathWithin("/a/b", "/a"));
    ASSERT_TRUE(!isPathWithin("/a/b", "/a/bc"));
}

UNIT_TEST(FolderScannerFingerprintDepth)
{
    ScratchDir tmp;
    tmp.addFile("one/readme.txt");
    tmp.addFile("one/logs/a.txt");
    tmp.addFile("one/logs/deep/x.txt");
    RecordingProgress progress;

    Fingerprint depth1 = getFingerprint(tmp / "one", 1, progress);
    ASSERT_TRUE(depth1 == Fingerprint({"logs", "readme.txt"}));

    Fingerprint depth2 = getFingerprint(tmp / "one", 2, progress);
    ASSERT_TRUE(depth2 == Fingerprint({"logs", "logs/a.txt", "logs/deep", "readme.txt"}));

    Fingerprint depth3 = getFingerprint(tmp / "one", 3, progress);
    ASSERT_EQ(depth3.size(), size_t(5));
    ASSERT_TRUE(depth3.count("logs/deep/x.txt") == 1);
    ASSERT_TRUE(progress.warnings.empty());
}

UNIT_TEST(FolderScannerIgnoresSymlinks)
{
    ScratchDir tmp;
    tmp.addFile("target/data.bin", std::string(1000, 'x'));
    tmp.addDir("links");
    fs::create_symlink(tmp / "target/data.bin", tmp / "links/file-link");
    fs::create_directory_symlink(tmp / "target", tmp / "links/dir-link");
    RecordingProgress progress;

    ASSERT_EQ(getFolderSize(tmp / "links"), uint64_t(0));
    ASSERT_TRUE(getFingerprint(tmp / "links", 3, progress).empty());
    ASSERT_EQ(getFolderSize(tmp / "target"), uint64_t(1000));
}

UNIT_TEST(FolderScannerUnreadableDir)
{
    ScratchDir tmp;
    tmp.addFile("one/top.txt");
    tmp.addFile("one/open/a.txt");
    tmp.addFile("one/locked/b.txt");
    fs::permissions(tmp / "one/locked", fs::perms::none);
    // Permission bits do not apply to root.
    std::error_code ec;
    fs::directory_iterator check(tmp / "one/locked", ec);
    bool denied = bool(ec);
    RecordingProgress progress;

    Fingerprint names = getFingerprint(tmp / "one", 2, progress);
    fs::permissions(tmp / "one/locked", fs::perms::owner_all);

    ASSERT_TRUE(names.count("top.txt") == 1);
    ASSERT_TRUE(names.count("open") == 1);
    ASSERT_TRUE(names.count("open/a.txt") == 1);
    ASSERT_TRUE(names.count("locked") == 1);
    if (denied)
    {
        ASSERT_EQ(names.size(), size_t(4));
        ASSERT_EQ(progress.warnings.size(), size_t(1));
        ASSERT_TRUE(progress.warnings[0].find("locked") != std::string::npos);
    }
    else
    {
        ASSERT_EQ(names.size(), size_t(5));
        ASSERT_TRUE(progress.warnings.empty());
    }
}

UNIT_TEST(FolderScannerMissingDir)
{
    ScratchDir tmp;
    RecordingProgress progress;
    bool thrown = false;
    try
    {
        getFingerprint(tmp / "does-not-exist", 1, progress);
    }
    catch (const MissingPathError& e)
    {
        thrown = true;
        ASSERT_EQ(e.path, (tmp / "does-not-exist").string());
    }
    ASSERT_TRUE(thrown);
}

UNIT_TEST(FolderScannerScanFilters)
{
    ScratchDir tmp;
    tmp.addFile("root/small/a", std::string(10, 'a'));
    tmp.addFile("root/big/a", std::string(5000, 'b'));
    tmp.addFile("root/big/b", std::string(5000, 'b'));
    tmp.addFile("root/big/nested/c", std::string(100, 'c'));
    tmp.addDir("root/empty");
    RecordingProgress progress;

    ScanOptions options;
    std::vector<FolderRecord> all = scanFolders({tmp / "root"}, options, progress);
    // "empty" has no entries and is dropped by the default minimum of one entry.
    ASSERT_EQ(all.size(), size_t(3));
    ASSERT_EQ(progress.notifications.size(), size_t(4));

    uint64_t bigSize = 0;
    for (const auto& folder : all)
    {
        ASSERT_TRUE(folder.path != (tmp / "root").string());
        if (folder.path == (tmp / "root/big").string())
        {
            bigSize = folder.byteSize;
            ASSERT_EQ(folder.numEntries, size_t(3));
        }
    }
    ASSERT_EQ(bigSize, uint64_t(10100));

    options.minSize = 50;
    options.maxSize = 1000;
    std::vector<FolderRecord> mid = scanFolders({tmp / "root"}, options, progress);
    ASSERT_EQ(mid.size(), size_t(1));
    ASSERT_EQ(mid[0].path, (tmp / "root/big/nested").string());

    options = ScanOptions();
    options.minEntries = 3;
    std::vector<FolderRecord> many = scanFolders({tmp / "root"}, options, progress);
    ASSERT_EQ(many.size(), size_t(1));
    ASSERT_EQ(many[0].path, (tmp / "root/big").string());
}
