// Interactive resolution of similar folder pairs (merge or mark for deletion).
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "ResolutionWorkstation.hpp"
#include "ResultWriter.hpp"
#include "MiscUtils.hpp"
#include "UnitTest.hpp"
#include "TestUtils.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

std::optional<Action> parseAction(const std::string& token)
{
    static const std::pair<const char*, Action> actions[] = {
        {"mu", Action::MergeUp},
        {"md", Action::MergeDown},
        {"du", Action::DeleteUp},
        {"dd", Action::DeleteDown},
        {"s", Action::Skip},
        {"q", Action::Quit}};
    for (const auto& [name, action] : actions)
    {
        if (token == name)
        {
            return action;
        }
    }
    return std::nullopt;
}

/// Strip leading and trailing whitespace.
static std::string trim(const std::string& s)
{
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos)
    {
        return std::string();
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

CopyStats copyTreeOnto(const fs::path& src, const fs::path& dst)
{
    std::error_code ec;
    if (!fs::is_directory(fs::symlink_status(src, ec)))
    {
        throw MissingPathError(src.string());
    }
    if (!fs::is_directory(fs::symlink_status(dst, ec)))
    {
        throw MissingPathError(dst.string());
    }

    CopyStats stats;
    fs::recursive_directory_iterator it(src, fs::directory_options::none, ec);
    if (ec)
    {
        throw std::runtime_error("Error while reading directory " + src.string() + ": " + ec.message());
    }
    fs::recursive_directory_iterator end;
    for (; it != end; it.increment(ec))
    {
        if (ec)
        {
            throw std::runtime_error("Error while reading directory " + src.string() + ": " + ec.message());
        }
        const fs::path& srcPath = it->path();
        fs::path destPath = dst / srcPath.lexically_relative(src);
        fs::file_status srcStatus = it->symlink_status(ec);
        if (ec)
        {
            throw std::runtime_error("Failed to stat " + srcPath.string() + ": " + ec.message());
        }
        fs::file_status destStatus = fs::symlink_status(destPath, ec);
        bool destExists = fs::exists(destStatus);

        if (fs::is_directory(srcStatus))
        {
            if (!destExists)
            {
                fs::create_directory(destPath, ec);
                if (ec)
                {
                    throw std::runtime_error("Failed to create " + destPath.string() + ": " + ec.message());
                }
                stats.dirs++;
            }
            else if (!fs::is_directory(destStatus))
            {
                stats.conflicts.push_back(destPath.string());
                it.disable_recursion_pending();
            }
        }
        else if (fs::is_symlink(srcStatus))
        {
            if (destExists)
            {
                stats.conflicts.push_back(destPath.string());
                continue;
            }
            fs::copy_symlink(srcPath, destPath, ec);
            if (ec)
            {
                throw std::runtime_error("Failed to copy " + srcPath.string() + " to " + destPath.string() + ": " + ec.message());
            }
            stats.files++;
        }
        else if (fs::is_regular_file(srcStatus))
        {
            // Never write through a symlink in dst.
            if (destExists && !fs::is_regular_file(destStatus))
            {
                stats.conflicts.push_back(destPath.string());
                continue;
            }
            fs::copy_file(srcPath, destPath, fs::copy_options::overwrite_existing, ec);
            if (ec)
            {
                throw std::runtime_error("Failed to copy " + srcPath.string() + " to " + destPath.string() + ": " + ec.message());
            }
            stats.files++;
        }
    }
    if (ec)
    {
        throw std::runtime_error("Error while reading directory " + src.string() + ": " + ec.message());
    }
    return stats;
}

ResolutionWorkstation::ResolutionWorkstation(fs::path logPath_, std::istream& in_, std::ostream& out_)
    : logPath(std::move(logPath_)),
      in(in_),
      out(out_)
{
}

fs::path ResolutionWorkstation::getDefaultLogPath()
{
    return fs::temp_directory_path() / ("dirsim_delete_" + getLocalTimeStr("%Y%m%d") + ".txt");
}

bool ResolutionWorkstation::isResolved(const std::string& path) const
{
    for (const auto& prefix : resolvedPrefixes)
    {
        if (isPathWithin(prefix, path))
        {
            return true;
        }
    }
    return false;
}

ResolutionWorkstation::Stats ResolutionWorkstation::run(const std::vector<CandidatePair>& pairs)
{
    Stats stats;
    for (const auto& pair : pairs)
    {
        Outcome outcome = resolve(pair);
        if (outcome != Outcome::Suppressed)
        {
            stats.presented++;
        }
        switch (outcome)
        {
            case Outcome::Suppressed: stats.suppressed++; break;
            case Outcome::Merged: stats.merged++; break;
            case Outcome::Deleted: stats.deleted++; break;
            case Outcome::Skipped: stats.skipped++; break;
            case Outcome::Quit: stats.quit = true; break;
        }
        if (stats.quit)
        {
            break;
        }
    }
    return stats;
}

Outcome ResolutionWorkstation::resolve(const CandidatePair& pair)
{
    if (isResolved(pair.folderA.path) || isResolved(pair.folderB.path))
    {
        return Outcome::Suppressed;
    }

    // The larger folder is the primary one.
    bool swap = pair.folderB.byteSize > pair.folderA.byteSize;
    const FolderRecord& primary = swap ? pair.folderB : pair.folderA;
    const FolderRecord& secondary = swap ? pair.folderA : pair.folderB;

    out << "\nSimilarity: " << formatSimilarityPercent(pair.similarity) << "%\n";
    out << "  1: " << primary.path << " (" << ut1::getApproxSizeStr(primary.byteSize, 3, true, false) << ")\n";
    out << "  2: " << secondary.path << " (" << ut1::getApproxSizeStr(secondary.byteSize, 3, true, false) << ")\n";

    while (true)
    {
        out << "[mu] merge 2 into 1, [md] merge 1 into 2, [du] delete 1, [dd] delete 2, [s] skip, [q] quit: " << std::flush;
        std::string line;
        if (!std::getline(in, line))
        {
            out << "\n";
            return Outcome::Quit;
        }
        std::optional<Action> action = parseAction(trim(line));
        if (!action)
        {
            out << "Unknown choice '" << trim(line) << "'.\n";
            continue;
        }

        switch (*action)
        {
            case Action::MergeUp:
            case Action::MergeDown:
                if (isPathWithin(primary.path, secondary.path) || isPathWithin(secondary.path, primary.path))
                {
                    out << "Cannot merge folders which contain each other. Use delete or skip.\n";
                    continue;
                }
                if (*action == Action::MergeUp)
                {
                    return merge(secondary.path, primary.path) ? Outcome::Merged : Outcome::Skipped;
                }
                return merge(primary.path, secondary.path) ? Outcome::Merged : Outcome::Skipped;
            case Action::DeleteUp:
                registerDeletion(primary.path);
                return Outcome::Deleted;
            case Action::DeleteDown:
                registerDeletion(secondary.path);
                return Outcome::Deleted;
            case Action::Skip:
                return Outcome::Skipped;
            case Action::Quit:
                return Outcome::Quit;
        }
    }
}

bool ResolutionWorkstation::merge(const std::string& from, const std::string& to)
{
    CopyStats stats;
    try
    {
        stats = copyTreeOnto(from, to);
    }
    catch (const std::runtime_error& e)
    {
        std::cerr << "Warning: Merge of " << from << " into " << to << " failed: " << e.what() << "\n";
        std::cerr << "Warning: " << from << " is not marked for deletion.\n";
        return false;
    }
    out << "Copied " << stats.files << " files and " << stats.dirs << " dirs from " << from << " into " << to << ".\n";
    for (const auto& conflict : stats.conflicts)
    {
        out << "Kept existing " << conflict << " (different type).\n";
    }
    registerDeletion(from);
    return true;
}

void ResolutionWorkstation::registerDeletion(const std::string& path)
{
    std::string absPath = normalizePath(path).string();
    {
        std::ofstream os(logPath, std::ios::app);
        os << absPath << "\n";
        os.close();
        if (!os)
        {
            throw std::runtime_error("Failed to append to deletion log " + logPath.string());
        }
    }
    resolvedPrefixes.insert(absPath);
    if (!warningShown)
    {
        out << "\nNOTE: Nothing is deleted by this program. Folders to delete are appended to\n"
            << "  " << logPath.string() << "\n"
            << "Review that file and delete the listed folders with an external tool.\n\n";
        warningShown = true;
    }
    out << "Marked for deletion: " << absPath << "\n";
}

namespace
{

/// Scratch tree with a larger primary and a smaller secondary folder.
struct MergeFixture
{
    MergeFixture()
    {
        tmp.addFile("r/big/keep.txt", std::string(1000, 'k'));
        tmp.addFile("r/big/common.txt", "old");
        tmp.addFile("r/small/common.txt", "new");
        tmp.addFile("r/small/extra.txt", "extra");
        tmp.addFile("r/small/sub/deep.txt", "deep");
        tmp.addFile("r/other/common.txt", "other");
        big = FolderRecord{normalizePath(tmp / "r/big").string(), 1003, 2};
        small = FolderRecord{normalizePath(tmp / "r/small").string(), 17, 3};
        other = FolderRecord{normalizePath(tmp / "r/other").string(), 5, 1};
        logPath = tmp / "delete.txt";
    }

    ScratchDir tmp;
    FolderRecord big;
    FolderRecord small;
    FolderRecord other;
    fs::path logPath;
};

/// Count non-overlapping occurrences of needle in haystack.
size_t countOccurrences(const std::string& haystack, const std::string& needle)
{
    size_t count = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + needle.size()))
    {
        count++;
    }
    return count;
}

} // namespace

UNIT_TEST(ResolutionWorkstationParseAction)
{
    ASSERT_TRUE(parseAction("mu") == Action::MergeUp);
    ASSERT_TRUE(parseAction("md") == Action::MergeDown);
    ASSERT_TRUE(parseAction("du") == Action::DeleteUp);
    ASSERT_TRUE(parseAction("dd") == Action::DeleteDown);
    ASSERT_TRUE(parseAction("s") == Action::Skip);
    ASSERT_TRUE(parseAction("q") == Action::Quit);
    ASSERT_TRUE(!parseAction("x"));
    ASSERT_TRUE(!parseAction(""));
    ASSERT_TRUE(!parseAction("merge"));
}

UNIT_TEST(ResolutionWorkstationMergeUp)
{
    MergeFixture f;
    // folderA is the smaller one: primary/secondary is decided by size.
    std::vector<CandidatePair> pairs = {
        CandidatePair{f.small, f.big, 0.5},
        CandidatePair{f.small, f.other, 0.5},
        CandidatePair{FolderRecord{f.small.path + "/sub", 4, 1}, f.other, 0.5},
        CandidatePair{f.big, f.other, 0.5}};
    std::istringstream in("mu\ns\n");
    std::ostringstream out;
    ResolutionWorkstation station(f.logPath, in, out);
    ResolutionWorkstation::Stats stats = station.run(pairs);

    ASSERT_EQ(stats.merged, uint64_t(1));
    ASSERT_EQ(stats.suppressed, uint64_t(2));
    ASSERT_EQ(stats.skipped, uint64_t(1));
    ASSERT_EQ(stats.presented, uint64_t(2));
    ASSERT_TRUE(!stats.quit);

    // Primary keeps its own files, collisions take the secondary version.
    ASSERT_EQ(ut1::readFile((f.tmp / "r/big/keep.txt").string()), std::string(1000, 'k'));
    ASSERT_EQ(ut1::readFile((f.tmp / "r/big/common.txt").string()), "new");
    ASSERT_EQ(ut1::readFile((f.tmp / "r/big/extra.txt").string()), "extra");
    ASSERT_EQ(ut1::readFile((f.tmp / "r/big/sub/deep.txt").string()), "deep");

    // Secondary is only marked, never removed.
    ASSERT_TRUE(fs::exists(f.tmp / "r/small/common.txt"));
    ASSERT_EQ(ut1::readFile(f.logPath.string()), f.small.path + "\n");
    ASSERT_TRUE(station.isResolved(f.small.path));
    ASSERT_TRUE(station.isResolved(f.small.path + "/sub"));
    ASSERT_TRUE(!station.isResolved(f.big.path));
    ASSERT_EQ(countOccurrences(out.str(), "Nothing is deleted"), size_t(1));
}

UNIT_TEST(ResolutionWorkstationMergeDown)
{
    MergeFixture f;
    std::istringstream in("md\n");
    std::ostringstream out;
    ResolutionWorkstation station(f.logPath, in, out);
    ASSERT_TRUE(station.resolve(CandidatePair{f.big, f.small, 0.5}) == Outcome::Merged);
    ASSERT_EQ(ut1::readFile((f.tmp / "r/small/common.txt").string()), "old");
    ASSERT_EQ(ut1::readFile((f.tmp / "r/small/keep.txt").string()), std::string(1000, 'k'));
    ASSERT_EQ(ut1::readFile((f.tmp / "r/small/extra.txt").string()), "extra");
    ASSERT_EQ(ut1::readFile(f.logPath.string()), f.big.path + "\n");
    ASSERT_TRUE(fs::exists(f.tmp / "r/big/keep.txt"));
}

UNIT_TEST(ResolutionWorkstationDeleteAndQuit)
{
    MergeFixture f;
    std::vector<CandidatePair> pairs = {
        CandidatePair{f.big, f.small, 0.9},
        CandidatePair{f.big, f.other, 0.8},
        CandidatePair{f.other, f.small, 0.7}};
    // Invalid input first, it must not consume the candidate.
    std::istringstream in("bogus\ndd\ndu\n");
    std::ostringstream out;
    ResolutionWorkstation station(f.logPath, in, out);

    ASSERT_TRUE(station.resolve(pairs[0]) == Outcome::Deleted);
    ASSERT_TRUE(out.str().find("Unknown choice 'bogus'") != std::string::npos);
    ASSERT_TRUE(station.resolve(pairs[1]) == Outcome::Deleted);
    // Pair 2 references small which is already resolved.
    ASSERT_TRUE(station.resolve(pairs[2]) == Outcome::Suppressed);
    ASSERT_EQ(ut1::readFile(f.logPath.string()), f.small.path + "\n" + f.big.path + "\n");
    ASSERT_EQ(countOccurrences(out.str(), "Nothing is deleted"), size_t(1));
    ASSERT_TRUE(fs::exists(f.big.path));
    ASSERT_TRUE(fs::exists(f.small.path));
}

UNIT_TEST(ResolutionWorkstationQuit)
{
    MergeFixture f;
    std::vector<CandidatePair> pairs = {
        CandidatePair{f.big, f.small, 0.9},
        CandidatePair{f.big, f.other, 0.8},
        CandidatePair{f.small, f.other, 0.7}};
    std::istringstream in("dd\nq\ndu\n");
    std::ostringstream out;
    ResolutionWorkstation::Stats stats;
    {
        ResolutionWorkstation station(f.logPath, in, out);
        stats = station.run(pairs);
    }
    ASSERT_TRUE(stats.quit);
    ASSERT_EQ(stats.deleted, uint64_t(1));
    ASSERT_EQ(stats.presented, uint64_t(2));
    // The deletion registered before quitting is kept. "du" was never read.
    ASSERT_EQ(ut1::readFile(f.logPath.string()), f.small.path + "\n");
    std::string rest;
    std::getline(in, rest);
    ASSERT_EQ(rest, "du");

    // A later session appends to the same log.
    std::istringstream in2("dd\n");
    ResolutionWorkstation station2(f.logPath, in2, out);
    ASSERT_TRUE(station2.resolve(pairs[1]) == Outcome::Deleted);
    ASSERT_EQ(ut1::readFile(f.logPath.string()), f.small.path + "\n" + f.other.path + "\n");
}

UNIT_TEST(ResolutionWorkstationEndOfInput)
{
    MergeFixture f;
    std::istringstream in("");
    std::ostringstream out;
    ResolutionWorkstation station(f.logPath, in, out);
    ASSERT_TRUE(station.resolve(CandidatePair{f.big, f.small, 0.5}) == Outcome::Quit);
    ASSERT_TRUE(!fs::exists(f.logPath));
}

UNIT_TEST(ResolutionWorkstationNestedMerge)
{
    MergeFixture f;
    FolderRecord sub{f.small.path + "/sub", 4, 1};
    std::istringstream in("mu\nmd\ns\n");
    std::ostringstream out;
    ResolutionWorkstation station(f.logPath, in, out);
    ASSERT_TRUE(station.resolve(CandidatePair{f.small, sub, 0.5}) == Outcome::Skipped);
    ASSERT_EQ(countOccurrences(out.str(), "Cannot merge folders which contain each other"), size_t(2));
    ASSERT_TRUE(!fs::exists(f.logPath));
    ASSERT_TRUE(station.getResolvedPrefixes().empty());
}

UNIT_TEST(ResolutionWorkstationMergeVanished)
{
    MergeFixture f;
    FolderRecord gone{(f.tmp / "r/gone").string(), 1, 1};
    std::istringstream in("mu\n");
    std::ostringstream out;
    ResolutionWorkstation station(f.logPath, in, out);
    ASSERT_TRUE(station.resolve(CandidatePair{f.big, gone, 0.5}) == Outcome::Skipped);
    ASSERT_TRUE(!fs::exists(f.logPath));
    ASSERT_TRUE(!station.isResolved(gone.path));
}

UNIT_TEST(ResolutionWorkstationCopyKeepsSymlinks)
{
    ScratchDir tmp;
    tmp.addFile("src/file.txt", "src");
    tmp.addFile("outside.txt", "outside");
    tmp.addDir("dst");
    fs::create_symlink(tmp / "outside.txt", tmp / "src/link");
    fs::create_symlink(tmp / "outside.txt", tmp / "dst/file.txt");
    tmp.addFile("src/sub/inner.txt", "inner");
    tmp.addFile("dst/sub", "plain file");

    CopyStats stats = copyTreeOnto(tmp / "src", tmp / "dst");
    ASSERT_TRUE(fs::is_symlink(tmp / "dst/link"));
    // dst/file.txt is a symlink: not written through. dst/sub is a file: src/sub is not copied.
    ASSERT_EQ(stats.conflicts.size(), size_t(2));
    ASSERT_TRUE(std::find(stats.conflicts.begin(), stats.conflicts.end(), (tmp / "dst/sub").string()) != stats.conflicts.end());
    ASSERT_EQ(ut1::readFile((tmp / "outside.txt").string()), "outside");
    ASSERT_TRUE(fs::is_regular_file(tmp / "dst/sub"));
    ASSERT_EQ(ut1::readFile((tmp / "dst/sub").string()), "plain file");
    ASSERT_EQ(stats.dirs, uint64_t(0));
}
