// dirsim - Find similar directory trees
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "MiscUtils.hpp"
#include "UnitTest.hpp"
#include "CommandLineParser.hpp"
#include "FolderScanner.hpp"
#include "SimilarityEngine.hpp"
#include "ResultRanker.hpp"
#include "ResultWriter.hpp"
#include "ResolutionWorkstation.hpp"
#include "ProgressTracker.hpp"
#include <exception>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <thread>
#include <vector>
#include <filesystem>
#include <algorithm>
#include <cstdint>

namespace fs = std::filesystem;

struct StatLine
{
    std::string label;
    std::string value;
};

/// Return decimal position for stat values with optional suffix.
static size_t getStatDecimalPos(const std::string& value)
{
    size_t end = value.find(' ');
    std::string_view number = (end == std::string::npos)
        ? std::string_view(value)
        : std::string_view(value).substr(0, end);
    size_t pos = number.find('.');
    return (pos == std::string::npos) ? number.size() : pos;
}

/// Print aligned statistics lines.
static void printStatList(const std::vector<StatLine>& lines)
{
    size_t labelWidth = 0;
    size_t maxDecimalPos = 0;
    for (const auto& line : lines)
    {
        labelWidth = std::max(labelWidth, line.label.size());
        maxDecimalPos = std::max(maxDecimalPos, getStatDecimalPos(line.value));
    }
    for (const auto& line : lines)
    {
        size_t padding = maxDecimalPos - getStatDecimalPos(line.value);
        std::cout << line.label << std::string(labelWidth - line.label.size(), ' ') << " " << std::string(padding, ' ') << line.value << "\n";
    }
}

/// Parse a percentage in the range 0..100.
static double parsePercent(const std::string& s)
{
    std::istringstream is(s);
    double value = 0.0;
    is >> value;
    if (!is || !is.eof() || value < 0.0 || value > 100.0)
    {
        throw ConfigurationError("Invalid percentage '" + s + "' (expected a number from 0 to 100).");
    }
    return value;
}

/// Main.
/// Entry point for dirsim.
int main(int argc, char *argv[])
{
    // Run unit tests and exit if enabled at compile time.
    UNIT_TEST_RUN();

    // Command line options.
    const char *usage = "Find similar directory trees.\n"
                        "\n"
                        "Usage: $programName [OPTIONS] DIR...\n"
                        "\n"
                        "Compares the entry names of all dirs below DIR... with each other and reports\n"
                        "pairs of similar dirs, most similar first. File contents are not compared.\n"
                        "With --interactive each pair can be merged or marked for deletion. Nothing is ever\n"
                        "deleted: folders to delete are appended to a log file for review.\n"
                        "\n"
                        "All sizes may be specified with kMGTPE suffixes indicating powers of 1024.";
    ut1::CommandLineParser cl("dirsim", usage,
        "\n$programName version $version *** Copyright (c) 2026 Johannes Overmann",
        "0.1.0");

    cl.addHeader("\nOptions:\n");
    cl.addOption(' ', "min-size", "Minimum folder size.", "N", "0");
    cl.addOption(' ', "max-size", "Maximum folder size (0 = unlimited).", "N", "0");
    cl.addOption('f', "min-files", "Minimum number of files/folders (within --depth) in folders.", "N", "1");
    cl.addOption('s', "min-similarity", "Minimum similarity percentage (0-100).", "P", "50");
    cl.addOption('D', "depth", "Compare entry names up to this many levels deep (1 = only direct entries).", "N", "1");
    cl.addOption('S', "sort", "Sort results by MODE: similarity, size or name.", "MODE", "similarity");
    cl.addOption('o', "output", "Save results as CSV to FILE. Default when there are too many results to print: folder_diffs_<date>-<time>.csv in the temp dir.", "FILE", "");
    cl.addOption('p', "print", "Print results to console even if there are many.");
    cl.addOption('i', "interactive", "Resolve similar folders one by one: merge them or mark one for deletion.");
    cl.addOption(' ', "delete-log", "Append folders marked for deletion to FILE. Default: dirsim_delete_<date>.txt in the temp dir.", "FILE", "");
    cl.addOption('j', "jobs", "Number of threads used for comparing (0 = number of CPUs).", "N", "1");
    cl.addOption('W', "width", "Max width for progress line.", "N", "199");
    cl.addOption(' ', "silent", "Do not print progress (faster for huge trees).");
    cl.addOption('v', "verbose", "Print progress lines and statistics. Specify twice to also list all folders.");

    // Parse command line options.
    cl.parse(argc, argv);
    clVerbose = cl.getCount("verbose");
    if (cl("silent") && clVerbose)
    {
        cl.error("Cannot combine --silent with --verbose.");
    }
    ProgressTracker::Mode progressMode = ProgressTracker::Mode::Line;
    if (cl("silent"))
    {
        progressMode = ProgressTracker::Mode::Silent;
    }
    else if (clVerbose)
    {
        progressMode = ProgressTracker::Mode::Linefeed;
    }
    ProgressTracker progress(progressMode, cl.getUInt("width"));

    try
    {
        if (cl.getArgs().empty())
        {
            cl.error("Please specify at least one directory.");
        }

        // Check all args to avoid late errors.
        std::vector<fs::path> roots;
        for (const std::string& path : cl.getArgs())
        {
            if (!ut1::fsExists(path))
            {
                cl.error("Path '" + path + "' does not exist.");
            }
            if (!ut1::fsIsDirectory(path))
            {
                cl.error("Path '" + path + "' is not a directory.");
            }
            roots.push_back(normalizePath(path));
        }
        checkRootsDisjoint(roots);

        ScanOptions scanOptions;
        scanOptions.minSize = ut1::strToU64(cl.getStr("min-size"));
        if (cl.getStr("max-size") != "0")
        {
            scanOptions.maxSize = ut1::strToU64(cl.getStr("max-size"));
        }
        if (scanOptions.minSize > scanOptions.maxSize)
        {
            cl.error("--min-size must not be greater than --max-size.");
        }
        scanOptions.minEntries = cl.getUInt("min-files");
        scanOptions.depth = cl.getUInt("depth");
        if (scanOptions.depth == 0)
        {
            cl.error("--depth must be at least 1.");
        }

        CompareOptions compareOptions;
        compareOptions.minSimilarity = parsePercent(cl.getStr("min-similarity"));
        compareOptions.depth = scanOptions.depth;
        compareOptions.numJobs = cl.getUInt("jobs");
        if (compareOptions.numJobs == 0)
        {
            compareOptions.numJobs = std::max(1u, std::thread::hardware_concurrency());
        }
        SortMode sortMode = parseSortMode(cl.getStr("sort"));

        // Collect all folders that meet the size and entry count criteria.
        double start = ut1::getTimeSec();
        progress.startPhase("Gathering folders...");
        std::vector<FolderRecord> folders = scanFolders(roots, scanOptions, progress);
        progress.finish();
        double scanSeconds = ut1::getTimeSec() - start;

        uint64_t numFolders = folders.size();
        uint64_t totalComparisons = (numFolders < 2) ? 0 : (numFolders * (numFolders - 1) / 2);
        if (clVerbose > 1)
        {
            for (const auto& folder : folders)
            {
                std::cout << std::setw(10) << ut1::getApproxSizeStr(folder.byteSize, 3, true, false) << " "
                          << std::setw(6) << folder.numEntries << " " << folder.path << "\n";
            }
        }
        if (!cl("silent"))
        {
            std::cout << totalComparisons << " directories to be compared\n";
        }

        // Compare all folders against all folders.
        start = ut1::getTimeSec();
        progress.startPhase("Comparing...");
        CompareResult result = findSimilarFolders(folders, compareOptions, progress);
        progress.finish();
        double compareSeconds = ut1::getTimeSec() - start;

        rankCandidates(result.pairs, sortMode);

        if (clVerbose)
        {
            std::vector<StatLine> stats = {
                {"folders:", ut1::toStr(numFolders)},
                {"comparisons:", ut1::toStr(result.numComparisons)},
                {"skipped-comparisons:", ut1::toStr(result.numSkipped)},
                {"similar-pairs:", ut1::toStr(result.pairs.size())},
                {"scan-time:", ut1::secondsToString(scanSeconds)},
                {"compare-time:", ut1::secondsToString(compareSeconds)}
            };
            printStatList(stats);
        }

        if (cl("output"))
        {
            fs::path outputFile = cl.getStr("output");
            saveResults(result.pairs, outputFile);
            std::cout << "Results saved to: " << outputFile.string() << "\n";
        }
        else if (needsDefaultOutput(result.pairs.size(), cl("interactive"), cl("print"), false))
        {
            if (!cl("interactive"))
            {
                std::cout << "Too many results to print to stdout.\n";
                std::cout << "Use `-p` to force print it if wanted\n";
            }
            fs::path outputFile = getDefaultOutputPath();
            saveResults(result.pairs, outputFile);
            std::cout << "Results saved to: " << outputFile.string() << "\n";
        }

        if (cl("interactive"))
        {
            if (result.pairs.empty())
            {
                std::cout << "No similar folders found.\n";
                return 0;
            }
            fs::path logPath = cl("delete-log") ? fs::path(cl.getStr("delete-log")) : ResolutionWorkstation::getDefaultLogPath();
            ResolutionWorkstation station(normalizePath(logPath), std::cin, std::cout);
            ResolutionWorkstation::Stats stats = station.run(result.pairs);
            std::cout << "\nmerged: " << stats.merged
                      << ", marked-for-deletion: " << stats.merged + stats.deleted
                      << ", skipped: " << stats.skipped
                      << (stats.quit ? " (quit)" : "") << "\n";
            if (stats.merged + stats.deleted > 0)
            {
                std::cout << "Folders to delete are listed in " << station.getLogPath().string() << "\n";
            }
        }
        else if (result.pairs.size() < kMaxConsoleResults || cl("print"))
        {
            printResults(result.pairs, std::cout);
        }

        if (clVerbose)
        {
            std::cout << "Done.\n";
        }
    }
    catch (const std::exception& e)
    {
        progress.finish();
        cl.error(e.what());
    }

    return 0;
}
