// Console report and CSV file output of candidate pairs.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "ResultWriter.hpp"
#include "MiscUtils.hpp"
#include "UnitTest.hpp"
#include "TestUtils.hpp"
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

std::string getLocalTimeStr(const char* format)
{
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    char buf[64];
    size_t len = std::strftime(buf, sizeof(buf), format, &local);
    return std::string(buf, len);
}

fs::path getDefaultOutputPath()
{
    return fs::temp_directory_path() / ("folder_diffs_" + getLocalTimeStr("%Y%m%d-%H%M%S") + ".csv");
}

std::string formatSimilarityPercent(double similarity)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(2) << (similarity * 100.0);
    return os.str();
}

std::string quoteCsvField(const std::string& field)
{
    if (field.find_first_of(",\"\r\n") == std::string::npos)
    {
        return field;
    }
    std::string quoted = "\"";
    for (char c : field)
    {
        if (c == '"')
        {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

bool needsDefaultOutput(size_t numResults, bool interactive, bool forcePrint, bool outputGiven)
{
    if (outputGiven || numResults < kMaxConsoleResults)
    {
        return false;
    }
    return interactive || !forcePrint;
}

void printResults(const std::vector<CandidatePair>& pairs, std::ostream& os)
{
    for (const auto& pair : pairs)
    {
        os << "Similarity: " << formatSimilarityPercent(pair.similarity) << "%, Total Size: " << ut1::getApproxSizeStr(pair.totalSize(), 3, true, false) << "\n";
        os << "  Folder 1: " << pair.folderA.path << "\n";
        os << "  Folder 2: " << pair.folderB.path << "\n";
        os << "\n";
    }
}

std::string formatCsv(const std::vector<CandidatePair>& pairs)
{
    std::string csv = "Similarity,Total Size,Folder 1,Size 1,Folder 2,Size 2\n";
    for (const auto& pair : pairs)
    {
        csv += formatSimilarityPercent(pair.similarity) + ",";
        csv += ut1::toStr(pair.totalSize()) + ",";
        csv += quoteCsvField(pair.folderA.path) + ",";
        csv += ut1::toStr(pair.folderA.byteSize) + ",";
        csv += quoteCsvField(pair.folderB.path) + ",";
        csv += ut1::toStr(pair.folderB.byteSize) + "\n";
    }
    return csv;
}

void saveResults(const std::vector<CandidatePair>& pairs, const fs::path& destination)
{
    fs::path temp = destination;
    temp += ".dirsim_tmp";
    std::error_code ec;
    try
    {
        ut1::writeFile(temp.string(), formatCsv(pairs));
    }
    catch (const std::exception& e)
    {
        fs::remove(temp, ec);
        throw std::runtime_error("Failed to write " + destination.string() + ": " + e.what());
    }
    fs::rename(temp, destination, ec);
    if (ec)
    {
        std::error_code rmEc;
        fs::remove(temp, rmEc);
        throw std::runtime_error("Failed to write " + destination.string() + ": " + ec.message());
    }
}

UNIT_TEST(ResultWriterNeedsDefaultOutput)
{
    ASSERT_TRUE(!needsDefaultOutput(kMaxConsoleResults - 1, false, false, false));
    ASSERT_TRUE(needsDefaultOutput(kMaxConsoleResults, false, false, false));
    ASSERT_TRUE(!needsDefaultOutput(kMaxConsoleResults, false, true, false));
    ASSERT_TRUE(!needsDefaultOutput(500, false, false, true));
    // Interactive sessions never print the list, so a large list is saved even with --print.
    ASSERT_TRUE(needsDefaultOutput(250, true, false, false));
    ASSERT_TRUE(needsDefaultOutput(250, true, true, false));
    ASSERT_TRUE(!needsDefaultOutput(250, true, false, true));
    ASSERT_TRUE(!needsDefaultOutput(10, true, false, false));
}

UNIT_TEST(ResultWriterCsv)
{
    std::vector<CandidatePair> pairs = {
        CandidatePair{FolderRecord{"/r/a", 100, 3}, FolderRecord{"/r/b,c", 50, 3}, 2.0 / 3.0}};
    ASSERT_EQ(formatCsv(pairs),
        "Similarity,Total Size,Folder 1,Size 1,Folder 2,Size 2\n"
        "66.67,150,/r/a,100,\"/r/b,c\",50\n");
    ASSERT_EQ(quoteCsvField("say \"hi\""), "\"say \"\"hi\"\"\"");
    ASSERT_EQ(quoteCsvField("/plain/path"), "/plain/path");
}

UNIT_TEST(ResultWriterSaveResults)
{
    ScratchDir tmp;
    std::vector<CandidatePair> pairs = {
        CandidatePair{FolderRecord{"/r/a", 1, 1}, FolderRecord{"/r/b", 2, 1}, 1.0}};
    fs::path dest = tmp / "out.csv";
    saveResults(pairs, dest);
    ASSERT_EQ(ut1::readFile(dest.string()), formatCsv(pairs));
    ASSERT_TRUE(!fs::exists(tmp / "out.csv.dirsim_tmp"));

    // Unwritable destination: error, and no file left behind.
    bool thrown = false;
    try
    {
        saveResults(pairs, tmp / "missing-dir/out.csv");
    }
    catch (const std::runtime_error&)
    {
        thrown = true;
    }
    ASSERT_TRUE(thrown);
    ASSERT_TRUE(!fs::exists(tmp / "missing-dir"));
}
