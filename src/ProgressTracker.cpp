// Progress and warning output for long running phases.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "ProgressTracker.hpp"
#include "MiscUtils.hpp"
#include "UnitTest.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>

unsigned clVerbose = 0;

ProgressTracker::ProgressTracker(Mode mode_, size_t maxWidth_, double minInterval_)
    : mode(mode_),
      maxWidth(maxWidth_),
      minInterval(minInterval_)
{
}

void ProgressTracker::startPhase(const std::string& name)
{
    clearLine();
    phase = name;
    lastPrintTime = 0.0;
}

void ProgressTracker::notify(double fraction, const std::string& label)
{
    if (mode == Mode::Silent)
    {
        return;
    }
    if (mode == Mode::Line)
    {
        double now = ut1::getTimeSec();
        if (lastPrintTime != 0.0 && now - lastPrintTime < minInterval)
        {
            return;
        }
        lastPrintTime = now;
    }

    std::ostringstream os;
    os << std::fixed << std::setprecision(2) << (fraction * 100.0) << "%";
    std::string prefix = phase.empty() ? os.str() : phase + " " + os.str();
    size_t used = prefix.size() + 1;
    size_t maxPath = (used >= maxWidth) ? 0 : (maxWidth - used);
    std::string suffix = abbreviatePath(label, maxPath);
    printLine(suffix.empty() ? prefix : prefix + " " + suffix);
}

void ProgressTracker::warning(const std::string& message)
{
    clearLine();
    std::cerr << "Warning: " << message << "\n";
}

void ProgressTracker::finish()
{
    clearLine();
}

std::string ProgressTracker::abbreviatePath(const std::string& path, size_t maxLen)
{
    if (maxLen == 0)
    {
        return std::string();
    }
    if (path.size() <= maxLen)
    {
        return path;
    }
    size_t keep = (maxLen <= 3) ? maxLen : (maxLen - 3);
    size_t start = path.size() - keep;
    // Do not start in the middle of a UTF-8 sequence.
    while (start < path.size() && (static_cast<unsigned char>(path[start]) & 0xc0) == 0x80)
    {
        start++;
    }
    if (maxLen <= 3)
    {
        return path.substr(start);
    }
    return "..." + path.substr(start);
}

void ProgressTracker::printLine(const std::string& text)
{
    std::string line = text;
    if (line.size() > maxWidth)
    {
        line.resize(maxWidth);
    }
    if (mode == Mode::Linefeed)
    {
        std::cout << line << "\n" << std::flush;
        return;
    }
    size_t pad = (lastLineLen > line.size()) ? (lastLineLen - line.size()) : 0;
    std::cout << "\r" << line << std::string(pad, ' ') << "\r" << std::flush;
    lastLineLen = line.size();
}

void ProgressTracker::clearLine()
{
    if (lastLineLen > 0)
    {
        std::cout << "\r" << std::string(lastLineLen, ' ') << "\r" << std::flush;
        lastLineLen = 0;
    }
}

UNIT_TEST(ProgressTrackerAbbreviatePath)
{
    ASSERT_EQ(ProgressTracker::abbreviatePath("/a/b/c", 10), "/a/b/c");
    ASSERT_EQ(ProgressTracker::abbreviatePath("/home/user/photos", 9), ".../photos");
    ASSERT_EQ(ProgressTracker::abbreviatePath("/home/user/photos", 3), "tos");
    ASSERT_EQ(ProgressTracker::abbreviatePath("/home/user/photos", 0), "");
}

UNIT_TEST(ProgressTrackerAbbreviateUtf8)
{
    // "/xy/\xc3\xa4bc" is "/xy/äbc". Cutting inside "ä" skips its continuation byte.
    ASSERT_EQ(ProgressTracker::abbreviatePath("/xy/\xc3\xa4" "bc", 6), "...bc");
    ASSERT_EQ(ProgressTracker::abbreviatePath("/xy/\xc3\xa4" "bc", 7), "...\xc3\xa4" "bc");
}
