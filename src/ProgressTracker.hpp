// Progress and warning output for long running phases.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <string>
#include <cstddef>

/// Verbosity level from the command line (number of -v).
extern unsigned clVerbose;

/// Receiver of progress notifications and non-fatal warnings.
class ProgressSink
{
public:
    virtual ~ProgressSink() = default;

    /// Report progress of the current phase, fraction in [0, 1].
    virtual void notify(double fraction, const std::string& label) = 0;

    /// Report a non-fatal problem.
    virtual void warning(const std::string& message) = 0;
};

/// Terminal progress output.
/// Silent prints nothing, Line overwrites a single line, Linefeed prints one line per notification.
class ProgressTracker : public ProgressSink
{
public:
    enum class Mode
    {
        Silent,
        Line,
        Linefeed
    };

    /// Initialize progress tracking with mode and max line width.
    explicit ProgressTracker(Mode mode_ = Mode::Line, size_t maxWidth_ = 199, double minInterval_ = 0.2);

    /// Start a new phase. The name prefixes all following progress lines.
    void startPhase(const std::string& name);

    void notify(double fraction, const std::string& label) override;
    void warning(const std::string& message) override;

    /// Clear the progress line and finish output.
    void finish();

    /// Abbreviate a path to fit within the given length, keeping the tail.
    static std::string abbreviatePath(const std::string& path, size_t maxLen);

private:
    /// Render one progress line.
    void printLine(const std::string& line);

    /// Remove a pending single-line progress display.
    void clearLine();

    Mode mode = Mode::Line;
    size_t maxWidth = 199;
    double minInterval = 0.2;
    double lastPrintTime = 0.0;
    size_t lastLineLen = 0;
    std::string phase;
};
