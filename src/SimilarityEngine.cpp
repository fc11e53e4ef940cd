// All-pairs similarity of folder fingerprints.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "SimilarityEngine.hpp"
#include "ProgressTracker.hpp"
#include "MiscUtils.hpp"
#include "UnitTest.hpp"
#include "TestUtils.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <set>
#include <thread>
#include <utility>

double calcSimilarity(const Fingerprint& a, const Fingerprint& b)
{
    size_t total = std::max(a.size(), b.size());
    if (total == 0)
    {
        return 0.0;
    }
    size_t common = 0;
    auto itA = a.begin();
    auto itB = b.begin();
    while (itA != a.end() && itB != b.end())
    {
        if (*itA < *itB)
        {
            ++itA;
        }
        else if (*itB < *itA)
        {
            ++itB;
        }
        else
        {
            common++;
            ++itA;
            ++itB;
        }
    }
    return double(common) / double(total);
}

uint64_t getProgressInterval(uint64_t totalComparisons)
{
    return std::max<uint64_t>(1, totalComparisons / 1000000);
}

namespace
{

/// Forwards to another sink under a mutex. Each distinct warning is forwarded only once.
class SerializedProgress : public ProgressSink
{
public:
    explicit SerializedProgress(ProgressSink& sink_)
        : sink(sink_) {}

    void notify(double fraction, const std::string& label) override
    {
        std::lock_guard<std::mutex> lock(mutex);
        sink.notify(fraction, label);
    }

    void warning(const std::string& message) override
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (reported.insert(message).second)
        {
            sink.warning(message);
        }
    }

private:
    ProgressSink& sink;
    std::mutex mutex;
    std::set<std::string> reported;
};

/// Shared state of one all-pairs comparison run.
class PairComparer
{
public:
    PairComparer(const std::vector<FolderRecord>& folders_, const CompareOptions& options_, ProgressSink& progress_)
        : folders(folders_),
          options(options_),
          progress(progress_),
          totalComparisons(uint64_t(folders_.size()) * (folders_.size() < 2 ? 0 : folders_.size() - 1) / 2),
          interval(getProgressInterval(totalComparisons))
    {
    }

    /// Compare folder i against all folders j > i.
    void compareRow(size_t i, std::vector<CandidatePair>& out)
    {
        const FolderRecord& a = folders[i];
        for (size_t j = i + 1; j < folders.size(); j++)
        {
            const FolderRecord& b = folders[j];
            uint64_t done = completed.fetch_add(1, std::memory_order_relaxed);
            if (done % interval == 0)
            {
                progress.notify(double(done) / double(totalComparisons), a.path + " <-> " + b.path);
            }

            double similarity = 0.0;
            try
            {
                Fingerprint namesA = getFingerprint(a.path, options.depth, progress);
                Fingerprint namesB = getFingerprint(b.path, options.depth, progress);
                similarity = calcSimilarity(namesA, namesB);
            }
            catch (const MissingPathError& e)
            {
                skipped.fetch_add(1, std::memory_order_relaxed);
                progress.warning(std::string(e.what()) + " (skipping its pairs)");
                continue;
            }

            if (similarity * 100.0 >= options.minSimilarity)
            {
                out.push_back(CandidatePair{a, b, similarity});
            }
        }
    }

    /// Process rows handed out through nextRow until all are done.
    void runWorker(std::vector<CandidatePair>& out)
    {
        size_t i;
        while (!failed.load() && (i = nextRow.fetch_add(1)) < folders.size())
        {
            compareRow(i, out);
        }
    }

    const std::vector<FolderRecord>& folders;
    const CompareOptions& options;
    ProgressSink& progress;
    uint64_t totalComparisons;
    uint64_t interval;
    std::atomic<uint64_t> completed{0};
    std::atomic<uint64_t> skipped{0};
    std::atomic<size_t> nextRow{0};
    std::atomic<bool> failed{false};
};

} // namespace

CompareResult findSimilarFolders(const std::vector<FolderRecord>& folders, const CompareOptions& options, ProgressSink& progress)
{
    SerializedProgress serialized(progress);
    PairComparer comparer(folders, options, serialized);
    CompareResult result;

    unsigned numJobs = std::max(1u, options.numJobs);
    if (numJobs == 1 || folders.size() < 3)
    {
        comparer.runWorker(result.pairs);
    }
    else
    {
        std::vector<std::vector<CandidatePair>> locals(numJobs);
        std::vector<std::exception_ptr> errors(numJobs);
        std::vector<std::thread> pool;
        pool.reserve(numJobs);
        for (unsigned t = 0; t < numJobs; t++)
        {
            pool.emplace_back([&comparer, &locals, &errors, t]()
            {
                try
                {
                    comparer.runWorker(locals[t]);
                }
                catch (...)
                {
                    // Rethrown in the calling thread after join().
                    errors[t] = std::current_exception();
                    comparer.failed = true;
                }
            });
        }
        for (auto& thread : pool)
        {
            thread.join();
        }
        for (const auto& error : errors)
        {
            if (error)
            {
                std::rethrow_exception(error);
            }
        }
        for (auto& local : locals)
        {
            result.pairs.insert(result.pairs.end(), std::make_move_iterator(local.begin()), std::make_move_iterator(local.end()));
        }
    }

    result.numComparisons = comparer.completed.load();
    result.numSkipped = comparer.skipped.load();
    return result;
}

UNIT_TEST(SimilarityEngineCalcSimilarity)
{
    Fingerprint a{"x", "y", "z"};
    Fingerprint b{"x", "y", "w"};
    Fingerprint empty;
    ASSERT_TRUE(calcSimilarity(a, b) == 2.0 / 3.0);
    ASSERT_TRUE(calcSimilarity(b, a) == calcSimilarity(a, b));
    ASSERT_TRUE(calcSimilarity(a, a) == 1.0);
    ASSERT_TRUE(calcSimilarity(empty, empty) == 0.0);
    ASSERT_TRUE(calcSimilarity(a, empty) == 0.0);

    // Divided by the larger set: {x} vs {x, y, z, w} is 1/4.
    ASSERT_TRUE(calcSimilarity(Fingerprint{"x"}, Fingerprint{"w", "x", "y", "z"}) == 0.25);
}

UNIT_TEST(SimilarityEngineProgressInterval)
{
    ASSERT_EQ(getProgressInterval(0), uint64_t(1));
    ASSERT_EQ(getProgressInterval(999999), uint64_t(1));
    ASSERT_EQ(getProgressInterval(2000000), uint64_t(2));
    ASSERT_EQ(getProgressInterval(49999999), uint64_t(49));
}

UNIT_TEST(SimilarityEngineFilesScenario)
{
    ScratchDir tmp;
    tmp.addFile("r/a/x");
    tmp.addFile("r/a/y");
    tmp.addFile("r/a/z");
    tmp.addFile("r/b/x");
    tmp.addFile("r/b/y");
    tmp.addFile("r/b/w");
    RecordingProgress progress;
    std::vector<FolderRecord> folders = {{(tmp / "r/a").string(), 0, 3}, {(tmp / "r/b").string(), 0, 3}};

    CompareOptions options;
    options.minSimilarity = 66.0;
    CompareResult result = findSimilarFolders(folders, options, progress);
    ASSERT_EQ(result.numComparisons, uint64_t(1));
    ASSERT_EQ(result.pairs.size(), size_t(1));
    ASSERT_TRUE(result.pairs[0].similarity == 2.0 / 3.0);
    ASSERT_EQ(result.pairs[0].folderA.path, folders[0].path);

    options.minSimilarity = 67.0;
    ASSERT_TRUE(findSimilarFolders(folders, options, progress).pairs.empty());
}

UNIT_TEST(SimilarityEngineDepthScenario)
{
    ScratchDir tmp;
    tmp.addFile("r/a/readme.txt");
    tmp.addFile("r/a/logs/a.txt");
    tmp.addFile("r/b/readme.txt");
    tmp.addFile("r/b/logs/b.txt");
    RecordingProgress progress;
    std::vector<FolderRecord> folders = {{(tmp / "r/a").string(), 0, 2}, {(tmp / "r/b").string(), 0, 2}};

    CompareOptions options;
    options.minSimilarity = 0.0;
    options.depth = 1;
    CompareResult flat = findSimilarFolders(folders, options, progress);
    ASSERT_EQ(flat.pairs.size(), size_t(1));
    ASSERT_TRUE(flat.pairs[0].similarity == 1.0);

    // {logs, logs/a.txt, readme.txt} vs {logs, logs/b.txt, readme.txt}.
    options.depth = 2;
    CompareResult deep = findSimilarFolders(folders, options, progress);
    ASSERT_EQ(deep.pairs.size(), size_t(1));
    ASSERT_TRUE(deep.pairs[0].similarity == 2.0 / 3.0);
    ASSERT_TRUE(deep.pairs[0].similarity < flat.pairs[0].similarity);
}

UNIT_TEST(SimilarityEngineAllPairs)
{
    ScratchDir tmp;
    std::vector<FolderRecord> folders;
    for (int i = 0; i < 7; i++)
    {
        std::string name = "r/d" + ut1::toStr(i);
        tmp.addFile(name + "/common");
        tmp.addFile(name + "/own" + ut1::toStr(i));
        folders.push_back(FolderRecord{(tmp / name).string(), uint64_t(i), 2});
    }
    RecordingProgress progress;
    CompareOptions options;
    options.minSimilarity = 0.0;

    CompareResult result = findSimilarFolders(folders, options, progress);
    ASSERT_EQ(result.numComparisons, uint64_t(7 * 6 / 2));
    ASSERT_EQ(result.pairs.size(), size_t(21));
    // Interval is 1 for small totals: one notification per comparison.
    ASSERT_EQ(progress.notifications.size(), size_t(21));
    std::set<std::pair<std::string, std::string>> seen;
    for (const auto& pair : result.pairs)
    {
        ASSERT_TRUE(pair.folderA.path != pair.folderB.path);
        ASSERT_TRUE(pair.similarity == 0.5);
        ASSERT_TRUE(seen.count({pair.folderB.path, pair.folderA.path}) == 0);
        seen.insert({pair.folderA.path, pair.folderB.path});
    }
    ASSERT_EQ(seen.size(), size_t(21));

    options.numJobs = 4;
    RecordingProgress threadedProgress;
    CompareResult threaded = findSimilarFolders(folders, options, threadedProgress);
    ASSERT_EQ(threaded.numComparisons, uint64_t(21));
    ASSERT_EQ(threaded.pairs.size(), size_t(21));
    ASSERT_EQ(threadedProgress.notifications.size(), size_t(21));
    for (const auto& pair : threaded.pairs)
    {
        ASSERT_TRUE(seen.count({pair.folderA.path, pair.folderB.path}) == 1);
    }
}

UNIT_TEST(SimilarityEngineVanishedFolder)
{
    ScratchDir tmp;
    tmp.addFile("r/a/x");
    tmp.addFile("r/b/x");
    std::vector<FolderRecord> folders = {
        {(tmp / "r/a").string(), 0, 1},
        {(tmp / "r/gone").string(), 0, 1},
        {(tmp / "r/b").string(), 0, 1}};
    RecordingProgress progress;
    CompareOptions options;
    options.minSimilarity = 0.0;

    CompareResult result = findSimilarFolders(folders, options, progress);
    ASSERT_EQ(result.numComparisons, uint64_t(3));
    ASSERT_EQ(result.numSkipped, uint64_t(2));
    ASSERT_EQ(result.pairs.size(), size_t(1));
    ASSERT_TRUE(result.pairs[0].similarity == 1.0);
    // Reported once although two pairs are affected.
    ASSERT_EQ(progress.warnings.size(), size_t(1));
}
