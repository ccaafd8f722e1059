#include <atomic>
#include <stdexcept>
#include <vector>

#include <gtest/gtest.h>

#include "worker_pool.h"

TEST(JobQueue, HandsOutEveryJobOnce)
{
    JobQueue<unsigned long> jobs;
    for (unsigned long i = 0; i < 1000; i++)
        jobs.push(i);

    std::vector<unsigned long> sums(4, 0);
    run_workers(4, [&](unsigned int w) {
        unsigned long job;
        while (jobs.pop(job))
            sums[w] += job;
    });

    unsigned long total = 0;
    for (unsigned int w = 0; w < sums.size(); w++)
        total += sums[w];
    EXPECT_EQ(999UL * 1000UL / 2, total);

    unsigned long job;
    EXPECT_FALSE(jobs.pop(job));
}

TEST(RunWorkers, SingleWorkerRunsInline)
{
    unsigned int calls = 0;
    run_workers(1, [&](unsigned int w) {
        EXPECT_EQ(0U, w);
        calls++;
    });
    EXPECT_EQ(1U, calls);
}

TEST(RunWorkers, RethrowsAfterAllWorkersFinish)
{
    std::atomic<unsigned int> finished(0);

    EXPECT_THROW(
        run_workers(4, [&](unsigned int w) {
            if (w == 2)
                throw std::runtime_error("worker failed");
            finished++;
        }),
        std::runtime_error);

    // the other workers were joined, not abandoned
    EXPECT_EQ(3U, finished.load());
}

TEST(RunWorkers, InlineWorkerExceptionPropagates)
{
    EXPECT_THROW(
        run_workers(0, [](unsigned int) {
            throw std::logic_error("inline");
        }),
        std::logic_error);
}
