#include <gtest/gtest.h>

#include "cpu_time.h"

TEST(CPUClock, AccumulatesIntervals)
{
    CPUClock clock("spin");
    volatile unsigned long sink = 0;

    for (unsigned int round = 0; round < 2; round++)
    {
        clock.start();
        for (unsigned long i = 0; i < 1000000; i++)
            sink += i;
        clock.stop();
    }

    EXPECT_EQ(2.0, clock.get_count());
    EXPECT_GE(clock.get_last(), 0.0);
    EXPECT_GE(clock.get_total(), clock.get_last());
    EXPECT_GE(clock.get_total_wall(), clock.get_last_wall());
}

TEST(CPUTime, ClocksDoNotGoBackwards)
{
    double wall = get_wall_time();
    double cpu = get_cpu_usage();

    EXPECT_LE(wall, get_wall_time());
    EXPECT_LE(cpu, get_cpu_usage());
}
