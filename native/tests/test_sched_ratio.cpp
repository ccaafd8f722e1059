#include <vector>
#include <sstream>

#include <gtest/gtest.h>

#include "config_error.h"
#include "sched_ratio.h"

#include "helpers.h"

TEST(LoadSamples, EvenlySpacedOverUnitInterval)
{
    std::vector<fractional_t> loads = load_samples(5);
    ASSERT_EQ(5U, loads.size());
    EXPECT_EQ(fractional_t(0), loads[0]);
    EXPECT_EQ(frac(1, 4), loads[1]);
    EXPECT_EQ(frac(1, 2), loads[2]);
    EXPECT_EQ(frac(3, 4), loads[3]);
    EXPECT_EQ(fractional_t(1), loads[4]);

    loads = load_samples(1);
    ASSERT_EQ(1U, loads.size());
    EXPECT_EQ(fractional_t(0), loads[0]);
}

TEST(SchedulabilityCurve, WritesCsv)
{
    std::vector<fractional_t> loads;
    loads.push_back(0);
    loads.push_back(frac(1, 2));

    SchedulabilityCurve curve(loads, 4);
    std::vector<unsigned long> counts;
    counts.push_back(3);
    counts.push_back(1);
    curve.add_counts(counts);
    counts[0] = 1;
    counts[1] = 0;
    curve.add_counts(counts);

    std::ostringstream out;
    curve.write_csv(out);
    EXPECT_EQ("0.00000,1.00000\n0.50000,0.25000\n", out.str());
    EXPECT_DOUBLE_EQ(0.25, curve.get_ratio(1));
}

TEST(TrialEngine, DependsOnSeedAndTrial)
{
    RandomEngine a = trial_engine(100, 3);
    RandomEngine b = trial_engine(100, 3);
    RandomEngine c = trial_engine(100, 4);
    RandomEngine d = trial_engine(101, 3);

    unsigned long va = a();
    EXPECT_EQ(va, b());
    EXPECT_NE(va, c());
    EXPECT_NE(va, d());
}

static SweepConfig workers(unsigned int n)
{
    SweepConfig config;
    config.workers = n;
    return config;
}

class Sweep : public ::testing::Test
{
  protected:
    std::vector<fractional_t> loads;

    void SetUp()
    {
        loads = load_samples(11);
    }
};

TEST_F(Sweep, RatiosAreBoundedAndNonIncreasing)
{
    SchedulabilityCurve curve = schedulability_ratio(8, 2, loads, 40, 100,
                                                     workers(2));
    ASSERT_EQ(loads.size(), curve.size());

    for (unsigned int i = 0; i < curve.size(); i++)
    {
        EXPECT_EQ(40UL, curve[i].trials);
        EXPECT_LE(curve[i].schedulable, curve[i].trials);
        EXPECT_GE(curve.get_ratio(i), 0.0);
        EXPECT_LE(curve.get_ratio(i), 1.0);
        if (i > 0)
            EXPECT_LE(curve[i].schedulable, curve[i - 1].schedulable);
    }

    EXPECT_GE(curve.get_ratio(0), curve.get_ratio(curve.size() - 1));
}

TEST_F(Sweep, MoreInterconnectsNeverHurt)
{
    SchedulabilityCurve m1 = schedulability_ratio(8, 1, loads, 50, 100,
                                                  workers(2));
    SchedulabilityCurve m4 = schedulability_ratio(8, 4, loads, 50, 100,
                                                  workers(2));

    for (unsigned int i = 0; i < loads.size(); i++)
        EXPECT_GE(m4[i].schedulable, m1[i].schedulable) << "at sample " << i;
}

TEST_F(Sweep, IndependentOfWorkerCount)
{
    SchedulabilityCurve one = schedulability_ratio(8, 2, loads, 30, 7,
                                                   workers(1));
    SchedulabilityCurve many = schedulability_ratio(8, 2, loads, 30, 7,
                                                    workers(4));

    for (unsigned int i = 0; i < loads.size(); i++)
        EXPECT_EQ(one[i].schedulable, many[i].schedulable);
}

TEST_F(Sweep, IndependentOfSampleOrder)
{
    std::vector<fractional_t> reversed(loads.rbegin(), loads.rend());

    SchedulabilityCurve fwd = schedulability_ratio(4, 2, loads, 30, 3,
                                                   workers(1));
    SchedulabilityCurve bwd = schedulability_ratio(4, 2, reversed, 30, 3,
                                                   workers(1));

    for (unsigned int i = 0; i < loads.size(); i++)
    {
        EXPECT_EQ(fwd[i].load, bwd[loads.size() - 1 - i].load);
        EXPECT_EQ(fwd[i].schedulable, bwd[loads.size() - 1 - i].schedulable);
    }
}

TEST_F(Sweep, LightLoadIsMostlySchedulable)
{
    GeneratorParams gen;
    gen.utilization = 0.05;
    gen.access_density = 0.1;

    SweepConfig config = workers(2);
    config.generator = gen;

    std::vector<fractional_t> none;
    none.push_back(0);

    SchedulabilityCurve curve = schedulability_ratio(4, 2, none, 20, 1,
                                                     config);
    EXPECT_EQ(20UL, curve[0].schedulable);
}

TEST_F(Sweep, RejectsBadConfiguration)
{
    EXPECT_THROW(schedulability_ratio(4, 5, loads, 10, 1), ConfigurationError);
    EXPECT_THROW(schedulability_ratio(4, 0, loads, 10, 1), ConfigurationError);
    EXPECT_THROW(schedulability_ratio(4, 2, loads, 0, 1), ConfigurationError);

    loads.push_back(frac(3, 2));
    EXPECT_THROW(schedulability_ratio(4, 2, loads, 10, 1), ConfigurationError);
}
