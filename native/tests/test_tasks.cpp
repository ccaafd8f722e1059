#include <vector>

#include <gtest/gtest.h>

#include "tasks.h"
#include "config_error.h"

static Platform one_accelerator_per_task(unsigned int num_tasks)
{
    Platform p;
    p.add_interconnect();
    for (unsigned int i = 0; i < num_tasks; i++)
        p.add_accelerator(0);
    return p;
}

TEST(Task, ImplicitDeadline)
{
    Task t(2, 10);
    EXPECT_EQ(10UL, t.get_deadline());
    EXPECT_TRUE(t.has_implicit_deadline());
    EXPECT_TRUE(t.has_constrained_deadline());
    EXPECT_FALSE(t.uses_bus());
}

TEST(Task, MaxJobsCountsCarryIn)
{
    Task t(2, 10);
    EXPECT_EQ(1UL, t.max_jobs_in(0));
    EXPECT_EQ(2UL, t.max_jobs_in(1));
    EXPECT_EQ(3UL, t.max_jobs_in(20));
    EXPECT_EQ(4UL, t.max_jobs_in(25));
}

TEST(Task, Utilization)
{
    Task t(1, 10, 0, 0, 3, 2, 1);
    fractional_t u, cu;
    t.get_utilization(u);
    t.get_cpu_utilization(cu);

    fractional_t expected = 4;
    expected /= 10;
    EXPECT_EQ(expected, u);
    EXPECT_TRUE(cu * 10 == 1);
    EXPECT_EQ(4UL, t.get_wcet());
    EXPECT_EQ(3U, t.get_num_transactions());
}

TEST(TaskSet, DeadlineMonotonicPriorities)
{
    TaskSet ts(one_accelerator_per_task(4));
    ts.add_task(1, 30, 0, 0);
    ts.add_task(1, 40, 10, 1);
    ts.add_task(1, 20, 0, 2);
    ts.add_task(1, 10, 0, 3);
    ts.assign_deadline_monotonic_priorities();

    // equal deadlines are ordered by index
    EXPECT_EQ(0U, ts[1].get_priority());
    EXPECT_EQ(1U, ts[3].get_priority());
    EXPECT_EQ(2U, ts[2].get_priority());
    EXPECT_EQ(3U, ts[0].get_priority());

    std::vector<unsigned int> order = ts.get_priority_order();
    ASSERT_EQ(4U, order.size());
    EXPECT_EQ(1U, order[0]);
    EXPECT_EQ(3U, order[1]);
    EXPECT_EQ(2U, order[2]);
    EXPECT_EQ(0U, order[3]);

    EXPECT_TRUE(ts.has_unique_priorities());
    EXPECT_NO_THROW(ts.validate());
}

TEST(TaskSet, IsolatedTransferTime)
{
    TaskSet ts(one_accelerator_per_task(1));
    ts.add_task(1, 1000, 0, 0, 10, 2, 1);

    EXPECT_EQ(2UL * 62 + 72, ts.get_isolated_transfer_time(0));
}

TEST(TaskSet, GroupsTasksByAcceleratorAndInterconnect)
{
    Platform p;
    p.add_interconnect();
    p.add_interconnect();
    p.add_accelerator(0);
    p.add_accelerator(1);
    p.add_accelerator(1);

    TaskSet ts(p);
    ts.add_task(1, 10, 0, 0);
    ts.add_task(1, 20, 0, 1);
    ts.add_task(1, 30, 0, 2);

    EXPECT_EQ(1U, ts.get_interconnect_of(2));
    EXPECT_EQ(1U, ts.get_tasks_of_accelerator(0).size());
    EXPECT_EQ(2U, ts.get_tasks_of_accelerator(2)[0]);
    EXPECT_EQ(2U, ts.get_tasks_on_interconnect(1).size());
}

class TaskSetValidation : public ::testing::Test
{
  protected:
    TaskSet ts;

    void SetUp()
    {
        ts = TaskSet(one_accelerator_per_task(2));
        ts.add_task(2, 10, 0, 0, 0, 1, 0);
        ts.add_task(4, 20, 0, 1, 0, 1, 0);
        ts.assign_deadline_monotonic_priorities();
    }
};

TEST_F(TaskSetValidation, AcceptsWellFormedSet)
{
    EXPECT_NO_THROW(ts.validate());
}

TEST_F(TaskSetValidation, RejectsZeroPeriod)
{
    ts[0] = Task(2, 0, 5, 0, 0, 1, 0, 0);
    EXPECT_THROW(ts.validate(), ConfigurationError);
}

TEST_F(TaskSetValidation, RejectsDeadlineBeyondPeriod)
{
    ts[1] = Task(4, 20, 30, 1, 0, 1, 0, 1);
    EXPECT_THROW(ts.validate(), ConfigurationError);
}

TEST_F(TaskSetValidation, RejectsUnknownAccelerator)
{
    ts[1] = Task(4, 20, 0, 7, 0, 1, 0, 1);
    EXPECT_THROW(ts.validate(), ConfigurationError);
}

TEST_F(TaskSetValidation, RejectsMissingPriority)
{
    ts[1].set_priority(NO_PRIORITY);
    EXPECT_THROW(ts.validate(), ConfigurationError);
}

TEST_F(TaskSetValidation, RejectsDuplicatePriorities)
{
    ts[1].set_priority(0);
    EXPECT_THROW(ts.validate(), ConfigurationError);
}

TEST_F(TaskSetValidation, RejectsMoreInterconnectsThanTasks)
{
    ts.get_platform().add_interconnect();
    ts.get_platform().add_interconnect();
    EXPECT_THROW(ts.validate(), ConfigurationError);
}

TEST_F(TaskSetValidation, RejectsUnmappedAccelerator)
{
    Platform p;
    p.add_interconnect();
    p.add_accelerator(0);
    p.add_accelerator(NO_INTERCONNECT);

    TaskSet bad(p);
    bad.add_task(2, 10, 0, 0);
    bad.add_task(2, 10, 0, 1);
    bad.assign_deadline_monotonic_priorities();
    EXPECT_THROW(bad.validate(), ConfigurationError);
}

TEST_F(TaskSetValidation, RejectsSharedAccelerator)
{
    // two jobs needing 60 cycles each of one accelerator within 100 cycles
    Platform p;
    p.add_interconnect();
    p.add_accelerator(0);

    TaskSet shared(p);
    shared.add_task(1, 100, 0, 0, 60, 1, 1);
    shared.add_task(1, 100, 0, 0, 60, 1, 1);
    shared.assign_deadline_monotonic_priorities();
    EXPECT_THROW(shared.validate(), ConfigurationError);

    ts[1] = Task(4, 20, 0, 0, 0, 1, 0, 1);
    EXPECT_THROW(ts.validate(), ConfigurationError);
}
