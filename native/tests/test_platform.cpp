#include <gtest/gtest.h>

#include "platform.h"
#include "config_error.h"

TEST(Platform, DefaultBurstLatencies)
{
    Platform p;
    p.add_interconnect();
    p.add_accelerator(0);

    // t_hold_addr + d_addr + d_ps_read + d_data + burst
    EXPECT_EQ(62UL, p.read_latency(0));
    // t_hold_addr + d_addr + burst * t_hold_data + d_ps_write + d_data + d_bresp
    EXPECT_EQ(72UL, p.write_latency(0));
}

TEST(Platform, CustomTimings)
{
    Platform p(1, 2);
    p.add_interconnect(Interconnect(0, 1, 0, 0, 3, 0, 2, 0));
    p.add_accelerator(0, 6, 4);

    EXPECT_EQ(1UL + 4, p.read_latency(0));
    EXPECT_EQ(4UL * 2 + 2 + 3, p.write_latency(0));
}

TEST(Platform, CountsAttachedAccelerators)
{
    Platform p;
    EXPECT_EQ(0U, p.add_interconnect());
    EXPECT_EQ(1U, p.add_interconnect());
    EXPECT_EQ(0U, p.add_accelerator(0));
    EXPECT_EQ(1U, p.add_accelerator(1));
    EXPECT_EQ(2U, p.add_accelerator(1));

    EXPECT_EQ(1U, p.count_accelerators_on(0));
    EXPECT_EQ(2U, p.count_accelerators_on(1));
    EXPECT_NO_THROW(p.validate());
}

TEST(Platform, RejectsUnmappedAccelerator)
{
    Platform p;
    p.add_interconnect();
    p.add_accelerator(NO_INTERCONNECT);
    EXPECT_THROW(p.validate(), ConfigurationError);
}

TEST(Platform, RejectsUnknownInterconnect)
{
    Platform p;
    p.add_interconnect();
    p.add_accelerator(1);
    EXPECT_THROW(p.validate(), ConfigurationError);
}

TEST(Platform, RejectsZeroGrantBudgets)
{
    Platform p;
    p.add_interconnect(0);
    p.add_accelerator(0);
    EXPECT_THROW(p.validate(), ConfigurationError);

    Platform q;
    q.add_interconnect();
    q.add_accelerator(0, 0);
    EXPECT_THROW(q.validate(), ConfigurationError);
}

TEST(Platform, RejectsMisnumberedInterconnect)
{
    Platform p;
    p.add_interconnect(Interconnect(3));
    EXPECT_THROW(p.validate(), ConfigurationError);
}
