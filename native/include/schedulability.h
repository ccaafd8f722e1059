#ifndef SCHEDULABILITY_H
#define SCHEDULABILITY_H

#include "tasks.h"

class SchedulabilityTest
{
  public:
    /* bus_load is the fraction of the shared-bus bandwidth taken by
     * background traffic, in [0, 1]. Malformed input raises
     * ConfigurationError when check_preconditions is set. */
    virtual bool is_schedulable(const TaskSet &ts,
                                const fractional_t &bus_load,
                                bool check_preconditions = true) = 0;

    virtual ~SchedulabilityTest() {};
};

// throws ConfigurationError unless 0 <= bus_load <= 1
void check_bus_load(const fractional_t &bus_load);

#endif
