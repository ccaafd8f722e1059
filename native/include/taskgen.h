#ifndef TASKGEN_H
#define TASKGEN_H

#include <vector>
#include <random>

#include "tasks.h"

typedef std::mt19937_64 RandomEngine;

/* Knobs of the random task-set generator. */
struct GeneratorParams
{
    double utilization;     // total, split with RandFixedSum
    cycles_t period_min;
    cycles_t period_max;    // periods are log-uniform in [min, max]
    double cpu_share;       // fraction of each budget spent on the CPU
    double access_density;  // fraction of the transactions that would fit
    cycles_t trans_time;    // nominal duration of one transaction
    double rw_ratio;        // share of reads; < 0 => uniform in [0.4, 0.6]

    GeneratorParams()
        : utilization(0.6),
          period_min(ms_to_cycles(10)),
          period_max(ms_to_cycles(100)),
          cpu_share(0.4),
          access_density(0.5),
          trans_time(T_TRANS),
          rw_ratio(-1)
    {}

    // throws ConfigurationError
    void validate(unsigned int num_tasks) const;
};

/* Stafford's RandFixedSum: n values in [0, 1], uniformly distributed on
 * the simplex of vectors summing to 'total' (0 < total < n), in random
 * order. */
std::vector<double> randfixedsum(unsigned int n, double total,
                                 RandomEngine &rng);

/* Log-uniform period, truncated to whole cycles. */
cycles_t log_uniform_period(cycles_t min, cycles_t max, RandomEngine &rng);

/* Random task set of 'num_tasks' tasks, one accelerator per task, spread
 * evenly over 'num_inters' interconnects, with deadline-monotonic
 * priorities. Only the platform depends on 'num_inters'; the tasks drawn
 * for a given random state are the same for every interconnect count. */
TaskSet generate_task_set(unsigned int num_tasks,
                          unsigned int num_inters,
                          RandomEngine &rng,
                          const GeneratorParams &params = GeneratorParams());

TaskSet generate_task_set(unsigned int num_tasks,
                          unsigned int num_inters,
                          unsigned long seed,
                          const GeneratorParams &params = GeneratorParams());

// interconnect of the idx-th accelerator out of 'num_accels'
static inline unsigned int balanced_interconnect(unsigned int idx,
                                                 unsigned int num_accels,
                                                 unsigned int num_inters)
{
    return (unsigned long) idx * num_inters / num_accels;
}

#endif
