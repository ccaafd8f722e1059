#ifndef TASKS_H
#define TASKS_H

#include <vector>
#include <algorithm>

#include <limits.h>

#include "time-types.h"
#include "platform.h"

#define NO_PRIORITY UINT_MAX

/* A sporadic task that runs a CPU portion and then offloads to its
 * accelerator, which issues AXI read and write bursts over the shared bus. */
class Task
{
  private:
    cycles_t period;
    cycles_t deadline;
    cycles_t cpu_wcet;
    cycles_t accel_wcet;
    unsigned int num_reads;
    unsigned int num_writes;
    unsigned int accelerator;
    unsigned int priority; /* lower number => higher priority */

  public:

    /* construction and initialization */
    void init(
        cycles_t cpu_wcet,
        cycles_t period,
        cycles_t deadline = 0,
        unsigned int accelerator = 0,
        cycles_t accel_wcet = 0,
        unsigned int num_reads = 0,
        unsigned int num_writes = 0,
        unsigned int priority = NO_PRIORITY
    );
    Task(cycles_t cpu_wcet = 0,
         cycles_t period = 0,
         cycles_t deadline = 0,
         unsigned int accelerator = 0,
         cycles_t accel_wcet = 0,
         unsigned int num_reads = 0,
         unsigned int num_writes = 0,
         unsigned int priority = NO_PRIORITY)
    {
        init(cpu_wcet, period, deadline, accelerator, accel_wcet,
             num_reads, num_writes, priority);
    }

    /* getter / setter */
    cycles_t get_period() const   { return period; }
    cycles_t get_deadline() const { return deadline; }
    cycles_t get_cpu_wcet() const { return cpu_wcet; }
    cycles_t get_accel_wcet() const { return accel_wcet; }
    unsigned int get_num_reads() const { return num_reads; }
    unsigned int get_num_writes() const { return num_writes; }
    unsigned int get_accelerator() const { return accelerator; }
    unsigned int get_priority() const { return priority; }

    void set_priority(unsigned int prio) { priority = prio; }

    unsigned int get_num_transactions() const
    {
        return num_reads + num_writes;
    }

    /* properties */

    bool uses_bus() const
    {
        return get_num_transactions() > 0;
    }

    bool has_implicit_deadline() const
    {
        return deadline == period;
    }

    bool has_constrained_deadline() const
    {
        return deadline <= period;
    }

    // total execution budget, not counting bus transactions
    cycles_t get_wcet() const
    {
        return cpu_wcet + accel_wcet;
    }

    void get_utilization(fractional_t &util) const;
    void get_cpu_utilization(fractional_t &util) const;

    /* Maximum number of jobs that can overlap an interval of the given
     * length, counting one carry-in job. */
    unsigned long max_jobs_in(cycles_t interval) const;
};

typedef std::vector<Task> Tasks;

/* Tasks plus the platform they are mapped to. Once built, a task set is only
 * read by the analysis. Task ids are their indices. */
class TaskSet
{
  private:
    Tasks tasks;
    Platform platform;

  public:
    TaskSet();
    TaskSet(const Platform &platform);
    TaskSet(const TaskSet &original);
    virtual ~TaskSet();

    unsigned int add_task(cycles_t cpu_wcet, cycles_t period,
                          cycles_t deadline = 0,
                          unsigned int accelerator = 0,
                          cycles_t accel_wcet = 0,
                          unsigned int num_reads = 0,
                          unsigned int num_writes = 0,
                          unsigned int priority = NO_PRIORITY)
    {
        tasks.push_back(Task(cpu_wcet, period, deadline, accelerator,
                             accel_wcet, num_reads, num_writes, priority));
        return tasks.size() - 1;
    }

    unsigned int get_task_count() const { return tasks.size(); }

    Task& operator[](int idx) { return tasks[idx]; }

    const Task& operator[](int idx) const { return tasks[idx]; }

    Platform& get_platform() { return platform; }
    const Platform& get_platform() const { return platform; }

    unsigned int get_interconnect_of(unsigned int idx) const
    {
        return platform.get_accelerator(tasks[idx].get_accelerator())
            .get_interconnect();
    }

    // tasks that issue requests to accelerator 'accel'
    std::vector<unsigned int> get_tasks_of_accelerator(unsigned int accel) const;

    // tasks whose accelerator is attached to interconnect 'inter'
    std::vector<unsigned int> get_tasks_on_interconnect(unsigned int inter) const;

    // task indices, highest priority first
    std::vector<unsigned int> get_priority_order() const;

    /* Deadline-monotonic priorities; ties are broken by task index. */
    void assign_deadline_monotonic_priorities();

    bool has_unique_priorities() const;

    void get_utilization(fractional_t &util) const;
    void get_cpu_utilization(fractional_t &util) const;

    // contention-free duration of the bus transactions of one job of task idx
    cycles_t get_isolated_transfer_time(unsigned int idx) const;

    /* Checks every invariant the analysis relies on and throws
     * ConfigurationError on the first violation. */
    void validate() const;
};

#endif
