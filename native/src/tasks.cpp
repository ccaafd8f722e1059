#include <algorithm> // for max, sort
#include <string.h>

#include <vector>
#include <sstream>
#include <iostream>

#include "tasks.h"
#include "task_io.h"
#include "math-helper.h"
#include "iter-helper.h"
#include "config_error.h"

void Task::init(cycles_t cpu_wcet,
                cycles_t period,
                cycles_t deadline,
                unsigned int accelerator,
                cycles_t accel_wcet,
                unsigned int num_reads,
                unsigned int num_writes,
                unsigned int priority)
{
    this->cpu_wcet   = cpu_wcet;
    this->period     = period;
    if (!deadline)
        this->deadline = period; // implicit
    else
        this->deadline = deadline;
    this->accelerator = accelerator;
    this->accel_wcet  = accel_wcet;
    this->num_reads   = num_reads;
    this->num_writes  = num_writes;
    this->priority    = priority;
}

void Task::get_utilization(fractional_t &util) const
{
    // assumes period != 0
    util  = get_wcet();
    util /= get_period();
}

void Task::get_cpu_utilization(fractional_t &util) const
{
    util  = get_cpu_wcet();
    util /= get_period();
}

unsigned long Task::max_jobs_in(cycles_t interval) const
{
    return divide_with_ceil(interval, get_period()) + 1;
}

std::ostream& operator<<(std::ostream &os, const Task &t)
{
    os << "Task(" << t.get_cpu_wcet() << ", " << t.get_period();
    if (!t.has_implicit_deadline())
        os << ", D=" << t.get_deadline();
    os << ", acc=" << t.get_accelerator()
       << ", A=" << t.get_accel_wcet()
       << ", r=" << t.get_num_reads()
       << ", w=" << t.get_num_writes();
    if (t.get_priority() != NO_PRIORITY)
        os << ", prio=" << t.get_priority();
    os << ")";
    return os;
}

std::ostream& operator<<(std::ostream &os, const TaskSet &ts)
{
    os << ts.get_platform() << std::endl;
    for (unsigned int i = 0; i < ts.get_task_count(); i++)
        os << "\t" << i << ": " << ts[i]
           << " inter=" << ts.get_interconnect_of(i) << std::endl;
    return os;
}

TaskSet::TaskSet()
{
}

TaskSet::TaskSet(const Platform &platform) : platform(platform)
{
}

TaskSet::TaskSet(const TaskSet &original)
    : tasks(original.tasks), platform(original.platform)
{
}

TaskSet::~TaskSet()
{
}

bool TaskSet::has_unique_priorities() const
{
    std::vector<unsigned int> prios;
    prios.reserve(tasks.size());
    foreach(tasks, it)
        prios.push_back(it->get_priority());
    std::sort(prios.begin(), prios.end());
    return std::adjacent_find(prios.begin(), prios.end()) == prios.end();
}

std::vector<unsigned int> TaskSet::get_tasks_of_accelerator(unsigned int accel) const
{
    std::vector<unsigned int> result;
    for (unsigned int i = 0; i < tasks.size(); i++)
        if (tasks[i].get_accelerator() == accel)
            result.push_back(i);
    return result;
}

std::vector<unsigned int> TaskSet::get_tasks_on_interconnect(unsigned int inter) const
{
    std::vector<unsigned int> result;
    for (unsigned int i = 0; i < tasks.size(); i++)
        if (get_interconnect_of(i) == inter)
            result.push_back(i);
    return result;
}

class HigherPriority
{
    const Tasks &tasks;

  public:
    HigherPriority(const Tasks &tasks) : tasks(tasks) {}

    bool operator()(unsigned int a, unsigned int b) const
    {
        return tasks[a].get_priority() < tasks[b].get_priority();
    }
};

std::vector<unsigned int> TaskSet::get_priority_order() const
{
    std::vector<unsigned int> order;
    order.reserve(tasks.size());
    for (unsigned int i = 0; i < tasks.size(); i++)
        order.push_back(i);
    std::stable_sort(order.begin(), order.end(), HigherPriority(tasks));
    return order;
}

class ShorterDeadline
{
    const Tasks &tasks;

  public:
    ShorterDeadline(const Tasks &tasks) : tasks(tasks) {}

    bool operator()(unsigned int a, unsigned int b) const
    {
        return tasks[a].get_deadline() < tasks[b].get_deadline()
            || (tasks[a].get_deadline() == tasks[b].get_deadline() && a < b);
    }
};

void TaskSet::assign_deadline_monotonic_priorities()
{
    std::vector<unsigned int> order;
    order.reserve(tasks.size());
    for (unsigned int i = 0; i < tasks.size(); i++)
        order.push_back(i);
    std::sort(order.begin(), order.end(), ShorterDeadline(tasks));

    unsigned int prio;
    enumerate(order, it, prio)
        tasks[*it].set_priority(prio);
}

void TaskSet::get_utilization(fractional_t &util) const
{
    fractional_t tmp;
    util = 0;
    for (unsigned int i = 0; i < tasks.size(); i++)
    {
        tasks[i].get_utilization(tmp);
        util += tmp;
    }
}

void TaskSet::get_cpu_utilization(fractional_t &util) const
{
    fractional_t tmp;
    util = 0;
    for (unsigned int i = 0; i < tasks.size(); i++)
    {
        tasks[i].get_cpu_utilization(tmp);
        util += tmp;
    }
}

cycles_t TaskSet::get_isolated_transfer_time(unsigned int idx) const
{
    const Task &t = tasks[idx];
    integral_t time;

    time  = t.get_num_reads();
    time *= platform.read_latency(t.get_accelerator());

    integral_t writes = t.get_num_writes();
    writes *= platform.write_latency(t.get_accelerator());

    time += writes;
    return to_cycles(time);
}

static void reject_task(unsigned int idx, const char *reason)
{
    std::ostringstream msg;
    msg << "task " << idx << ": " << reason;
    throw ConfigurationError(msg.str());
}

void TaskSet::validate() const
{
    platform.validate();

    if (platform.get_interconnect_count() > tasks.size())
    {
        std::ostringstream msg;
        msg << "interconnect count (" << platform.get_interconnect_count()
            << ") exceeds task count (" << tasks.size() << ")";
        throw ConfigurationError(msg.str());
    }

    for (unsigned int i = 0; i < tasks.size(); i++)
    {
        const Task &t = tasks[i];

        if (t.get_period() == 0)
            reject_task(i, "period must be positive");
        if (t.get_deadline() == 0)
            reject_task(i, "deadline must be positive");
        if (!t.has_constrained_deadline())
            reject_task(i, "deadline exceeds period");
        if (t.get_accelerator() >= platform.get_accelerator_count())
            reject_task(i, "refers to an unknown accelerator");
        if (t.get_priority() == NO_PRIORITY)
            reject_task(i, "has no priority");
        // an accelerator serves one task; its time is not arbitrated
        if (get_tasks_of_accelerator(t.get_accelerator()).size() > 1)
            reject_task(i, "shares its accelerator with another task");
    }

    if (!has_unique_priorities())
        throw ConfigurationError("task priorities are not unique");
}
