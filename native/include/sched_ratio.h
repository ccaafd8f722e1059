#ifndef SCHED_RATIO_H
#define SCHED_RATIO_H

#include <vector>
#include <iostream>

#include "time-types.h"
#include "contention.h"
#include "taskgen.h"

struct SweepConfig
{
    unsigned int workers;   // 0 => hardware concurrency
    contention_scope_t scope;
    GeneratorParams generator;

    SweepConfig() : workers(0), scope(HIGHER_EQ_PRIORITY) {}
};

/* Fraction of schedulable task sets at each bus-load sample. */
class SchedulabilityCurve
{
  public:
    struct Point
    {
        fractional_t load;
        unsigned long schedulable;
        unsigned long trials;

        Point(const fractional_t &load, unsigned long trials)
            : load(load), schedulable(0), trials(trials) {}

        void get_ratio(fractional_t &ratio) const;
        double get_ratio() const;
    };

  private:
    std::vector<Point> points;

  public:
    SchedulabilityCurve() {}
    SchedulabilityCurve(const std::vector<fractional_t> &loads,
                        unsigned long trials);

    unsigned int size() const { return points.size(); }

    const Point& operator[](int idx) const { return points[idx]; }

    const fractional_t& get_load(unsigned int idx) const
    {
        return points[idx].load;
    }

    double get_ratio(unsigned int idx) const
    {
        return points[idx].get_ratio();
    }

    // adds per-sample schedulable counts
    void add_counts(const std::vector<unsigned long> &counts);

    /* One "load,ratio" line per sample, five decimals. */
    void write_csv(std::ostream &os) const;
};

std::ostream& operator<<(std::ostream &os, const SchedulabilityCurve &curve);

/* 'count' evenly spaced samples over [0, 1], both ends included. */
std::vector<fractional_t> load_samples(unsigned int count);

/* Seeds the generator of one trial from the sweep seed and the trial
 * number only. */
RandomEngine trial_engine(unsigned long seed, unsigned long trial);

/* Runs 'trials' random task sets of 'num_tasks' tasks on 'num_inters'
 * interconnects at every bus-load sample. The same task sets are used for
 * every sample, and the result only depends on the arguments. */
SchedulabilityCurve schedulability_ratio(
    unsigned int num_tasks,
    unsigned int num_inters,
    const std::vector<fractional_t> &loads,
    unsigned long trials,
    unsigned long seed,
    const SweepConfig &config = SweepConfig());

#endif
