#include <algorithm>
#include <sstream>
#include <iomanip>

#include "tasks.h"
#include "schedulability.h"
#include "config_error.h"
#include "fp/rta.h"
#include "sched_ratio.h"
#include "worker_pool.h"

#include "iter-helper.h"

using namespace std;

void SchedulabilityCurve::Point::get_ratio(fractional_t &ratio) const
{
    if (trials)
    {
        ratio  = schedulable;
        ratio /= trials;
    }
    else
        ratio = 0;
}

double SchedulabilityCurve::Point::get_ratio() const
{
    fractional_t ratio;
    get_ratio(ratio);
    return ratio.get_d();
}

SchedulabilityCurve::SchedulabilityCurve(const vector<fractional_t> &loads,
                                         unsigned long trials)
{
    points.reserve(loads.size());
    foreach(loads, it)
        points.push_back(Point(*it, trials));
}

void SchedulabilityCurve::add_counts(const vector<unsigned long> &counts)
{
    for (unsigned int i = 0; i < points.size() && i < counts.size(); i++)
        points[i].schedulable += counts[i];
}

void SchedulabilityCurve::write_csv(ostream &os) const
{
    ios_base::fmtflags flags = os.flags();
    streamsize precision = os.precision();

    os << fixed << setprecision(5);
    foreach(points, it)
        os << it->load.get_d() << "," << it->get_ratio() << "\n";

    os.flags(flags);
    os.precision(precision);
}

ostream& operator<<(ostream &os, const SchedulabilityCurve &curve)
{
    os << "[";
    for (unsigned int i = 0; i < curve.size(); i++)
    {
        if (i)
            os << " ";
        os << curve[i].load.get_d() << ":"
           << curve[i].schedulable << "/" << curve[i].trials;
    }
    os << "]";
    return os;
}

vector<fractional_t> load_samples(unsigned int count)
{
    vector<fractional_t> loads;

    if (count == 1)
        loads.push_back(fractional_t(0));
    else
        for (unsigned int i = 0; i < count; i++)
        {
            fractional_t load = i;
            load /= count - 1;
            loads.push_back(load);
        }

    return loads;
}

RandomEngine trial_engine(unsigned long seed, unsigned long trial)
{
    seed_seq seq {
        (unsigned long) (seed & 0xffffffffUL),
        (unsigned long) ((seed >> 16) >> 16),
        (unsigned long) (trial & 0xffffffffUL),
        (unsigned long) ((trial >> 16) >> 16),
    };
    return RandomEngine(seq);
}

class LessLoad
{
    const vector<fractional_t> &loads;

  public:
    LessLoad(const vector<fractional_t> &loads) : loads(loads) {}

    bool operator()(unsigned int a, unsigned int b) const
    {
        return loads[a] < loads[b];
    }
};

SchedulabilityCurve schedulability_ratio(unsigned int num_tasks,
                                         unsigned int num_inters,
                                         const vector<fractional_t> &loads,
                                         unsigned long trials,
                                         unsigned long seed,
                                         const SweepConfig &config)
{
    config.generator.validate(num_tasks);
    if (num_inters == 0 || num_inters > num_tasks)
    {
        ostringstream msg;
        msg << "interconnect count (" << num_inters
            << ") must be in [1, " << num_tasks << "]";
        throw ConfigurationError(msg.str());
    }
    if (trials == 0)
        throw ConfigurationError("trial count must be positive");
    foreach(loads, it)
        check_bus_load(*it);

    // schedulable at some load => schedulable at every lower load
    vector<unsigned int> by_load;
    for (unsigned int i = 0; i < loads.size(); i++)
        by_load.push_back(i);
    stable_sort(by_load.begin(), by_load.end(), LessLoad(loads));

    JobQueue<unsigned long> jobs;
    for (unsigned long t = 0; t < trials; t++)
        jobs.push(t);

    unsigned int num_workers = config.workers ? config.workers
                                              : default_worker_count();
    if (num_workers > trials)
        num_workers = trials;

    vector< vector<unsigned long> > partial(
        num_workers, vector<unsigned long>(loads.size(), 0));

    run_workers(num_workers, [&](unsigned int w) {
        FPContentionRTA rta(config.scope);
        vector<unsigned long> &counts = partial[w];
        unsigned long trial;

        while (jobs.pop(trial))
        {
            RandomEngine rng = trial_engine(seed, trial);
            TaskSet ts = generate_task_set(num_tasks, num_inters, rng,
                                           config.generator);

            foreach(by_load, it)
            {
                if (!rta.is_schedulable(ts, loads[*it], false))
                    break;
                counts[*it]++;
            }
        }
    });

    SchedulabilityCurve curve(loads, trials);
    foreach(partial, it)
        curve.add_counts(*it);
    return curve;
}
