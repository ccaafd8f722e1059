#include <algorithm>
#include <limits>
#include <sstream>

#include <math.h>

#include "tasks.h"
#include "taskgen.h"
#include "config_error.h"

using namespace std;

static void reject_param(const char *name, double value, const char *reason)
{
    ostringstream msg;
    msg << "generator parameter " << name << "=" << value << ": " << reason;
    throw ConfigurationError(msg.str());
}

void GeneratorParams::validate(unsigned int num_tasks) const
{
    if (num_tasks == 0)
        throw ConfigurationError("task count must be positive");
    if (!(utilization > 0) || !(utilization < num_tasks))
        reject_param("utilization", utilization,
                     "must be in (0, task count)");
    if (period_min == 0 || period_min > period_max)
        reject_param("period_min", period_min,
                     "must be positive and at most period_max");
    if (!(cpu_share >= 0 && cpu_share <= 1))
        reject_param("cpu_share", cpu_share, "must be in [0, 1]");
    if (!(access_density >= 0 && access_density <= 1))
        reject_param("access_density", access_density, "must be in [0, 1]");
    if (trans_time == 0)
        reject_param("trans_time", trans_time, "must be positive");
    if (rw_ratio > 1)
        reject_param("rw_ratio", rw_ratio, "must be at most 1");
}

vector<double> randfixedsum(unsigned int n, double total, RandomEngine &rng)
{
    vector<double> x(n, total);

    if (n <= 1)
        return x;

    const double tiny = numeric_limits<double>::min();
    const double huge = numeric_limits<double>::max();
    const int k = (int) floor(total);

    vector<double> s1(n), s2(n);
    for (unsigned int i = 0; i < n; i++)
    {
        s1[i] = total - k + i;
        s2[i] = k + n - i - total;
    }

    // w: n x (n + 1) volumes, t: (n - 1) x n transition probabilities
    vector< vector<double> > w(n, vector<double>(n + 1, 0.0));
    vector< vector<double> > t(n - 1, vector<double>(n, 0.0));

    w[0][1] = huge;
    for (unsigned int i = 2; i <= n; i++)
        for (unsigned int m = 0; m < i; m++)
        {
            double tmp1 = w[i - 2][m + 1] * s1[m] / i;
            double tmp2 = w[i - 2][m] * s2[n - i + m] / i;
            w[i - 1][m + 1] = tmp1 + tmp2;
            double tmp3 = w[i - 1][m + 1] + tiny;
            if (s2[n - i + m] > s1[m])
                t[i - 2][m] = tmp2 / tmp3;
            else
                t[i - 2][m] = 1 - tmp1 / tmp3;
        }

    uniform_real_distribution<double> unif(0.0, 1.0);
    double s = total, sm = 0, pr = 1;
    int j = k + 1;

    for (unsigned int i = n - 1; i >= 1; i--)
    {
        double rt = unif(rng); // which simplex
        double rs = unif(rng); // where in the simplex
        int e = rt <= t[i - 1][j - 1] ? 1 : 0;
        double sx = pow(rs, 1.0 / i);
        sm += (1 - sx) * pr * s / (i + 1);
        pr *= sx;
        x[n - i - 1] = sm + pr * e;
        s -= e;
        j -= e;
    }
    x[n - 1] = sm + pr * s;

    shuffle(x.begin(), x.end(), rng);
    return x;
}

cycles_t log_uniform_period(cycles_t min, cycles_t max, RandomEngine &rng)
{
    uniform_real_distribution<double> unif(log((double) min),
                                           log((double) max + 1));
    cycles_t period = (cycles_t) floor(exp(unif(rng)));
    return std::min(std::max(period, min), max);
}

struct DrawnTask
{
    cycles_t period;
    cycles_t cpu_wcet;
    cycles_t accel_wcet;
    unsigned int num_reads;
    unsigned int num_writes;

    cycles_t get_slack() const
    {
        return period - cpu_wcet - accel_wcet;
    }
};

static bool less_slack(const DrawnTask &a, const DrawnTask &b)
{
    return a.get_slack() < b.get_slack();
}

TaskSet generate_task_set(unsigned int num_tasks,
                          unsigned int num_inters,
                          RandomEngine &rng,
                          const GeneratorParams &params)
{
    params.validate(num_tasks);
    if (num_inters == 0 || num_inters > num_tasks)
    {
        ostringstream msg;
        msg << "interconnect count (" << num_inters
            << ") must be in [1, " << num_tasks << "]";
        throw ConfigurationError(msg.str());
    }

    vector<double> utils = randfixedsum(num_tasks, params.utilization, rng);
    vector<DrawnTask> drawn(num_tasks);
    uniform_real_distribution<double> rw_unif(0.4, 0.6);

    for (unsigned int i = 0; i < num_tasks; i++)
    {
        DrawnTask &d = drawn[i];
        d.period = log_uniform_period(params.period_min, params.period_max,
                                      rng);

        cycles_t budget = (cycles_t) nearbyint(utils[i] * d.period);
        budget = std::min(budget, d.period);
        d.cpu_wcet   = (cycles_t) nearbyint(budget * params.cpu_share);
        d.accel_wcet = budget - d.cpu_wcet;

        // scale down the number of transactions that fit the accelerator
        // time, at a nominal duration per transaction
        unsigned long max_trans = d.accel_wcet / params.trans_time;
        unsigned long total = (unsigned long)
            floor(max_trans * params.access_density);

        double rw = params.rw_ratio < 0 ? rw_unif(rng) : params.rw_ratio;
        d.num_reads  = (unsigned int) nearbyint(total * rw);
        d.num_writes = (unsigned int) nearbyint(total * (1 - rw));
    }

    // least slack first
    stable_sort(drawn.begin(), drawn.end(), less_slack);

    Platform platform;
    for (unsigned int i = 0; i < num_inters; i++)
        platform.add_interconnect();
    for (unsigned int i = 0; i < num_tasks; i++)
        platform.add_accelerator(
            balanced_interconnect(i, num_tasks, num_inters));

    TaskSet ts(platform);
    for (unsigned int i = 0; i < num_tasks; i++)
        ts.add_task(drawn[i].cpu_wcet, drawn[i].period, 0, i,
                    drawn[i].accel_wcet,
                    drawn[i].num_reads, drawn[i].num_writes);
    ts.assign_deadline_monotonic_priorities();

    return ts;
}

TaskSet generate_task_set(unsigned int num_tasks,
                          unsigned int num_inters,
                          unsigned long seed,
                          const GeneratorParams &params)
{
    RandomEngine rng(seed);
    return generate_task_set(num_tasks, num_inters, rng, params);
}
