#include "tasks.h"
#include "schedulability.h"

#include "fp/rta.h"

#include <iostream>
#include "task_io.h"

#include "math-helper.h"
#include "iter-helper.h"

using namespace std;

bool ResponseTimes::all_schedulable() const
{
    foreach(responses, it)
        if (!it->schedulable)
            return false;
    return true;
}

ostream& operator<<(ostream &os, const ResponseTimes &rt)
{
    for (unsigned int i = 0; i < rt.size(); i++)
    {
        os << "\t" << i << ": ";
        if (!rt[i].analyzed)
        {
            os << "not analyzed" << endl;
            continue;
        }
        os << "R=";
        if (rt[i].schedulable)
            os << rt[i].response;
        else
            os << "MISS";
        os << " iterations=" << rt[i].iterations
           << " contention=" << rt[i].contention << endl;
    }
    return os;
}

/* Release jitter of a suspending higher-priority task: its CPU portion may
 * run as late as its response time allows. Only schedulable tasks count as
 * higher-priority work, so r_j.response <= D_j. */
static cycles_t release_jitter(const Task &t_j, const TaskResponse &r_j)
{
    if (r_j.response > t_j.get_cpu_wcet())
        return r_j.response - t_j.get_cpu_wcet();
    else
        return 0;
}

bool FPContentionRTA::response_estimate(unsigned int k,
                                        const TaskSet &ts,
                                        const Interferers &interferers,
                                        const vector<unsigned int> &hp,
                                        const ResponseTimes &rt,
                                        const fractional_t &bus_load,
                                        cycles_t response,
                                        cycles_t &new_response,
                                        ContentionBound &contention) const
{
    contention = get_model().bound(ts, k, interferers, response, bus_load);
    if (!contention.is_bounded())
        return false;

    integral_t demand = ts[k].get_wcet();
    integral_t window, jobs;

    demand += ts.get_isolated_transfer_time(k);
    demand += contention.get_total();

    foreach(hp, it)
    {
        const Task &t_j = ts[*it];

        window  = response;
        window += release_jitter(t_j, rt[*it]);
        jobs  = divide_with_ceil(window, integral_t(t_j.get_period()));
        jobs *= t_j.get_cpu_wcet();
        demand += jobs;
    }

    new_response = to_cycles(demand);
    /* overflowed => response time > deadline */
    return new_response != UNBOUNDED;
}

bool FPContentionRTA::rta_fixpoint(unsigned int k,
                                   const TaskSet &ts,
                                   const vector<unsigned int> &hp,
                                   const fractional_t &bus_load,
                                   ResponseTimes &rt) const
{
    const Task &t_k = ts[k];
    const Interferers interferers = get_interferers(ts, k, scope);
    TaskResponse &result = rt[k];

    // the estimate grows by at least one cycle per round
    const cycles_t max_rounds = add_cycles(t_k.get_deadline(), 2);

    cycles_t last, response;
    bool ok;

    last = add_cycles(t_k.get_wcet(), ts.get_isolated_transfer_time(k));
    ok = response_estimate(k, ts, interferers, hp, rt, bus_load,
                           last, response, result.contention);
    result.iterations = 1;

    while (ok && last != response && response <= t_k.get_deadline())
    {
        if (result.iterations >= max_rounds)
        {
            ok = false;
            break;
        }
        last = response;
        ok = response_estimate(k, ts, interferers, hp, rt, bus_load,
                               last, response, result.contention);
        result.iterations++;
    }

    result.analyzed = true;
    result.schedulable = ok && response <= t_k.get_deadline();
    result.response = result.schedulable ? response : UNBOUNDED;
    return result.schedulable;
}

ResponseTimes FPContentionRTA::analyze(const TaskSet &ts,
                                       const fractional_t &bus_load,
                                       bool check_preconditions) const
{
    if (check_preconditions)
    {
        check_bus_load(bus_load);
        ts.validate();
    }

    ResponseTimes rt(ts.get_task_count());
    vector<unsigned int> order = ts.get_priority_order();
    vector<unsigned int> hp;

    hp.reserve(order.size());
    foreach(order, it)
    {
        if (!rta_fixpoint(*it, ts, hp, bus_load, rt))
            break;
        hp.push_back(*it);
    }

    return rt;
}

bool FPContentionRTA::is_schedulable(const TaskSet &ts,
                                     const fractional_t &bus_load,
                                     bool check_preconditions)
{
    return analyze(ts, bus_load, check_preconditions).all_schedulable();
}

bool is_schedulable(const TaskSet &ts, const fractional_t &bus_load)
{
    return FPContentionRTA().is_schedulable(ts, bus_load);
}

ResponseTimes analyze_response_times(const TaskSet &ts,
                                     const fractional_t &bus_load)
{
    return FPContentionRTA().analyze(ts, bus_load);
}
