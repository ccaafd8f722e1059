#ifndef FP_RTA_H
#define FP_RTA_H

#include <vector>
#include <iostream>

#include "tasks.h"
#include "schedulability.h"
#include "contention.h"

struct TaskResponse
{
    cycles_t response;          // UNBOUNDED if the deadline is missed
    ContentionBound contention; // at the last estimate
    unsigned int iterations;
    bool schedulable;
    bool analyzed;              // false below a higher-priority miss

    TaskResponse()
        : response(UNBOUNDED), iterations(0), schedulable(false),
          analyzed(false) {}
};

class ResponseTimes
{
  private:
    std::vector<TaskResponse> responses;

  public:
    ResponseTimes(unsigned int num_tasks = 0) : responses(num_tasks) {}

    unsigned int size() const { return responses.size(); }

    TaskResponse& operator[](int idx) { return responses[idx]; }

    const TaskResponse& operator[](int idx) const { return responses[idx]; }

    bool all_schedulable() const;
};

std::ostream& operator<<(std::ostream &os, const ResponseTimes &rt);

/* Fixed-priority response-time analysis of tasks that self-suspend while
 * their accelerator runs, with the bus contention of the accelerator's
 * transactions bounded by a ContentionModel. */
class FPContentionRTA : public SchedulabilityTest
{

  private:
    AxiContentionModel axi;
    const ContentionModel *model;
    contention_scope_t scope;

    const ContentionModel& get_model() const
    {
        return model ? *model : axi;
    }

    bool response_estimate(unsigned int k,
                           const TaskSet &ts,
                           const Interferers &interferers,
                           const std::vector<unsigned int> &hp,
                           const ResponseTimes &rt,
                           const fractional_t &bus_load,
                           cycles_t response,
                           cycles_t &new_response,
                           ContentionBound &contention) const;

    bool rta_fixpoint(unsigned int k,
                      const TaskSet &ts,
                      const std::vector<unsigned int> &hp,
                      const fractional_t &bus_load,
                      ResponseTimes &rt) const;

  public:
    /* 'model' is not owned; NULL selects the AXI round-robin bound. */
    FPContentionRTA(contention_scope_t scope = HIGHER_EQ_PRIORITY,
                    const ContentionModel *model = NULL)
        : model(model), scope(scope) {};

    FPContentionRTA(const FPContentionRTA &other)
        : model(other.model), scope(other.scope) {};

    /* Response time of every task, highest priority first. A task that
     * misses its deadline has no response-time bound to offer as jitter,
     * so the tasks of lower priority are left unanalyzed (and
     * unschedulable). */
    ResponseTimes analyze(const TaskSet &ts,
                          const fractional_t &bus_load,
                          bool check_preconditions = true) const;

    bool is_schedulable(const TaskSet &ts,
                        const fractional_t &bus_load,
                        bool check_preconditions = true);
};

/* Shorthands using the default analysis. */
bool is_schedulable(const TaskSet &ts, const fractional_t &bus_load);
ResponseTimes analyze_response_times(const TaskSet &ts,
                                     const fractional_t &bus_load);

#endif
