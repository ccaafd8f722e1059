#ifndef CONTENTION_H
#define CONTENTION_H

#include <vector>

#include "tasks.h"

typedef std::vector<unsigned int> Interferers;

/* Which tasks may contend on the bus with the task under analysis. */
typedef enum {
	HIGHER_EQ_PRIORITY = 0, // tasks with priority >= the analyzed task's
	ALL_TASKS          = 1, // every other task
} contention_scope_t;

Interferers get_interferers(const TaskSet &ts, unsigned int k,
			    contention_scope_t scope);

struct ContentionBound
{
	unsigned long interconnect_count; // interfering bursts at the interconnect
	unsigned long bus_count;          // interfering bursts at the shared bus
	cycles_t      interference;       // delay caused by those bursts
	cycles_t      background;         // delay caused by background bus load

	ContentionBound()
		: interconnect_count(0), bus_count(0),
		  interference(0), background(0) {}

	cycles_t get_total() const
	{
		if (interference == UNBOUNDED || background == UNBOUNDED)
			return UNBOUNDED;
		return interference + background;
	}

	bool is_bounded() const
	{
		return get_total() != UNBOUNDED;
	}
};

std::ostream& operator<<(std::ostream &os, const ContentionBound &cb);

class ContentionModel
{
  public:
	/* Upper bound on the extra latency suffered by the bus transactions of
	 * one job of ts[k] while the job is pending for at most 'window'
	 * cycles. Must be non-decreasing in 'window', 'bus_load', and in the
	 * set of interferers. */
	virtual ContentionBound bound(const TaskSet &ts,
				      unsigned int k,
				      const Interferers &interferers,
				      cycles_t window,
				      const fractional_t &bus_load) const = 0;

	virtual ~ContentionModel() {};
};

/* Round-robin arbitration at each interconnect (per accelerator port) and at
 * the shared bus (per interconnect port), plus bandwidth stolen by
 * background traffic. AXI read and write channels are bounded separately. */
class AxiContentionModel : public ContentionModel
{
  public:
	ContentionBound bound(const TaskSet &ts,
			      unsigned int k,
			      const Interferers &interferers,
			      cycles_t window,
			      const fractional_t &bus_load) const;
};

/* Background share of the given contention-free transfer time:
 * ceil(transfer * load / (1 - load)), UNBOUNDED at full load. */
cycles_t background_delay(cycles_t transfer, const fractional_t &bus_load);

#endif
