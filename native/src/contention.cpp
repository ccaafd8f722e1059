#include <algorithm> // for min
#include <iostream>

#include "tasks.h"
#include "contention.h"

#include "time-types.h"
#include "math-helper.h"
#include "iter-helper.h"

std::ostream& operator<<(std::ostream &os, const ContentionBound &cb)
{
	os << "(inter-count=" << cb.interconnect_count
	   << ", bus-count=" << cb.bus_count
	   << ", interference=";
	if (cb.interference == UNBOUNDED)
		os << "inf";
	else
		os << cb.interference;
	os << ", background=";
	if (cb.background == UNBOUNDED)
		os << "inf";
	else
		os << cb.background;
	os << ")";
	return os;
}

Interferers get_interferers(const TaskSet &ts, unsigned int k,
			    contention_scope_t scope)
{
	Interferers result;

	for (unsigned int i = 0; i < ts.get_task_count(); i++)
	{
		if (i == k || !ts[i].uses_bus())
			continue;
		// NOTE: 0 == highest priority
		if (scope == ALL_TASKS
		    || ts[i].get_priority() <= ts[k].get_priority())
			result.push_back(i);
	}

	return result;
}

cycles_t background_delay(cycles_t transfer, const fractional_t &bus_load)
{
	if (transfer == 0 || bus_load <= 0)
		return 0;
	if (transfer == UNBOUNDED || bus_load >= 1)
		// all bandwidth is taken by background traffic
		return UNBOUNDED;

	fractional_t stolen = bus_load / (1 - bus_load);
	stolen *= transfer;

	return to_cycles(round_up(stolen));
}

// pending bursts of the interferers, split by where they meet ours
struct Pending
{
	integral_t reads;
	integral_t writes;

	Pending() : reads(0), writes(0) {}

	void add(const Task &tsk, unsigned long jobs)
	{
		integral_t tmp;

		tmp  = jobs;
		tmp *= tsk.get_num_reads();
		reads += tmp;

		tmp  = jobs;
		tmp *= tsk.get_num_writes();
		writes += tmp;
	}
};

// Interfering bursts for one AXI channel. Each of our 'own' bursts can be
// overtaken by at most 'phi_local' bursts of the other ports of our
// interconnect; each burst leaving our interconnect (ours and the ones that
// overtook them) by at most 'phi_bus' bursts of the other interconnects.
static void bound_channel(unsigned int own,
			  const integral_t &local,
			  const integral_t &remote,
			  unsigned long phi_local,
			  unsigned long phi_bus,
			  integral_t &y_local,
			  integral_t &y_bus)
{
	if (own == 0)
	{
		y_local = 0;
		y_bus   = 0;
		return;
	}

	integral_t cap;

	cap  = own;
	cap *= phi_local;
	y_local = std::min(cap, local);

	cap  = y_local;
	cap += own;
	cap *= phi_bus;
	y_bus = std::min(cap, remote);
}

ContentionBound AxiContentionModel::bound(const TaskSet &ts,
					  unsigned int k,
					  const Interferers &interferers,
					  cycles_t window,
					  const fractional_t &bus_load) const
{
	ContentionBound result;
	const Task &tsk = ts[k];

	if (!tsk.uses_bus())
		return result;

	const Platform &platform = ts.get_platform();
	const unsigned int accel = tsk.get_accelerator();
	const unsigned int inter = ts.get_interconnect_of(k);
	const Interconnect &own_inter = platform.get_interconnect(inter);

	// grants the other ports of our interconnect get per round
	unsigned long phi_local = 0;
	foreach_accelerator_on(platform, inter, acc)
		if (acc->get_id() != accel)
			phi_local += std::min(acc->get_phi(), own_inter.get_phi());

	// grants the other interconnects get at the shared bus per round
	unsigned long phi_bus = 0;
	foreach(platform.get_interconnects(), it)
		if (it->get_id() != inter
		    && platform.count_accelerators_on(it->get_id()) > 0)
			phi_bus += it->get_phi();

	Pending local, remote;

	foreach_task_except(interferers, k, it)
	{
		const Task &tj = ts[*it];
		unsigned long jobs = tj.max_jobs_in(window);

		// validated task sets give every task its own accelerator
		if (ts.get_interconnect_of(*it) == inter)
			local.add(tj, jobs);
		else
			remote.add(tj, jobs);
	}

	integral_t yl_r, yb_r, yl_w, yb_w;

	bound_channel(tsk.get_num_reads(), local.reads, remote.reads,
		      phi_local, phi_bus, yl_r, yb_r);
	bound_channel(tsk.get_num_writes(), local.writes, remote.writes,
		      phi_local, phi_bus, yl_w, yb_w);

	const cycles_t d_r = platform.read_latency(accel);
	const cycles_t d_w = platform.write_latency(accel);

	integral_t y_r = yl_r + yb_r;
	integral_t y_w = yl_w + yb_w;

	integral_t delay, tmp;
	delay  = y_r;
	delay *= d_r;
	tmp    = y_w;
	tmp   *= d_w;
	delay += tmp;

	// every burst we wait for, and each of ours, is slowed by the
	// background traffic
	integral_t transfer;
	transfer  = y_r + tsk.get_num_reads();
	transfer *= d_r;
	tmp  = y_w + tsk.get_num_writes();
	tmp *= d_w;
	transfer += tmp;

	result.interconnect_count = to_cycles(yl_r + yl_w);
	result.bus_count          = to_cycles(yb_r + yb_w);
	result.interference       = to_cycles(delay);
	result.background         = background_delay(to_cycles(transfer),
						     bus_load);
	return result;
}
