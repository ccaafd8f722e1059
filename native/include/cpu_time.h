#ifndef CPU_TIME_H
#define CPU_TIME_H

#include <iostream>

// How much CPU time used by all threads of the process (in seconds)?
double get_cpu_usage(void);

// Seconds on a monotonic clock.
double get_wall_time(void);

/* Accumulates process CPU time and elapsed wall time over start()/stop()
 * pairs. */
class CPUClock
{
private:
	const char *name;

	unsigned int count;

	double start_time;
	double start_wall;
	double last;
	double last_wall;
	double total;
	double total_wall;

public:
	CPUClock(const char *_name = 0)
		: name(_name), count(0),
		  start_time(0), start_wall(0),
		  last(0), last_wall(0),
		  total(0), total_wall(0)
	{}

	void start()
	{
		start_time = get_cpu_usage();
		start_wall = get_wall_time();
	}

	void stop()
	{
		last = get_cpu_usage() - start_time;
		last_wall = get_wall_time() - start_wall;
		total += last;
		total_wall += last_wall;
		count++;
	}

	double get_total() const
	{
		return total;
	}

	double get_last() const
	{
		return last;
	}

	double get_total_wall() const
	{
		return total_wall;
	}

	double get_last_wall() const
	{
		return last_wall;
	}

	double get_count() const
	{
		return count;
	}

	double get_average() const
	{
		return total / ( count ? count : 1);
	}

	const char *get_name() const
	{
		return name;
	}
};

std::ostream& operator<<(std::ostream &os, const CPUClock &clock);

#endif
