
#include <time.h>
#include <sys/time.h>
#include <sys/resource.h>

#include "cpu_time.h"


#if _POSIX_C_SOURCE >= 199309L

// use clock_xxx() API

static double read_clock(clockid_t clock)
{
	struct timespec ts;

	if (clock_gettime(clock, &ts) == 0)
	{
		return ts.tv_sec + ts.tv_nsec / 1E9;
	}
	else
		return 0.0;
}

double get_cpu_usage(void)
{
	return read_clock(CLOCK_PROCESS_CPUTIME_ID);
}

double get_wall_time(void)
{
	return read_clock(CLOCK_MONOTONIC);
}


#else

// fall back to getrusage() and gettimeofday()

static double read_rusage(int who)
{
	struct rusage u;
	if (getrusage(who, &u) == 0)
	{
		return u.ru_utime.tv_sec + u.ru_utime.tv_usec / 1E6
			+ u.ru_stime.tv_sec + u.ru_stime.tv_usec / 1E6;
	}
	else
		return 0.0;
}

double get_cpu_usage(void)
{
	return read_rusage(RUSAGE_SELF);
}

double get_wall_time(void)
{
	struct timeval tv;
	if (gettimeofday(&tv, 0) == 0)
		return tv.tv_sec + tv.tv_usec / 1E6;
	else
		return 0.0;
}

#endif


std::ostream& operator<<(std::ostream &os, const CPUClock &clock)
{
	if (clock.get_name())
		os << clock.get_name() << ": ";
	os << "cpu=" << clock.get_last() << "s "
	   << "wall=" << clock.get_last_wall() << "s";
	if (clock.get_count() > 1)
		os << " (total cpu=" << clock.get_total() << "s "
		   << "wall=" << clock.get_total_wall() << "s "
		   << "average=" << clock.get_average() << "s)";
	return os;
}
