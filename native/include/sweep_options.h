#ifndef SWEEP_OPTIONS_H
#define SWEEP_OPTIONS_H

#include <string>
#include <vector>
#include <utility>

#include <limits.h>

#include "sched_ratio.h"

// (task count N, interconnect count M)
typedef std::pair<unsigned int, unsigned int> Configuration;

struct Options
{
    unsigned long trials;
    unsigned int points;
    unsigned long seed;
    std::string out_dir;
    std::vector<Configuration> configs;
    bool verbose;
    SweepConfig sweep;

    Options()
        : trials(1000), points(100), seed(100), out_dir("./data"),
          verbose(false)
    {}
};

void usage(const char *prog);

/* Decimal number in [0, max]; anything else raises ConfigurationError
 * naming 'what'. */
unsigned long parse_number(const char *arg, const char *what,
                           unsigned long max = ULONG_MAX);

// "N:M"
Configuration parse_config(const char *arg);

/* Fills 'opts' from the command line, with the default configuration grid
 * if no -c is given. Returns false if the program should exit with
 * 'status' (help requested, or a usage error). Malformed values raise
 * ConfigurationError. */
bool parse_options(int argc, char **argv, Options &opts, int &status);

#endif
