#include <iostream>
#include <sstream>
#include <string>

#include <errno.h>
#include <getopt.h>
#include <stdlib.h>
#include <string.h>

#include "sweep_options.h"
#include "config_error.h"

using namespace std;

static const Configuration default_configs[] = {
    Configuration(4, 1),  Configuration(4, 2),
    Configuration(8, 1),  Configuration(8, 2),  Configuration(8, 4),
    Configuration(16, 1), Configuration(16, 2), Configuration(16, 4),
    Configuration(16, 8),
    Configuration(24, 2), Configuration(24, 4), Configuration(24, 8),
};

void usage(const char *prog)
{
    cerr << "Usage: " << prog
         << " [-n trials] [-p points] [-s seed] [-j workers]"
            " [-o out_dir] [-c N:M ...] [-a] [-v]" << endl
         << "  -n, --trials N          task sets per load sample (1000)" << endl
         << "  -p, --points N          load samples over [0, 1] (100)" << endl
         << "  -s, --seed N            base seed (100)" << endl
         << "  -j, --workers N         worker threads (all cores)" << endl
         << "  -o, --out-dir DIR       output directory (./data)" << endl
         << "  -c, --config N:M        tasks and interconnects, repeatable"
         << endl
         << "  -a, --all-contenders    every task contends on the bus" << endl
         << "  -v, --verbose           log an example task set" << endl;
}

unsigned long parse_number(const char *arg, const char *what,
                           unsigned long max)
{
    char *end;
    errno = 0;
    unsigned long val = strtoul(arg, &end, 10);
    if (errno || end == arg || *end != '\0' || arg[0] == '-')
    {
        ostringstream msg;
        msg << "invalid " << what << ": '" << arg << "'";
        throw ConfigurationError(msg.str());
    }
    if (val > max)
    {
        ostringstream msg;
        msg << what << " " << arg << " exceeds " << max;
        throw ConfigurationError(msg.str());
    }
    return val;
}

Configuration parse_config(const char *arg)
{
    const char *colon = strchr(arg, ':');
    if (!colon)
    {
        ostringstream msg;
        msg << "invalid configuration '" << arg << "', expected N:M";
        throw ConfigurationError(msg.str());
    }
    string tasks(arg, colon - arg);
    return Configuration(parse_number(tasks.c_str(), "task count", UINT_MAX),
                         parse_number(colon + 1, "interconnect count",
                                      UINT_MAX));
}

bool parse_options(int argc, char **argv, Options &opts, int &status)
{
    static const struct option long_options[] = {
        {"trials",         required_argument, 0, 'n'},
        {"points",         required_argument, 0, 'p'},
        {"seed",           required_argument, 0, 's'},
        {"workers",        required_argument, 0, 'j'},
        {"out-dir",        required_argument, 0, 'o'},
        {"config",         required_argument, 0, 'c'},
        {"all-contenders", no_argument,       0, 'a'},
        {"verbose",        no_argument,       0, 'v'},
        {"help",           no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    // glibc: restart the scan at argv[1]
    optind = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, "n:p:s:j:o:c:avh",
                              long_options, NULL)) != -1)
    {
        switch (opt)
        {
        case 'n':
            opts.trials = parse_number(optarg, "trial count");
            break;
        case 'p':
            opts.points = parse_number(optarg, "point count", UINT_MAX);
            break;
        case 's':
            opts.seed = parse_number(optarg, "seed");
            break;
        case 'j':
            opts.sweep.workers = parse_number(optarg, "worker count",
                                              UINT_MAX);
            break;
        case 'o':
            opts.out_dir = optarg;
            break;
        case 'c':
            opts.configs.push_back(parse_config(optarg));
            break;
        case 'a':
            opts.sweep.scope = ALL_TASKS;
            break;
        case 'v':
            opts.verbose = true;
            break;
        case 'h':
            usage(argv[0]);
            status = 0;
            return false;
        default:
            usage(argv[0]);
            status = 1;
            return false;
        }
    }

    if (optind < argc)
    {
        cerr << "[!!] unexpected argument '" << argv[optind] << "'" << endl;
        usage(argv[0]);
        status = 1;
        return false;
    }

    if (opts.points == 0)
        throw ConfigurationError("point count must be positive");

    if (opts.configs.empty())
        opts.configs.assign(default_configs,
                            default_configs + sizeof(default_configs)
                                              / sizeof(default_configs[0]));
    return true;
}
