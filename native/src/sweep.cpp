#include <iostream>
#include <iomanip>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <stdexcept>

#include <errno.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>

#include "tasks.h"
#include "task_io.h"
#include "config_error.h"
#include "cpu_time.h"
#include "taskgen.h"
#include "fp/rta.h"
#include "sched_ratio.h"
#include "sweep_options.h"

using namespace std;

static void make_out_dir(const string &dir)
{
    if (mkdir(dir.c_str(), 0755) != 0 && errno != EEXIST)
    {
        ostringstream msg;
        msg << "cannot create " << dir << ": " << strerror(errno);
        throw runtime_error(msg.str());
    }
}

static string out_file(const Options &opts, const char *prefix,
                       const Configuration &cfg, const char *suffix)
{
    ostringstream name;
    name << opts.out_dir << "/" << prefix << "_t_" << cfg.first
         << "_i_" << cfg.second << suffix;
    return name.str();
}

static void write_log(const Options &opts, const Configuration &cfg,
                      const vector<fractional_t> &loads,
                      const SchedulabilityCurve &curve)
{
    string fname = out_file(opts, "log", cfg, ".txt");
    ofstream log(fname.c_str());

    RandomEngine rng = trial_engine(opts.seed, 0);
    TaskSet ts = generate_task_set(cfg.first, cfg.second, rng,
                                   opts.sweep.generator);
    FPContentionRTA rta(opts.sweep.scope);

    fractional_t util, cpu_util;
    ts.get_utilization(util);
    ts.get_cpu_utilization(cpu_util);

    log << "Task set of trial 0: U=" << util.get_d()
        << " U_cpu=" << cpu_util.get_d() << endl << ts;
    log << "Response times at load " << loads.front() << endl
        << rta.analyze(ts, loads.front());
    log << "Response times at load " << loads.back() << endl
        << rta.analyze(ts, loads.back());
    log << "Schedulable task sets" << endl << curve << endl;

    if (!log)
        throw runtime_error("cannot write " + fname);
}

static void run_config(const Options &opts, const Configuration &cfg,
                       const vector<fractional_t> &loads)
{
    CPUClock clock;

    cout << "Start\t tasks: " << left << setw(10) << cfg.first
         << " inters: " << setw(10) << cfg.second << right << endl;

    clock.start();
    SchedulabilityCurve curve = schedulability_ratio(
        cfg.first, cfg.second, loads, opts.trials, opts.seed, opts.sweep);
    clock.stop();

    string fname = out_file(opts, "sched", cfg, ".csv");
    ofstream csv(fname.c_str());
    curve.write_csv(csv);
    csv.close();
    if (!csv)
        throw runtime_error("cannot write " + fname);

    if (opts.verbose)
        write_log(opts, cfg, loads, curve);

    cout << "Done\t tasks: " << left << setw(10) << cfg.first
         << " inters: " << setw(10) << cfg.second << right
         << " " << clock << endl;
}

int main(int argc, char** argv)
{
    Options opts;
    int status = 0;

    try
    {
        if (!parse_options(argc, argv, opts, status))
            return status;

        make_out_dir(opts.out_dir);

        vector<fractional_t> loads = load_samples(opts.points);
        for (unsigned int i = 0; i < opts.configs.size(); i++)
            run_config(opts, opts.configs[i], loads);
    }
    catch (const ConfigurationError &e)
    {
        cerr << "[!!] " << e.what() << endl;
        return 1;
    }
    catch (const exception &e)
    {
        cerr << "[!!] " << e.what() << endl;
        return 2;
    }

    cout << "All DONE" << endl;
    return 0;
}
