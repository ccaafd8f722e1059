#ifndef WORKER_POOL_H
#define WORKER_POOL_H

#include <deque>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

/* Queue of independent jobs, filled before the workers start. */
template <typename T>
class JobQueue
{
  private:
    std::deque<T> queue;
    std::mutex mtx;

  public:
    void push(const T &job)
    {
        std::lock_guard<std::mutex> guard(mtx);
        queue.push_back(job);
    }

    // false once the queue has been drained
    bool pop(T &job)
    {
        std::lock_guard<std::mutex> guard(mtx);
        if (queue.empty())
            return false;
        job = queue.front();
        queue.pop_front();
        return true;
    }
};

static inline unsigned int default_worker_count()
{
    unsigned int n = std::thread::hardware_concurrency();
    return n ? n : 1;
}

/* Runs work(worker_index) on 'num_workers' threads and waits for all of
 * them. A single worker runs on the calling thread. An exception thrown by
 * a worker is rethrown here once every worker has finished. If a thread
 * cannot be started, the started ones are joined before std::system_error
 * propagates. */
template <typename Work>
void run_workers(unsigned int num_workers, Work work)
{
    if (num_workers <= 1)
    {
        work(0);
        return;
    }

    std::vector<std::exception_ptr> errors(num_workers);
    std::vector<std::thread> workers;

    // no reallocation (and no throw) once threads are running
    workers.reserve(num_workers);

    try
    {
        for (unsigned int i = 0; i < num_workers; i++)
            workers.emplace_back([&work, &errors, i]() {
                try
                {
                    work(i);
                }
                catch (...)
                {
                    errors[i] = std::current_exception();
                }
            });
    }
    catch (...)
    {
        // could not start them all: wait for the ones already running
        for (unsigned int i = 0; i < workers.size(); i++)
            workers[i].join();
        throw;
    }

    for (unsigned int i = 0; i < workers.size(); i++)
        workers[i].join();

    for (unsigned int i = 0; i < errors.size(); i++)
        if (errors[i])
            std::rethrow_exception(errors[i]);
}

#endif
