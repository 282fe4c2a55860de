#ifndef WORKER_GROUP_HH
#define WORKER_GROUP_HH

#include <atomic>
#include <exception>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "common.hh"

/**
 * Fatal failure of a transfer, as reported to the user.
 */
class TransferError : public std::runtime_error {
  public:
    explicit TransferError(const std::string& what)
        : std::runtime_error(what)
    {}
};

/**
 * The long-running threads of one transfer. The first exception thrown by
 * any of them is kept, and the shutdown hook runs so the others unblock
 * and return. The owner joins and then rethrows that exception, after
 * files and sockets have been released in order.
 */
class WorkerGroup {
  public:
    /**
     * \param shutdown
     *      Unblocks every worker (closes channels, stops loops). Called at
     *      most once, on failure or from shutdown().
     */
    explicit WorkerGroup(std::function<void()> shutdown);

    /**
     * Shuts down and joins whatever is still running.
     */
    ~WorkerGroup();

    void spawn(const std::string& name, std::function<void()> body);

    bool failed() const
    {
        return hasFailed;
    }

    void shutdown();

    void joinAll();

    /**
     * Rethrows the first worker exception, if any.
     */
    void rethrowIfFailed();

  private:
    void fail(const std::string& name, std::exception_ptr error);

    std::function<void()> shutdownHook;

    std::once_flag shutdownOnce;

    std::mutex mutex;

    std::exception_ptr failure;

    std::atomic<bool> hasFailed;

    std::vector<std::thread> threads;

    DISALLOW_COPY_AND_ASSIGN(WorkerGroup)
};

#endif /* WORKER_GROUP_HH */
