#include "log.hh"
#include "worker_group.hh"

WorkerGroup::WorkerGroup(std::function<void()> shutdown)
    : shutdownHook(std::move(shutdown))
    , shutdownOnce()
    , mutex()
    , failure()
    , hasFailed(false)
    , threads()
{}

WorkerGroup::~WorkerGroup()
{
    shutdown();
    joinAll();
}

void
WorkerGroup::spawn(const std::string& name, std::function<void()> body)
{
    threads.emplace_back([this, name, body] {
        try {
            body();
        } catch (const std::exception& e) {
            logError("%s failed: %s", name.c_str(), e.what());
            fail(name, std::current_exception());
        } catch (...) {
            logError("%s failed with an unknown exception", name.c_str());
            fail(name, std::current_exception());
        }
    });
}

void
WorkerGroup::shutdown()
{
    std::call_once(shutdownOnce, shutdownHook);
}

void
WorkerGroup::joinAll()
{
    for (auto& thread : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void
WorkerGroup::rethrowIfFailed()
{
    std::exception_ptr error;
    {
        Guard _(mutex);
        error = failure;
    }
    if (error) {
        std::rethrow_exception(error);
    }
}

void
WorkerGroup::fail(const std::string& name, std::exception_ptr error)
{
    {
        Guard _(mutex);
        if (!failure) {
            failure = error;
        }
        hasFailed = true;
    }
    logDebug("shutting down workers after %s failed", name.c_str());
    shutdown();
}
