#pragma once
#include <atomic>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>




//=============================================================================
namespace rce {
    class worker_pool;
}




//=============================================================================
/**
 * A fixed set of threads pulling named tasks from a shared queue. Tasks are
 * submitted in batches; the submitting thread blocks until every task in its
 * batch has returned.
 */
class rce::worker_pool
{
public:


    using run_t = std::function<void()>;


    class listener_t
    {
    public:
        virtual ~listener_t() {}
        virtual void task_starting(int worker, std::string name) = 0;
        virtual void task_finished(int worker, std::string name) = 0;
    };


    struct batch_t
    {
        std::size_t remaining = 0;
        std::exception_ptr error;
    };


    struct task_t
    {
        task_t(std::string name, run_t run) : name(name), run(run) {}

        operator bool() const { return run != nullptr; }
        std::string name;
        run_t run = nullptr;
        std::shared_ptr<batch_t> batch;
    };


    worker_pool(int num_workers=4, listener_t* listener=nullptr) : listener(listener)
    {
        for (int n = 0; n < num_workers; ++n)
        {
            threads.push_back(make_worker(n));
        }
    }


    ~worker_pool()
    {
        stop_all();
    }


    /**
     * Stop and join the workers. Tasks already queued are run first. Safe to
     * call more than once.
     */
    void stop_all()
    {
        {
            std::lock_guard<std::mutex> lock(mutex);

            if (stop)
            {
                return;
            }
            stop = true;
        }
        condition.notify_all();

        for (auto& thread : threads)
        {
            thread.join();
        }
    }


    /**
     * Run every task in the batch and return once all of them have returned.
     * If any task throws, the first exception is rethrown here after the
     * whole batch has finished. A pool with no threads, or one that has been
     * stopped, runs the batch on the calling thread.
     */
    void run_all(std::vector<task_t> tasks)
    {
        if (tasks.empty())
        {
            return;
        }

        auto batch = std::make_shared<batch_t>();
        batch->remaining = tasks.size();

        {
            std::lock_guard<std::mutex> lock(mutex);

            if (! threads.empty() && ! stop)
            {
                for (auto& task : tasks)
                {
                    task.batch = batch;
                    pending_tasks.push_back(std::move(task));
                }
                tasks.clear();
            }
        }

        if (! tasks.empty())
        {
            for (auto& task : tasks)
            {
                task.run();
            }
            return;
        }
        condition.notify_all();

        std::unique_lock<std::mutex> lock(mutex);
        finished.wait(lock, [batch] { return batch->remaining == 0; });

        if (batch->error)
        {
            std::rethrow_exception(batch->error);
        }
    }


    /** Return the number of worker threads. */
    std::size_t size() const
    {
        return threads.size();
    }


private:


    /**
     * Called by other threads to await the next available task. Pops that
     * task from the queue and returns it. If there was no task, then an empty
     * task is returned. That should only be the case when the pool is
     * shutting down.
     */
    task_t next(int id)
    {
        std::unique_lock<std::mutex> lock(mutex);
        condition.wait(lock, [this] { return stop || ! pending_tasks.empty(); });

        if (pending_tasks.empty())
        {
            return {std::string(), nullptr};
        }

        auto task = std::move(pending_tasks.front());
        pending_tasks.erase(pending_tasks.begin());
        lock.unlock();

        if (listener)
        {
            listener->task_starting(id, task.name);
        }
        return task;
    }


    /**
     * Called by other threads to indicate they have finished a task.
     */
    void complete(const task_t& task, int id, std::exception_ptr error)
    {
        if (listener)
        {
            listener->task_finished(id, task.name);
        }

        std::lock_guard<std::mutex> lock(mutex);

        if (error && ! task.batch->error)
        {
            task.batch->error = error;
        }
        if (--task.batch->remaining == 0)
        {
            finished.notify_all();
        }
    }


    /**
     * Called by the constructor to create the workers.
     */
    std::thread make_worker(int id)
    {
        return std::thread([this, id] ()
        {
            while (auto task = next(id))
            {
                auto error = std::exception_ptr();

                try {
                    task.run();
                }
                catch (...)
                {
                    error = std::current_exception();
                }
                complete(task, id, error);
            }
        });
    }


    std::vector<std::thread> threads;
    std::vector<task_t> pending_tasks;
    std::condition_variable condition;
    std::condition_variable finished;
    std::atomic<bool> stop = {false};
    std::mutex mutex;
    listener_t* listener = nullptr;
};




//=============================================================================
#ifdef TEST_WORKERS
#include <catch2/catch.hpp>
#include <chrono>
#include <stdexcept>
using namespace rce;




//=============================================================================
namespace {

    class counting_listener : public worker_pool::listener_t
    {
    public:
        void task_starting(int, std::string) override { ++started; }
        void task_finished(int, std::string) override { ++finished; }
        std::atomic<int> started = {0};
        std::atomic<int> finished = {0};
    };
}




//=============================================================================
TEST_CASE("worker pool runs a batch to completion", "[workers]")
{
    counting_listener listener;
    worker_pool pool(4, &listener);
    auto slots = std::vector<int>(100, 0);
    auto tasks = std::vector<worker_pool::task_t>();

    for (int n = 0; n < 100; ++n)
    {
        tasks.push_back({"task-" + std::to_string(n), [&slots, n] { slots[n] = n * n; }});
    }
    pool.run_all(tasks);

    for (int n = 0; n < 100; ++n)
    {
        REQUIRE(slots[n] == n * n);
    }
    REQUIRE(listener.started.load() == 100);
    REQUIRE(listener.finished.load() == 100);
}




TEST_CASE("worker pool rethrows the first failure after the batch", "[workers]")
{
    worker_pool pool(2);
    std::atomic<int> count(0);
    auto tasks = std::vector<worker_pool::task_t>();

    for (int n = 0; n < 10; ++n)
    {
        tasks.push_back({"task", [&count, n]
        {
            ++count;

            if (n == 3)
            {
                throw std::runtime_error("task failed");
            }
        }});
    }
    REQUIRE_THROWS_AS(pool.run_all(tasks), std::runtime_error);
    REQUIRE(count.load() == 10);
}




TEST_CASE("worker pool finishes batches submitted while it stops", "[workers]")
{
    worker_pool pool(3);
    std::atomic<int> count(0);

    auto stopper = std::thread([&pool]
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        pool.stop_all();
    });

    for (int b = 0; b < 500; ++b)
    {
        auto tasks = std::vector<worker_pool::task_t>();

        for (int n = 0; n < 8; ++n)
        {
            tasks.push_back({"task", [&count] { ++count; }});
        }
        pool.run_all(tasks);
    }
    stopper.join();

    REQUIRE(count.load() == 500 * 8);
}




TEST_CASE("worker pool can be stopped more than once", "[workers]")
{
    worker_pool pool(2);
    auto ran = false;

    pool.stop_all();
    pool.stop_all();
    pool.run_all({{"inline", [&ran] { ran = true; }}});
    REQUIRE(ran);
}



#endif // TEST_WORKERS
