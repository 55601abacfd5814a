#pragma once
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>
#include "rce-graph.hpp"
#include "rce-log.hpp"
#include "rce-workers.hpp"




//=============================================================================
namespace rce {
    class scheduler;
}




//=============================================================================
/**
 * Evaluates the levels of a recompute in order, with a barrier between
 * consecutive levels. Small levels are evaluated on the calling thread;
 * larger ones are handed to the worker pool as a single batch.
 */
class rce::scheduler
{
public:


    scheduler(int num_workers=4, std::size_t inline_threshold=4)
    : inline_threshold(inline_threshold)
    {
        if (num_workers > 0)
        {
            pool = std::make_unique<worker_pool>(num_workers, &listener);
        }
    }


    ~scheduler()
    {
        shutdown();
    }


    /**
     * Evaluate every cell in levels. The evaluate callable maps a cell id to
     * a result and must not throw; it may be called from several threads at
     * once, but only for cells in the same level. After each level's barrier
     * the commit callable receives (id, result) for every cell of that level,
     * in order, on the calling thread.
     */
    template<typename Evaluate, typename Commit>
    void run(const graph::levels_t& levels, Evaluate evaluate, Commit commit)
    {
        using result_t = std::decay_t<decltype(evaluate(std::declval<const std::string&>()))>;

        for (std::size_t l = 0; l < levels.size(); ++l)
        {
            const auto& level = levels[l];
            auto results = std::vector<result_t>(level.size());

            if (! pool || level.size() <= inline_threshold)
            {
                for (std::size_t n = 0; n < level.size(); ++n)
                {
                    results[n] = evaluate(level[n]);
                }
            }
            else
            {
                auto tasks = std::vector<worker_pool::task_t>();

                for (std::size_t n = 0; n < level.size(); ++n)
                {
                    tasks.push_back({level[n], [&results, &evaluate, &level, n]
                    {
                        results[n] = evaluate(level[n]);
                    }});
                }
                logger()->trace("level {}: {} cells on {} workers", l, level.size(), pool->size());
                pool->run_all(std::move(tasks));
            }

            for (std::size_t n = 0; n < level.size(); ++n)
            {
                commit(level[n], results[n]);
            }
        }
    }


    /**
     * Stop and release the worker pool. Later runs evaluate inline.
     */
    void shutdown()
    {
        pool.reset();
    }


    bool has_pool() const
    {
        return pool != nullptr;
    }


private:
    std::size_t inline_threshold;
    logging_listener listener;
    std::unique_ptr<worker_pool> pool;
};




//=============================================================================
#ifdef TEST_SCHEDULER
#include <catch2/catch.hpp>
#include <map>
#include <mutex>
#include <thread>
using namespace rce;




//=============================================================================
TEST_CASE("scheduler commits levels in order", "[scheduler]")
{
    auto levels = graph::levels_t{{"A"}, {"B", "C"}, {"D"}};
    auto values = std::map<std::string, int>{{"A", 1}};
    auto commits = std::vector<std::string>();

    auto evaluate = [&values] (const std::string& id)
    {
        if (id == "A") return 1;
        if (id == "D") return values.at("B") + values.at("C");
        return values.at("A") * (id == "B" ? 10 : 100);
    };
    auto commit = [&values, &commits] (const std::string& id, int v)
    {
        values[id] = v;
        commits.push_back(id);
    };

    SECTION("inline")
    {
        scheduler(0).run(levels, evaluate, commit);
    }
    SECTION("on the worker pool")
    {
        scheduler(4, 0).run(levels, evaluate, commit);
    }

    REQUIRE(commits == std::vector<std::string>{"A", "B", "C", "D"});
    REQUIRE(values["D"] == 110);
}




TEST_CASE("scheduler evaluates wide levels on several threads", "[scheduler]")
{
    auto level = std::vector<std::string>();
    auto threads = std::set<std::thread::id>();
    std::mutex mutex;
    auto total = 0;

    for (int n = 0; n < 64; ++n)
    {
        level.push_back("X" + std::to_string(n));
    }

    scheduler s(4, 4);
    s.run({level}, [&] (const std::string& id)
    {
        std::lock_guard<std::mutex> lock(mutex);
        threads.insert(std::this_thread::get_id());
        return std::stoi(id.substr(1));
    },
    [&] (const std::string&, int v)
    {
        total += v;
    });

    REQUIRE(total == 63 * 64 / 2);
    REQUIRE(threads.count(std::this_thread::get_id()) == 0);

    s.shutdown();
    REQUIRE_FALSE(s.has_pool());

    s.run({level}, [] (const std::string&) { return 1; }, [&] (const std::string&, int v) { total += v; });
    REQUIRE(total == 63 * 64 / 2 + 64);
}



#endif // TEST_SCHEDULER
