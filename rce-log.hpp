#pragma once
#include <cstdlib>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include "rce-workers.hpp"




//=============================================================================
namespace rce
{
    inline std::shared_ptr<spdlog::logger> logger();
    inline void set_log_level(spdlog::level::level_enum level);
    class logging_listener;
}




//=============================================================================
/**
 * Return the library's logger, named "rce" and writing to stderr. It is
 * created on first use at level warn; a SPDLOG_LEVEL environment variable
 * (e.g. SPDLOG_LEVEL=rce=debug) takes precedence.
 */
std::shared_ptr<spdlog::logger> rce::logger()
{
    static auto instance = [] ()
    {
        auto l = spdlog::get("rce");

        if (! l)
        {
            l = spdlog::stderr_color_mt("rce");
            l->set_level(spdlog::level::warn);
            spdlog::cfg::load_env_levels();
        }
        return l;
    }();
    return instance;
}


/**
 * Set the level of the library's logger, unless the environment has already
 * chosen one.
 */
void rce::set_log_level(spdlog::level::level_enum level)
{
    if (! std::getenv("SPDLOG_LEVEL"))
    {
        logger()->set_level(level);
    }
}




//=============================================================================
/**
 * Worker pool listener that traces each task at trace level.
 */
class rce::logging_listener : public worker_pool::listener_t
{
public:
    void task_starting(int worker, std::string name) override
    {
        logger()->trace("worker {}: evaluating {}", worker, name);
    }

    void task_finished(int worker, std::string name) override
    {
        logger()->trace("worker {}: finished {}", worker, name);
    }
};
