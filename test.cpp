#define CATCH_CONFIG_MAIN
#define TEST_DECIMAL
#define TEST_VALUE
#define TEST_EXPR
#define TEST_GRAPH
#define TEST_WORKERS
#define TEST_SCHEDULER
#define TEST_ENGINE
#include <catch2/catch.hpp>
#include "rce-decimal.hpp"
#include "rce-value.hpp"
#include "rce-expr.hpp"
#include "rce-graph.hpp"
#include "rce-workers.hpp"
#include "rce-scheduler.hpp"
#include "rce.hpp"
