#pragma once
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <set>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>
#include <boost/optional.hpp>
#include <immer/map.hpp>
#include "rce-expr.hpp"
#include "rce-graph.hpp"
#include "rce-log.hpp"
#include "rce-scheduler.hpp"




//=============================================================================
namespace rce
{


    //=========================================================================
    class engine;


    /**
     * Engine settings. The defaults suit an interactive process; tests use
     * num_workers = 0 to keep everything on one thread.
     */
    struct config
    {
        int num_workers = std::max(2, int(std::thread::hardware_concurrency()));
        std::size_t inline_threshold = 4;
        spdlog::level::level_enum log_level = spdlog::level::warn;
        host_registry host;
    };


    /**
     * A cell as stored by the engine. At most one of result and error is
     * populated; a cell that has not been evaluated since it was loaded has
     * neither.
     */
    struct cell_t
    {
        std::string definition;
        value result;
        std::string error;
    };


    /**
     * A read-only copy of one cell, as handed out by engine::snapshot.
     */
    struct cell_view
    {
        std::string id;
        std::string definition;
        value result;
        std::string error;
        std::vector<std::string> dependencies;
    };
}




//=============================================================================
/**
 * A table of named cells holding literal values or formulas. Changing a cell
 * recomputes everything that depends on it, level by level, spreading wide
 * levels over a worker pool.
 *
 * Mutating methods are serialized by an exclusive lock, and build the next
 * state from persistent copies of the current one before publishing it in a
 * single step. Reading methods take an optimistic snapshot of the published
 * state, falling back to a shared lock while a writer is active. A reader
 * therefore sees either all or none of a mutation's effects.
 */
class rce::engine
{
public:


    //=========================================================================
    engine(const config& cfg=config());
    ~engine();


    //=========================================================================
    /**
     * Give a cell a new definition: empty, a literal, or =formula. The cell
     * and everything depending on it are recomputed before this returns.
     * Cells referenced by the formula that do not exist yet are created
     * empty. Throws invalid_identifier, reserved_name or circular_reference
     * without changing anything.
     */
    void set(const std::string& id, const std::string& definition);
    void set(const std::string& id, const char* definition);
    void set(const std::string& id, const decimal& number);
    void set(const std::string& id, double number);
    void set(const std::string& id, int number);
    void set(const std::string& id, bool boolean);


    /**
     * Remove a cell and recompute its dependents, which will then report an
     * unresolved reference. Does nothing if the cell does not exist.
     */
    void erase(const std::string& id);


    /**
     * Merge id:definition lines into the table without computing anything.
     * Referenced cells that do not exist are created empty, as by set. Call
     * recalculate afterwards. Throws malformed_line or
     * invalid_identifier, naming the line, and commits nothing if any line
     * is bad.
     */
    void load(std::istream& is);


    /**
     * Recompute every cell in dependency order. Cells that cannot be ordered
     * because of a cycle get a circular reference error.
     */
    void recalculate();


    void clear();
    void define(const std::string& name, func_t func);
    void shutdown();


    //=========================================================================
    boost::optional<std::string> get(const std::string& id) const;
    boost::optional<decimal> get_number(const std::string& id) const;
    std::string get_definition(const std::string& id) const;
    std::string get_error(const std::string& id) const;
    std::string get_type(const std::string& id) const;
    bool exists(const std::string& id) const;
    std::size_t size() const;


    /**
     * Write one id:definition line per cell with a non-empty definition.
     */
    void save(std::ostream& os) const;


    /**
     * Return a consistent copy of every cell, in id order.
     */
    std::vector<cell_view> snapshot() const;


private:


    //=========================================================================
    struct state_t
    {
        immer::map<std::string, cell_t> cells;
        graph deps;
    };


    /**
     * Makes the version stamp odd for the lifetime of a write.
     */
    struct write_guard
    {
        write_guard(std::atomic<std::uint64_t>& stamp) : stamp(stamp) { ++stamp; }
        ~write_guard() { ++stamp; }
        std::atomic<std::uint64_t>& stamp;
    };


    //=========================================================================
    std::shared_ptr<const state_t> read() const;
    void publish(state_t state);
    state_t recompute(state_t state, const std::set<std::string>& subset);
    cell_t evaluate(const state_t& state, const std::string& id) const;
    value evaluate_definition(const state_t& state, const std::string& definition) const;
    static void materialize(state_t& state, const graph::set_t& deps);
    static graph::set_t dependencies_of(const std::string& definition);


    //=========================================================================
    mutable std::shared_timed_mutex mutex;
    std::atomic<std::uint64_t> stamp = {0};
    std::shared_ptr<const state_t> published;
    host_registry host;
    scheduler sched;
};




//=============================================================================
#ifdef TEST_ENGINE
#include <catch2/catch.hpp>
#include <map>
#include <sstream>
#include <thread>
#include <boost/optional/optional_io.hpp>
using namespace rce;




//=============================================================================
namespace {

    config single_threaded()
    {
        auto cfg = config();
        cfg.num_workers = 0;
        return cfg;
    }
}




//=============================================================================
TEST_CASE("engine stores literal values", "[engine]")
{
    engine e(single_threaded());

    e.set("A1", "100");
    e.set("B1", 200.5);
    e.set("C1", true);
    e.set("D1", "Hello World");
    e.set("E1", "'你好'");
    e.set("F1", decimal("1.50"));
    e.set("G1", 7);
    e.set("H1", "");

    REQUIRE(e.get("A1") == std::string("100"));
    REQUIRE(e.get_type("A1") == "number");
    REQUIRE(e.get("B1") == std::string("200.5"));
    REQUIRE(e.get("C1") == std::string("TRUE"));
    REQUIRE(e.get_type("C1") == "boolean");
    REQUIRE(e.get("D1") == std::string("Hello World"));
    REQUIRE(e.get_type("D1") == "text");
    REQUIRE(e.get("E1") == std::string("你好"));
    REQUIRE(e.get_definition("E1") == "'你好'");
    REQUIRE(e.get("F1") == std::string("1.5"));
    REQUIRE(e.get_number("G1") == decimal(7));
    REQUIRE(e.get("H1") == std::string());
    REQUIRE(e.get_type("H1") == "empty");
    REQUIRE_FALSE(e.get_number("D1"));
    REQUIRE_FALSE(e.get("Z9"));
    REQUIRE(e.get_type("Z9") == "empty");
    REQUIRE(e.size() == 8);
}




TEST_CASE("engine evaluates arithmetic formulas", "[engine]")
{
    engine e(single_threaded());

    e.set("A1", "100");
    e.set("B1", "200.5");
    e.set("E1", "=A1+B1");
    e.set("E2", "=A1*B1");
    e.set("E3", "=B1/A1");
    e.set("E4", "=A1^2");
    e.set("E5", "=A1%7");
    e.set("E6", "=B1\\A1");
    e.set("E7", "=0.1+0.2");

    REQUIRE(e.get("E1") == std::string("300.5"));
    REQUIRE(e.get("E2") == std::string("20050"));
    REQUIRE(e.get("E3") == std::string("2.005"));
    REQUIRE(e.get("E4") == std::string("10000"));
    REQUIRE(e.get("E5") == std::string("2"));
    REQUIRE(e.get("E6") == std::string("2"));
    REQUIRE(e.get("E7") == std::string("0.3"));
}




TEST_CASE("engine evaluates logic and built-in functions", "[engine]")
{
    engine e(single_threaded());

    e.set("A1", "100");
    e.set("B1", "200.5");
    e.set("C1", "true");
    e.set("F1", "=A1>50");
    e.set("F2", "=A1==100");
    e.set("F3", "=C1&&true");
    e.set("F4", "=A1>50&&B1<300");
    e.set("F5", "=NOT(TRUE)");
    e.set("F6", "=XOR(TRUE,FALSE,TRUE)");
    e.set("F7", "=AND(TRUE,TRUE,TRUE)");
    e.set("F8", "=OR(TRUE,FALSE,TRUE)");

    REQUIRE(e.get("F1") == std::string("TRUE"));
    REQUIRE(e.get("F2") == std::string("TRUE"));
    REQUIRE(e.get("F3") == std::string("TRUE"));
    REQUIRE(e.get("F4") == std::string("TRUE"));
    REQUIRE(e.get("F5") == std::string("FALSE"));
    REQUIRE(e.get("F6") == std::string("FALSE"));
    REQUIRE(e.get("F7") == std::string("TRUE"));
    REQUIRE(e.get("F8") == std::string("TRUE"));

    e.set("G1", "=ABS(-50)");
    e.set("G2", "=MAX(A1,B1)");
    e.set("G3", "=MIN(A1,B1)");
    e.set("G4", "=SQRT(A1)");
    e.set("G5", "=ROUND(B1,1)");
    e.set("G6", "=IF(A1>50,'大,big','小 and small')");
    e.set("C1", 55);
    e.set("G7", "=IFS(C1>=90,'优',C1>=80,'良',C1>=60,'中','差')");

    REQUIRE(e.get("G1") == std::string("50"));
    REQUIRE(e.get("G2") == std::string("200.5"));
    REQUIRE(e.get("G3") == std::string("100"));
    REQUIRE(e.get("G4") == std::string("10"));
    REQUIRE(e.get("G5") == std::string("200.5"));
    REQUIRE(e.get("G6") == std::string("大,big"));
    REQUIRE(e.get("G7") == std::string("差"));
    REQUIRE(e.get("F3") == std::string("TRUE"));
}




TEST_CASE("engine propagates changes to dependents", "[engine]")
{
    engine e(single_threaded());

    e.set("A1", "100");
    e.set("H1", "=A1+10");
    e.set("H2", "=H1*2");
    e.set("H3", "=H2+H1");

    REQUIRE(e.get("H1") == std::string("110"));
    REQUIRE(e.get("H2") == std::string("220"));
    REQUIRE(e.get("H3") == std::string("330"));

    e.set("A1", "150");

    REQUIRE(e.get("H1") == std::string("160"));
    REQUIRE(e.get("H2") == std::string("320"));
    REQUIRE(e.get("H3") == std::string("480"));

    SECTION("a formula may reference a cell before it is defined")
    {
        e.set("P1", "=Q1*2");
        REQUIRE(e.exists("Q1"));
        REQUIRE(e.get_type("Q1") == "empty");
        REQUIRE(e.get_definition("Q1") == "");
        REQUIRE_FALSE(e.get("P1"));

        e.set("Q1", 21);
        REQUIRE(e.get("P1") == std::string("42"));
    }
}




TEST_CASE("engine rejects cycles without changing state", "[engine]")
{
    engine e(single_threaded());

    e.set("A1", "1");
    e.set("A2", "=A1+1");
    e.set("A3", "=A2+1");

    REQUIRE_THROWS_AS(e.set("A1", "=A3+1"), circular_reference);
    REQUIRE_THROWS_AS(e.set("A1", "=A1"), circular_reference);
    REQUIRE(e.get_definition("A1") == "1");
    REQUIRE(e.get("A3") == std::string("3"));

    try {
        e.set("A1", "=A3");
        FAIL("expected a circular reference");
    }
    catch (const circular_reference& error)
    {
        REQUIRE(error.get_path() == std::vector<std::string>{"A1", "A3", "A2", "A1"});
    }

    e.set("A1", "10");
    REQUIRE(e.get("A3") == std::string("12"));
}




TEST_CASE("engine rejects invalid identifiers", "[engine]")
{
    engine e(single_threaded());

    REQUIRE_THROWS_AS(e.set("1A", "1"), invalid_identifier);
    REQUIRE_THROWS_AS(e.set("A-1", "1"), invalid_identifier);
    REQUIRE_THROWS_AS(e.set("sqrt", "1"), reserved_name);
    REQUIRE_THROWS_AS(e.set("TRUE", "1"), reserved_name);
    REQUIRE_THROWS_AS(e.erase("1A"), invalid_identifier);
    REQUIRE(e.size() == 0);
}




TEST_CASE("engine stores evaluation errors on the cell", "[engine]")
{
    engine e(single_threaded());

    e.set("A1", "100");
    e.set("J1", "=A1/0");
    e.set("J2", "=INVALID_FUNC(A1)");
    e.set("J3", "=NONEXISTENT_CELL+1");
    e.set("J4", "=A1 +");
    e.set("J5", "=J1+1");

    REQUIRE_FALSE(e.get("J1"));
    REQUIRE(e.get_error("J1").find("division by zero") != std::string::npos);
    REQUIRE(e.get_type("J1") == "empty");
    REQUIRE_FALSE(e.get("J2"));
    REQUIRE(e.get_error("J2").find("unknown function") != std::string::npos);
    REQUIRE_FALSE(e.get("J3"));
    REQUIRE_FALSE(e.get_error("J3").empty());
    REQUIRE_FALSE(e.get("J4"));
    REQUIRE(e.get_error("J4").find("parse error") != std::string::npos);
    REQUIRE_FALSE(e.get("J5"));
    REQUIRE(e.get_error("J5").find("unresolved reference: J1") != std::string::npos);

    e.set("J1", "=A1/4");
    REQUIRE(e.get("J1") == std::string("25"));
    REQUIRE(e.get_error("J1").empty());
    REQUIRE(e.get("J5") == std::string("26"));
}




TEST_CASE("engine recomputes dependents of an erased cell", "[engine]")
{
    engine e(single_threaded());

    e.set("A1", "1");
    e.set("A2", "=A1+1");
    e.set("A3", "=A2+1");
    e.erase("A1");

    REQUIRE_FALSE(e.exists("A1"));
    REQUIRE_FALSE(e.get("A2"));
    REQUIRE(e.get_error("A2").find("unresolved reference: A1") != std::string::npos);
    REQUIRE_FALSE(e.get("A3"));
    REQUIRE_FALSE(e.get_error("A3").empty());
    REQUIRE_NOTHROW(e.erase("A1"));

    e.set("A1", "5");
    REQUIRE(e.get("A3") == std::string("7"));
}




TEST_CASE("engine calls host functions through extern", "[engine]")
{
    auto cfg = single_threaded();
    cfg.host.define("factorial", [] (const args_t& args)
    {
        auto n = args.at(0).as_number();
        auto result = decimal(1);

        for (auto k = decimal(2); k <= n; k += 1)
            result *= k;
        return value(result);
    });

    engine e(cfg);
    e.define("str", [] (const args_t& args) { return value(args.at(0).as_str()); });

    e.set("K1", "=extern('str',100)");
    e.set("K2", "=extern('factorial',5)");
    e.set("K3", "=extern('notFound',1,2)");

    e.define("raw", [] (const args_t&) -> value { throw 42; });
    e.set("K4", "=extern('raw')");

    REQUIRE(e.get("K1") == std::string("100"));
    REQUIRE(e.get_type("K1") == "text");
    REQUIRE(e.get("K2") == std::string("120"));
    REQUIRE_FALSE(e.get("K3"));
    REQUIRE(e.get_error("K3").find("host call failure") != std::string::npos);
    REQUIRE_FALSE(e.get("K4"));
    REQUIRE(e.get_error("K4").find("host call failure") != std::string::npos);
}




TEST_CASE("engine saves and loads definitions", "[engine]")
{
    engine e(single_threaded());

    e.set("A1", "100");
    e.set("B1", "=A1*2");
    e.set("C1", "'a:b'");
    e.set("D1", "=E1+1");
    e.set("D2", "=E2");

    auto before = std::map<std::string, boost::optional<std::string>>();

    for (const auto& c : e.snapshot())
    {
        before[c.id] = e.get(c.id);
    }
    REQUIRE(before.size() == 7);
    REQUIRE(before["D2"] == std::string());

    auto out = std::ostringstream();
    e.save(out);

    auto text = out.str();
    REQUIRE(text.find("A1:100\n") != std::string::npos);
    REQUIRE(text.find("B1:=A1*2\n") != std::string::npos);
    REQUIRE(text.find("C1:'a:b'\n") != std::string::npos);
    REQUIRE(text.find("E1:") == std::string::npos);

    e.clear();
    REQUIRE(e.size() == 0);

    auto in = std::istringstream(text);
    e.load(in);

    REQUIRE(e.size() == 7);
    REQUIRE(e.get_definition("B1") == "=A1*2");
    REQUIRE_FALSE(e.get("A1"));
    REQUIRE(e.exists("E1"));
    REQUIRE(e.get_type("E2") == "empty");

    e.recalculate();

    for (const auto& item : before)
    {
        REQUIRE(e.get(item.first) == item.second);
    }
    REQUIRE(e.get("B1") == std::string("200"));
    REQUIRE(e.get("C1") == std::string("a:b"));
    REQUIRE(e.get("D2") == std::string());
    REQUIRE_FALSE(e.get("D1"));

    e.set("A1", "1");
    REQUIRE(e.get("B1") == std::string("2"));

    e.set("E2", "5");
    REQUIRE(e.get("D2") == std::string("5"));
}




TEST_CASE("engine load is all or nothing", "[engine]")
{
    engine e(single_threaded());
    e.set("A1", "1");

    SECTION("a line without a colon")
    {
        auto in = std::istringstream("B1:2\n\n  C1 = 3\n");

        try {
            e.load(in);
            FAIL("expected a malformed line");
        }
        catch (const malformed_line& error)
        {
            REQUIRE(error.get_line() == 3);
        }
    }
    SECTION("an invalid identifier")
    {
        auto in = std::istringstream("B1:2\n1C:3\n");

        try {
            e.load(in);
            FAIL("expected an invalid identifier");
        }
        catch (const invalid_identifier& error)
        {
            REQUIRE(std::string(error.what()).find("line 2") == 0);
        }
    }
    SECTION("a reserved name")
    {
        auto in = std::istringstream("B1:2\nmax:3\n");
        REQUIRE_THROWS_AS(e.load(in), reserved_name);
    }

    REQUIRE_FALSE(e.exists("B1"));
    REQUIRE(e.get("A1") == std::string("1"));
}




TEST_CASE("engine load merges and trims lines", "[engine]")
{
    engine e(single_threaded());
    e.set("A1", "1");
    e.set("Z1", "=A1");

    auto in = std::istringstream("  B1 :=A1+Z1\r\n\r\nA1:2\n");
    e.load(in);

    REQUIRE(e.get_definition("B1") == "=A1+Z1");
    REQUIRE(e.get("Z1") == std::string("1"));

    e.recalculate();

    REQUIRE(e.get("Z1") == std::string("2"));
    REQUIRE(e.get("B1") == std::string("4"));
}




TEST_CASE("engine recalculate marks cycles introduced by load", "[engine]")
{
    engine e(single_threaded());

    auto in = std::istringstream("A1:=B1+1\nB1:=A1+1\nC1:=A1\nD1:5\n");
    e.load(in);
    e.recalculate();

    REQUIRE(e.get_error("A1").find("circular reference") != std::string::npos);
    REQUIRE(e.get_error("B1").find("circular reference") != std::string::npos);
    REQUIRE(e.get_error("C1").find("circular reference") != std::string::npos);
    REQUIRE(e.get("D1") == std::string("5"));

    e.set("Z", "=A1");

    REQUIRE_FALSE(e.get("Z"));
    REQUIRE(e.get_error("Z").find("unresolved reference: A1") != std::string::npos);
    REQUIRE_THROWS_AS(e.set("A1", "=Z"), circular_reference);

    e.set("B1", "7");

    REQUIRE(e.get("A1") == std::string("8"));
    REQUIRE(e.get("Z") == std::string("8"));
}




TEST_CASE("engine snapshot lists every cell", "[engine]")
{
    engine e(single_threaded());

    e.set("B1", "=A1+C1");
    e.set("A1", "2");
    e.set("C1", "=1/0");

    auto cells = e.snapshot();

    REQUIRE(cells.size() == 3);
    REQUIRE(cells[0].id == "A1");
    REQUIRE(cells[0].result == value(2));
    REQUIRE(cells[1].id == "B1");
    REQUIRE(cells[1].dependencies == std::vector<std::string>{"A1", "C1"});
    REQUIRE_FALSE(cells[1].error.empty());
    REQUIRE(cells[2].id == "C1");
    REQUIRE(cells[2].result.is_none());
    REQUIRE(cells[2].error.find("division by zero") != std::string::npos);
}




TEST_CASE("engine spreads wide levels over the worker pool", "[engine]")
{
    auto cfg = config();
    cfg.num_workers = 4;
    cfg.inline_threshold = 2;

    engine e(cfg);
    e.set("X", "1");

    for (int n = 0; n < 50; ++n)
    {
        e.set("W" + std::to_string(n), "=X*" + std::to_string(n));
    }
    e.set("S", "=W10+W20+W49");
    e.set("X", "2");

    REQUIRE(e.get("W7") == std::string("14"));
    REQUIRE(e.get("S") == std::string("158"));

    e.shutdown();
    e.set("X", "3");

    REQUIRE(e.get("S") == std::string("237"));
}




TEST_CASE("engine readers see whole updates of a long chain", "[engine]")
{
    const int depth = 40;

    auto cfg = config();
    cfg.num_workers = 4;

    engine e(cfg);
    e.set("C0", "0");

    for (int n = 1; n < depth; ++n)
    {
        e.set("C" + std::to_string(n), "=C" + std::to_string(n - 1) + "+1");
    }

    std::atomic<bool> done(false);
    std::atomic<int> inconsistent(0);
    auto readers = std::vector<std::thread>();

    for (int r = 0; r < 4; ++r)
    {
        readers.emplace_back([&]
        {
            while (! done)
            {
                auto cells = e.snapshot();
                auto first = decimal();
                auto last = decimal();

                for (const auto& c : cells)
                {
                    if (c.id == "C0") first = c.result.get_number();
                    if (c.id == "C" + std::to_string(depth - 1)) last = c.result.get_number();
                }
                if (last - first != depth - 1)
                {
                    ++inconsistent;
                }
            }
        });
    }

    for (int k = 1; k <= 50; ++k)
    {
        e.set("C0", k * 100);
        REQUIRE(e.get_number("C" + std::to_string(depth - 1)) == decimal(k * 100 + depth - 1));
    }
    done = true;

    for (auto& reader : readers)
    {
        reader.join();
    }
    REQUIRE(inconsistent.load() == 0);
}



#endif // TEST_ENGINE
