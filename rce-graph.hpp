#pragma once
#include <algorithm>
#include <deque>
#include <map>
#include <set>
#include <string>
#include <vector>
#include <immer/map.hpp>
#include <immer/set.hpp>
#include "rce-value.hpp"




//=============================================================================
namespace rce {
    class graph;
}




//=============================================================================
/**
 * An immutable dependency graph over cell ids. The incoming edges of a cell
 * are the ids its formula references; the outgoing edges are the cells whose
 * formulas reference it. Every mutator returns a new graph, so a graph can
 * be read from any number of threads while a writer prepares its successor.
 *
 * Outgoing entries are kept for ids that have no incoming entry: a deleted
 * or never-defined cell is still a dependency of whoever names it.
 */
class rce::graph
{
public:


    using set_t = immer::set<std::string>;
    using dag_t = immer::map<std::string, set_t>;
    using levels_t = std::vector<std::vector<std::string>>;


    /** Default constructor */
    graph() {}


    /**
     * Replace the dependencies of the given cell, keeping the outgoing edges
     * of its old and new dependencies up to date. Empty entries are pruned.
     */
    graph set_dependencies(const std::string& id, const set_t& deps) const
    {
        auto o = remove_through(outgoing, id, get_incoming(id));
        o = add_through(std::move(o), id, deps);

        return {
            deps.empty() ? incoming.erase(id) : incoming.set(id, deps),
            std::move(o),
        };
    }


    /**
     * Remove the dependencies of the given cell. Cells depending on it keep
     * their edges to it.
     */
    graph erase(const std::string& id) const
    {
        return set_dependencies(id, set_t());
    }


    /**
     * Recompute the outgoing edges from the incoming ones.
     */
    graph rebuild() const
    {
        auto o = dag_t();

        for (const auto& item : incoming)
        {
            o = add_through(std::move(o), item.first, item.second);
        }
        return {incoming, std::move(o)};
    }


    /**
     * Return the ids referenced by the given cell, or an empty set.
     */
    set_t get_incoming(const std::string& id) const
    {
        if (auto s = incoming.find(id))
        {
            return *s;
        }
        return {};
    }


    /**
     * Return the ids of cells that reference the given one, or an empty set.
     */
    set_t get_outgoing(const std::string& id) const
    {
        if (auto s = outgoing.find(id))
        {
            return *s;
        }
        return {};
    }


    /** Return true if the given id has dependencies or dependents. */
    bool contains(const std::string& id) const
    {
        return incoming.count(id) || outgoing.count(id);
    }


    /** Return the number of cells that have dependencies. */
    std::size_t size() const
    {
        return incoming.size();
    }


    /**
     * Return true if giving the cell id the candidate dependencies would
     * close a cycle. Each candidate is searched depth-first through the
     * committed dependency sets; a node is visited at most once, so cycles
     * already present in the graph that do not pass through id are walked
     * past. If path is given and a cycle is found, it receives the
     * chain id -> ... -> id.
     */
    bool has_cycle(const std::string& id, const set_t& candidate, std::vector<std::string>* path=nullptr) const
    {
        auto done = std::set<std::string>();
        auto chain = std::vector<std::string>{id};

        for (const auto& d : candidate)
        {
            if (reaches(id, d, done, chain))
            {
                if (path)
                {
                    *path = chain;
                }
                return true;
            }
        }
        return false;
    }


    /**
     * Return every cell that depends, directly or indirectly, on the given
     * one. The cell itself is not included unless it sits on a cycle.
     */
    std::set<std::string> collect_transitive_dependents(const std::string& id) const
    {
        auto result = std::set<std::string>();
        auto queue = std::deque<std::string>{id};

        while (! queue.empty())
        {
            auto next = queue.front();
            queue.pop_front();

            for (const auto& d : get_outgoing(next))
            {
                if (result.insert(d).second)
                {
                    queue.push_back(d);
                }
            }
        }
        return result;
    }


    /**
     * Return the cells in subset ordered so that every cell comes after those
     * of its dependencies that are also in subset. Dependencies outside
     * subset are ignored. If some cells cannot be ordered because they sit
     * on or behind a cycle, they are written to unordered, or if unordered
     * is null, circular_reference is thrown.
     */
    std::vector<std::string> topo_order(const std::set<std::string>& subset, std::vector<std::string>* unordered=nullptr) const
    {
        auto result = std::vector<std::string>();
        auto pending = std::map<std::string, int>();
        auto ready = std::deque<std::string>();

        for (const auto& c : subset)
        {
            auto n = 0;

            for (const auto& d : get_incoming(c))
            {
                if (subset.count(d))
                {
                    ++n;
                }
            }
            if (n == 0)
            {
                ready.push_back(c);
            }
            pending[c] = n;
        }

        while (! ready.empty())
        {
            auto c = ready.front();
            ready.pop_front();
            result.push_back(c);

            auto next = std::vector<std::string>();

            for (const auto& d : get_outgoing(c))
            {
                auto p = pending.find(d);

                if (p != pending.end() && --p->second == 0)
                {
                    next.push_back(d);
                }
            }
            std::sort(next.begin(), next.end());
            ready.insert(ready.end(), next.begin(), next.end());
        }

        if (result.size() < subset.size())
        {
            auto rest = std::vector<std::string>();

            for (const auto& p : pending)
            {
                if (p.second > 0)
                {
                    rest.push_back(p.first);
                }
            }
            if (! unordered)
            {
                throw circular_reference(rest);
            }
            *unordered = rest;
        }
        return result;
    }


    /**
     * Group an ordered list of cells into levels. A cell's level is one more
     * than the highest level among its dependencies in subset, or zero if it
     * has none there. Cells in the same level never depend on one another.
     */
    levels_t assign_levels(const std::vector<std::string>& order, const std::set<std::string>& subset) const
    {
        auto level = std::map<std::string, std::size_t>();
        auto levels = levels_t();

        for (const auto& c : order)
        {
            auto n = std::size_t(0);

            for (const auto& d : get_incoming(c))
            {
                auto l = level.find(d);

                if (subset.count(d) && l != level.end())
                {
                    n = std::max(n, l->second + 1);
                }
            }
            level[c] = n;

            if (levels.size() <= n)
            {
                levels.resize(n + 1);
            }
            levels[n].push_back(c);
        }
        return levels;
    }


private:


    /** @internal constructor */
    graph(dag_t incoming, dag_t outgoing)
    : incoming(incoming)
    , outgoing(outgoing)
    {
    }


    bool reaches(const std::string& target, const std::string& from, std::set<std::string>& done, std::vector<std::string>& chain) const
    {
        chain.push_back(from);

        if (from == target)
        {
            return true;
        }
        if (done.insert(from).second)
        {
            for (const auto& d : get_incoming(from))
            {
                if (reaches(target, d, done, chain))
                {
                    return true;
                }
            }
        }
        chain.pop_back();
        return false;
    }


    /**
     * out[s] -= id for s in deps
     */
    static dag_t remove_through(dag_t o, const std::string& id, const set_t& deps)
    {
        for (const auto& s : deps)
        {
            if (auto existing = o.find(s))
            {
                auto remaining = existing->erase(id);
                o = remaining.empty() ? std::move(o).erase(s) : std::move(o).set(s, remaining);
            }
        }
        return o;
    }


    /**
     * out[s] += id for s in deps
     */
    static dag_t add_through(dag_t o, const std::string& id, const set_t& deps)
    {
        for (const auto& s : deps)
        {
            auto existing = o.find(s);
            o = std::move(o).set(s, (existing ? *existing : set_t()).insert(id));
        }
        return o;
    }


    dag_t incoming;
    dag_t outgoing;
};




//=============================================================================
#ifdef TEST_GRAPH
#include <catch2/catch.hpp>
using namespace rce;




//=============================================================================
namespace {

    graph::set_t deps(std::initializer_list<std::string> ids)
    {
        auto s = graph::set_t();

        for (const auto& id : ids)
        {
            s = std::move(s).insert(id);
        }
        return s;
    }
}




//=============================================================================
TEST_CASE("graph maintains incoming and outgoing edges", "[graph]")
{
    SECTION("for a linear chain (C <- B <- A)")
    {
        auto g = graph()
        .set_dependencies("B", deps({"A"}))
        .set_dependencies("C", deps({"B"}));

        REQUIRE(g.size() == 2);
        REQUIRE(g.get_incoming("B") == deps({"A"}));
        REQUIRE(g.get_outgoing("A") == deps({"B"}));
        REQUIRE(g.get_outgoing("B") == deps({"C"}));
        REQUIRE(g.get_outgoing("C") == deps({}));
        REQUIRE(g.contains("A"));
        REQUIRE_FALSE(g.contains("D"));
    }

    SECTION("replacing dependencies prunes empty entries")
    {
        auto g = graph()
        .set_dependencies("B", deps({"A"}))
        .set_dependencies("B", deps({"X", "Y"}));

        REQUIRE(g.get_outgoing("A") == deps({}));
        REQUIRE_FALSE(g.contains("A"));
        REQUIRE(g.get_outgoing("X") == deps({"B"}));
        REQUIRE(g.set_dependencies("B", deps({})).size() == 0);
    }

    SECTION("erasing a cell keeps the edges of its dependents")
    {
        auto g = graph()
        .set_dependencies("B", deps({"A"}))
        .set_dependencies("C", deps({"B"}))
        .erase("B");

        REQUIRE(g.get_incoming("B") == deps({}));
        REQUIRE(g.get_outgoing("A") == deps({}));
        REQUIRE(g.get_outgoing("B") == deps({"C"}));
    }

    SECTION("rebuild restores the outgoing edges")
    {
        auto g = graph()
        .set_dependencies("B", deps({"A"}))
        .set_dependencies("C", deps({"A", "B"}));

        REQUIRE(g.rebuild().get_outgoing("A") == deps({"B", "C"}));
        REQUIRE(g.rebuild().get_outgoing("B") == deps({"C"}));
    }

    SECTION("old graphs are unchanged by mutations")
    {
        auto g1 = graph().set_dependencies("B", deps({"A"}));
        auto g2 = g1.set_dependencies("B", deps({"C"}));

        REQUIRE(g1.get_incoming("B") == deps({"A"}));
        REQUIRE(g2.get_incoming("B") == deps({"C"}));
    }
}




TEST_CASE("graph detects cycles before they are committed", "[graph]")
{
    auto g = graph()
    .set_dependencies("B", deps({"A"}))
    .set_dependencies("C", deps({"B"}));

    auto path = std::vector<std::string>();

    REQUIRE(g.has_cycle("A", deps({"C"}), &path));
    REQUIRE(path == std::vector<std::string>{"A", "C", "B", "A"});
    REQUIRE(g.has_cycle("A", deps({"A"})));
    REQUIRE_FALSE(g.has_cycle("D", deps({"C"})));
    REQUIRE_FALSE(g.has_cycle("A", deps({"X", "Y"})));
}




TEST_CASE("graph cycle check terminates on an existing cycle", "[graph]")
{
    auto g = graph()
    .set_dependencies("A", deps({"B"}))
    .set_dependencies("B", deps({"A"}))
    .set_dependencies("D", deps({"C"}));

    auto path = std::vector<std::string>();

    REQUIRE_FALSE(g.has_cycle("C", deps({"A"})));
    REQUIRE_FALSE(g.has_cycle("Z", deps({"A", "B"})));
    REQUIRE(g.has_cycle("C", deps({"A", "D"}), &path));
    REQUIRE(path == std::vector<std::string>{"C", "D", "C"});
}




TEST_CASE("graph collects transitive dependents", "[graph]")
{
    auto g = graph()
    .set_dependencies("B", deps({"A"}))
    .set_dependencies("C", deps({"A"}))
    .set_dependencies("D", deps({"B", "C"}))
    .set_dependencies("E", deps({"X"}));

    REQUIRE(g.collect_transitive_dependents("A") == std::set<std::string>{"B", "C", "D"});
    REQUIRE(g.collect_transitive_dependents("D").empty());
}




TEST_CASE("graph orders and levels a subset", "[graph]")
{
    auto g = graph()
    .set_dependencies("B", deps({"A"}))
    .set_dependencies("C", deps({"A"}))
    .set_dependencies("D", deps({"B", "C"}))
    .set_dependencies("E", deps({"D", "Z"}));

    auto subset = std::set<std::string>{"A", "B", "C", "D", "E"};
    auto order = g.topo_order(subset);
    auto levels = g.assign_levels(order, subset);

    REQUIRE(order.size() == 5);
    REQUIRE(order.front() == "A");
    REQUIRE(order.back() == "E");
    REQUIRE(levels.size() == 4);
    REQUIRE(levels[0] == std::vector<std::string>{"A"});
    REQUIRE(levels[1] == std::vector<std::string>{"B", "C"});
    REQUIRE(levels[2] == std::vector<std::string>{"D"});
    REQUIRE(levels[3] == std::vector<std::string>{"E"});

    SECTION("cells on a cycle are reported")
    {
        auto h = g.set_dependencies("A", deps({"D"}));
        auto rest = std::vector<std::string>();
        auto partial = h.topo_order(subset, &rest);

        REQUIRE(partial.empty());
        REQUIRE(rest.size() == 5);
        REQUIRE_THROWS_AS(h.topo_order(subset), circular_reference);
    }
}



#endif // TEST_GRAPH
