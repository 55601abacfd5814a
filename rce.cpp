#include <istream>
#include <mutex>
#include <ostream>
#include <boost/algorithm/string.hpp>
#include "rce.hpp"




//=============================================================================
rce::engine::engine(const config& cfg)
: published(std::make_shared<const state_t>())
, host(cfg.host)
, sched(cfg.num_workers, cfg.inline_threshold)
{
    set_log_level(cfg.log_level);
    logger()->debug("engine started with {} workers, inline threshold {}", cfg.num_workers, cfg.inline_threshold);
}

rce::engine::~engine()
{
    sched.shutdown();
}




//=============================================================================
void rce::engine::set(const std::string& id, const std::string& definition)
{
    check_identifier(id);

    std::unique_lock<std::shared_timed_mutex> lock(mutex);

    auto state = *std::atomic_load(&published);
    auto deps = dependencies_of(definition);
    auto path = std::vector<std::string>();

    if (state.deps.has_cycle(id, deps, &path))
    {
        throw circular_reference(path);
    }

    write_guard guard(stamp);
    auto cell = state.cells.count(id) ? state.cells.at(id) : cell_t();
    cell.definition = definition;

    state.deps = state.deps.set_dependencies(id, deps);
    state.cells = state.cells.set(id, cell);

    materialize(state, deps);

    auto affected = state.deps.collect_transitive_dependents(id);
    affected.insert(id);

    logger()->debug("set {} = '{}' ({} cells to recompute)", id, definition, affected.size());
    publish(recompute(std::move(state), affected));
}

void rce::engine::set(const std::string& id, const char* definition)
{
    set(id, std::string(definition));
}

void rce::engine::set(const std::string& id, const decimal& number)
{
    set(id, format(quantize(number)));
}

void rce::engine::set(const std::string& id, double number)
{
    set(id, format(from_double(number)));
}

void rce::engine::set(const std::string& id, int number)
{
    set(id, std::to_string(number));
}

void rce::engine::set(const std::string& id, bool boolean)
{
    set(id, std::string(boolean ? "true" : "false"));
}

void rce::engine::erase(const std::string& id)
{
    check_identifier(id);

    std::unique_lock<std::shared_timed_mutex> lock(mutex);

    auto state = *std::atomic_load(&published);

    if (! state.cells.count(id))
    {
        return;
    }

    write_guard guard(stamp);
    auto affected = state.deps.collect_transitive_dependents(id);

    state.deps = state.deps.erase(id);
    state.cells = state.cells.erase(id);

    logger()->debug("erase {} ({} cells to recompute)", id, affected.size());
    publish(recompute(std::move(state), affected));
}

void rce::engine::load(std::istream& is)
{
    auto staged = std::vector<std::pair<std::string, std::string>>();
    auto line = std::string();
    auto number = std::size_t(0);

    while (std::getline(is, line))
    {
        ++number;
        boost::algorithm::trim(line);

        if (line.empty())
        {
            continue;
        }

        auto colon = line.find(':');

        if (colon == std::string::npos)
        {
            throw malformed_line(number, "expected id:definition, got '" + line + "'");
        }

        auto id = boost::algorithm::trim_copy(line.substr(0, colon));
        auto prefix = "line " + std::to_string(number) + ": ";

        if (! is_identifier(id))
        {
            throw invalid_identifier(prefix + "invalid identifier: '" + id + "'");
        }
        if (is_reserved(id))
        {
            throw reserved_name(prefix + "reserved name: '" + id + "'");
        }
        staged.emplace_back(id, line.substr(colon + 1));
    }

    std::unique_lock<std::shared_timed_mutex> lock(mutex);

    write_guard guard(stamp);
    auto state = *std::atomic_load(&published);

    for (const auto& item : staged)
    {
        state.cells = state.cells.set(item.first, cell_t{item.second, value(), std::string()});
        state.deps = state.deps.set_dependencies(item.first, dependencies_of(item.second));
    }
    for (const auto& item : staged)
    {
        materialize(state, state.deps.get_incoming(item.first));
    }
    state.deps = state.deps.rebuild();

    logger()->info("loaded {} definitions ({} cells in table)", staged.size(), state.cells.size());
    publish(std::move(state));
}

void rce::engine::recalculate()
{
    std::unique_lock<std::shared_timed_mutex> lock(mutex);

    write_guard guard(stamp);
    auto state = *std::atomic_load(&published);
    auto everything = std::set<std::string>();

    for (const auto& item : state.cells)
    {
        everything.insert(item.first);
    }
    state.deps = state.deps.rebuild();

    logger()->info("recalculating {} cells", everything.size());
    publish(recompute(std::move(state), everything));
}

void rce::engine::clear()
{
    std::unique_lock<std::shared_timed_mutex> lock(mutex);

    write_guard guard(stamp);
    logger()->debug("clear");
    publish(state_t());
}

void rce::engine::define(const std::string& name, func_t func)
{
    std::unique_lock<std::shared_timed_mutex> lock(mutex);
    host.define(name, func);
    logger()->debug("defined host function {}", name);
}

void rce::engine::shutdown()
{
    std::unique_lock<std::shared_timed_mutex> lock(mutex);

    if (sched.has_pool())
    {
        sched.shutdown();
        logger()->info("worker pool shut down");
    }
}




//=============================================================================
boost::optional<std::string> rce::engine::get(const std::string& id) const
{
    auto state = read();

    if (auto c = state->cells.find(id))
    {
        if (c->error.empty() && ! c->result.is_none())
        {
            return c->result.as_str();
        }
    }
    return boost::none;
}

boost::optional<rce::decimal> rce::engine::get_number(const std::string& id) const
{
    auto state = read();

    if (auto c = state->cells.find(id))
    {
        if (c->error.empty() && c->result.has_type(value_type::number))
        {
            return c->result.get_number();
        }
    }
    return boost::none;
}

std::string rce::engine::get_definition(const std::string& id) const
{
    auto state = read();
    auto c = state->cells.find(id);
    return c ? c->definition : std::string();
}

std::string rce::engine::get_error(const std::string& id) const
{
    auto state = read();
    auto c = state->cells.find(id);
    return c ? c->error : std::string();
}

std::string rce::engine::get_type(const std::string& id) const
{
    auto state = read();
    auto c = state->cells.find(id);

    if (! c || ! c->error.empty())
    {
        return "empty";
    }
    return c->result.type_name();
}

bool rce::engine::exists(const std::string& id) const
{
    return read()->cells.count(id);
}

std::size_t rce::engine::size() const
{
    return read()->cells.size();
}

void rce::engine::save(std::ostream& os) const
{
    auto state = read();

    for (const auto& item : state->cells)
    {
        if (! item.second.definition.empty())
        {
            os << item.first << ':' << item.second.definition << '\n';
        }
    }
}

std::vector<rce::cell_view> rce::engine::snapshot() const
{
    auto state = read();
    auto result = std::vector<cell_view>();

    for (const auto& item : state->cells)
    {
        auto deps = state->deps.get_incoming(item.first);
        auto view = cell_view();
        view.id = item.first;
        view.definition = item.second.definition;
        view.result = item.second.result;
        view.error = item.second.error;
        view.dependencies.assign(deps.begin(), deps.end());
        std::sort(view.dependencies.begin(), view.dependencies.end());
        result.push_back(view);
    }
    std::sort(result.begin(), result.end(), [] (const auto& a, const auto& b) { return a.id < b.id; });
    return result;
}




//=============================================================================
/**
 * Return the published state. The version stamp is read before and after
 * loading it; if a writer was active or finished in between, the read is
 * repeated under the shared lock.
 */
std::shared_ptr<const rce::engine::state_t> rce::engine::read() const
{
    auto before = stamp.load();

    if (before % 2 == 0)
    {
        auto state = std::atomic_load(&published);

        if (stamp.load() == before)
        {
            return state;
        }
    }

    std::shared_lock<std::shared_timed_mutex> lock(mutex);
    return std::atomic_load(&published);
}

void rce::engine::publish(state_t state)
{
    std::atomic_store(&published, std::shared_ptr<const state_t>(std::make_shared<state_t>(std::move(state))));
}


/**
 * Evaluate the cells in subset, level by level, and return the state with
 * their new values. Cells that cannot be ordered are given an error.
 */
rce::engine::state_t rce::engine::recompute(state_t state, const std::set<std::string>& subset)
{
    auto unordered = std::vector<std::string>();
    auto order = state.deps.topo_order(subset, &unordered);
    auto levels = state.deps.assign_levels(order, subset);

    sched.run(levels,
        [this, &state] (const std::string& id)
        {
            return evaluate(state, id);
        },
        [&state] (const std::string& id, const cell_t& cell)
        {
            state.cells = state.cells.set(id, cell);
        });

    if (! unordered.empty())
    {
        auto error = std::string(circular_reference(unordered).what());

        for (const auto& id : unordered)
        {
            if (auto c = state.cells.find(id))
            {
                state.cells = state.cells.set(id, cell_t{c->definition, value(), error});
            }
        }
        logger()->warn("{} cells are on or behind a cycle", unordered.size());
    }
    return state;
}


/**
 * Evaluate one cell against the committed values in state. Never throws:
 * failures are stored as the cell's error.
 */
rce::cell_t rce::engine::evaluate(const state_t& state, const std::string& id) const
{
    auto cell = cell_t();

    if (auto c = state.cells.find(id))
    {
        cell.definition = c->definition;
    }

    try {
        cell.result = evaluate_definition(state, cell.definition);
    }
    catch (const std::exception& e)
    {
        cell.result = value();
        cell.error = e.what();
    }
    return cell;
}

rce::value rce::engine::evaluate_definition(const state_t& state, const std::string& definition) const
{
    if (definition.empty())
    {
        return value::empty();
    }
    if (definition[0] != '=')
    {
        return value::parse_literal(definition);
    }

    auto lookup = [&state] (const std::string& ref)
    {
        auto c = state.cells.find(ref);

        if (! c)
        {
            throw eval_error(error_code::unresolved_reference, "unresolved reference: " + ref);
        }
        if (! c->error.empty())
        {
            throw eval_error(error_code::unresolved_reference, "unresolved reference: " + ref + " has an error");
        }
        if (c->result.is_none())
        {
            throw eval_error(error_code::unresolved_reference, "unresolved reference: " + ref + " has no value");
        }
        return c->result;
    };
    return parser::parse(definition.substr(1)).evaluate(lookup, host);
}

/**
 * Create an empty cell for every id in deps that is not in the table.
 */
void rce::engine::materialize(state_t& state, const graph::set_t& deps)
{
    for (const auto& d : deps)
    {
        if (! state.cells.count(d))
        {
            state.cells = state.cells.set(d, cell_t{std::string(), value::empty(), std::string()});
        }
    }
}

rce::graph::set_t rce::engine::dependencies_of(const std::string& definition)
{
    auto deps = graph::set_t();

    if (! definition.empty() && definition[0] == '=')
    {
        for (const auto& id : parser::symbols(definition.substr(1)))
        {
            deps = std::move(deps).insert(id);
        }
    }
    return deps;
}
