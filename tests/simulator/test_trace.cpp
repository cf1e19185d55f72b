#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "automaton.hpp"
#include "simulator.hpp"
#include "check.hpp"
#include "fixtures.hpp"

using namespace dfa;

// traces only come out of build_trace, so they always hold the initial configuration
static_assert(!std::is_default_constructible_v<Trace>);
static_assert(!std::is_constructible_v<Trace, std::string_view, std::vector<Configuration>&&, bool>);

int main() {
    const auto automaton = fixtures::ends_in_a();

    auto trace = build_trace(automaton, "ba");
    CHECK(trace.has_value());
    const std::vector<Configuration> expected{
        Configuration(0, "q0", 0),
        Configuration(1, "q0", 1),
        Configuration(2, "q1", 2),
    };
    CHECK(trace->configurations() == expected);
    CHECK(trace->accepted());
    CHECK(trace->fully_consumed());
    CHECK(!trace->stuck());
    CHECK(!trace->stuck_symbol().has_value());
    CHECK(trace->remaining(0) == "ba");
    CHECK(trace->remaining(1) == "a");
    CHECK(trace->remaining(2) == "");

    // getting stuck ends the trace early, length is consumed + 1
    auto stuck = build_trace(automaton, "abcab");
    CHECK(stuck.has_value());
    CHECK(stuck->size() == 3);
    CHECK(stuck->consumed() == 2);
    CHECK(stuck->stuck());
    CHECK(stuck->stuck_symbol() == std::optional<char>('c'));
    CHECK(stuck->back().m_state == "q0");
    CHECK(!stuck->accepted());

    auto empty = build_trace(automaton, "");
    CHECK(empty.has_value() && empty->size() == 1 && empty->at(0).m_state == "q0");

    // the length invariant over a few inputs
    for (std::string input : {"", "a", "ab", "abab", "xa", "ax", "bbbbx"}) {
        auto t = build_trace(automaton, input);
        CHECK(t.has_value());
        CHECK(t->size() == t->consumed() + 1);
        CHECK(t->consumed() <= input.size());
    }

    // navigation is bounded and never re-runs anything
    const auto& ba = trace.value();
    std::size_t index = reset_index();
    CHECK(current_config(ba, index).m_state == "q0");
    index = prev(ba, index);
    CHECK(index == 0);
    index = next(ba, index);
    index = next(ba, index);
    CHECK(index == 2);
    CHECK(current_config(ba, index).m_state == "q1");
    index = next(ba, index);
    CHECK(index == 2);
    index = prev(ba, index);
    CHECK(current_config(ba, index) == Configuration(1, "q0", 1));
    CHECK(current_config(ba, 42).m_step == 2);
    CHECK(reset_index() == 0);

    auto lambda = automaton;
    CHECK(lambda.import_transition("q1", epsilon, "q0").has_value());
    auto refused = build_trace(lambda, "a");
    CHECK(!refused && refused.error().m_code == ErrorCode::Validation);

    Automaton no_initial;
    auto missing = build_trace(no_initial, "a");
    CHECK(!missing && missing.error().m_code == ErrorCode::NoInitialState);

    return check::finish("test_trace");
}
