#include <string>
#include <vector>

#include "report.hpp"
#include "check.hpp"
#include "fixtures.hpp"

using namespace dfa;

static bool contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

int main() {
    const auto automaton = fixtures::ends_in_a();

    // table
    const auto table = report::transition_table(automaton);
    CHECK(contains(table, "State  | a  | b "));
    CHECK(contains(table, "-------+----+---"));
    CHECK(contains(table, "q0 (I) | q1 | q0"));
    CHECK(contains(table, "q1 (F) | q1 | q0"));
    CHECK(!contains(table, "ε"));

    auto partial = automaton;
    CHECK(partial.add_state("q2").has_value());
    CHECK(partial.import_transition("q2", epsilon, "q0").has_value());
    const auto with_epsilon = report::transition_table(partial);
    CHECK(contains(with_epsilon, "| ε "));
    CHECK(contains(with_epsilon, "q2     | -  | -  | q0"));

    // verdicts
    CHECK(report::verdict("ba", true) == "The string \"ba\" is ACCEPTED by the automaton");
    CHECK(report::verdict("", false) == "The string \"\" is REJECTED by the automaton");

    // trace listing, arrow on the cursor
    auto trace = build_trace(automaton, "ab");
    CHECK(trace.has_value());
    CHECK(report::trace_listing(trace.value(), 1) == "  Step 0: q0\n→ Step 1: q1");
    CHECK(report::trace_listing(trace.value(), 2) == "  Step 0: q0\n  Step 1: q1\n→ Step 2: q0\n  rejected");
    CHECK(report::trace_listing(trace.value(), 99) == report::trace_listing(trace.value(), 2));
    CHECK(report::position_line(trace.value(), 0) == "Position: [a]b");
    CHECK(report::position_line(trace.value(), 1) == "Position: a[b]");
    CHECK(report::position_line(trace.value(), 2) == "Position: ab");

    auto stuck = build_trace(automaton, "ac");
    CHECK(stuck.has_value());
    const auto stuck_listing = report::trace_listing(stuck.value(), 1);
    CHECK(contains(stuck_listing, "stuck: no transition from q1 on 'c'"));
    CHECK(contains(stuck_listing, "rejected"));
    CHECK(report::position_line(stuck.value(), 1) == "Position: a[c]");

    // language listings
    CHECK(report::closure_listing("Kleene closure (Σ*)", {"", "a"}) == "Kleene closure (Σ*) - 2 strings:\n  \"\", \"a\"");
    CHECK(report::decomposition_listing(language::decompose("ab")) ==
        "Substrings (3):\n  a, b, ab\n\nPrefixes (2):\n  a, ab\n\nSuffixes (2):\n  ab, b");

    CHECK(report::validation_listing({}) == "The automaton is a valid DFA");
    const std::vector<Error> problems{
        Error(ErrorCode::NoInitialState, "no initial state defined"),
        Error(ErrorCode::Validation, "symbol 'c' is not in the alphabet"),
    };
    CHECK(report::validation_listing(problems) ==
        "2 problem(s):\n- no initial state defined\n- symbol 'c' is not in the alphabet");

    return check::finish("test_report");
}
