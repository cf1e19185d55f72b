#include <filesystem>
#include <string>

#include "session.hpp"
#include "serializer.hpp"
#include "check.hpp"
#include "fixtures.hpp"

using namespace dfa;

static void build_ends_in_a(app::Session& session) {
    CHECK(session.add_state("q0", true).has_value());
    CHECK(session.add_state("q1", false, true).has_value());
    CHECK(session.add_transition("q0", 'a', "q1").has_value());
    CHECK(session.add_transition("q1", 'a', "q1").has_value());
    CHECK(session.add_transition("q0", 'b', "q0").has_value());
    CHECK(session.add_transition("q1", 'b', "q0").has_value());
}

int main() {
    app::Session session;
    build_ends_in_a(session);
    CHECK(session.automaton() == fixtures::ends_in_a());
    CHECK(session.validate().empty());

    // no trace before the first check
    CHECK(!session.trace().has_value());
    CHECK(!session.current().has_value());
    CHECK(session.next() == 0);

    // checking starts a trace at step 0
    CHECK(session.check("ba") == Result<bool>(true));
    CHECK(session.trace().has_value());
    CHECK(session.cursor() == 0);
    CHECK(session.current() == std::optional<Configuration>(Configuration(0, "q0", 0)));
    CHECK(session.next() == 1);
    CHECK(session.next() == 2);
    CHECK(session.next() == 2);
    CHECK(session.current() == std::optional<Configuration>(Configuration(2, "q1", 2)));
    CHECK(session.prev() == 1);
    CHECK(session.rewind() == 0);
    CHECK(session.prev() == 0);

    // failed or no-op edits keep the trace
    auto lambda = session.add_transition("q0", epsilon, "q1");
    CHECK(!lambda && lambda.error().m_code == ErrorCode::Validation);
    CHECK(!session.automaton().has_epsilon_transitions());
    CHECK(!session.add_state("q0").has_value());
    CHECK(!session.add_transition("q0", 'a', "q0").has_value());
    CHECK(!session.set_initial("missing").has_value());
    session.add_symbol('a');
    CHECK(session.trace().has_value());

    // any real change discards it
    CHECK(session.next() == 1);
    session.add_symbol('c');
    CHECK(!session.trace().has_value());
    CHECK(session.cursor() == 0);

    CHECK(session.check("ab") == Result<bool>(false));
    CHECK(session.set_final("q0", true).has_value());
    CHECK(!session.trace().has_value());
    CHECK(session.check("ab") == Result<bool>(true));
    CHECK(session.remove_transition("q1", 'b').has_value());
    CHECK(!session.trace().has_value());

    // without an initial state the check fails and no trace is kept
    CHECK(session.remove_state("q0").has_value());
    auto orphan = session.check("a");
    CHECK(!orphan && orphan.error().m_code == ErrorCode::NoInitialState);
    CHECK(!session.trace().has_value());

    // loading
    const auto dir = std::filesystem::temp_directory_path() / "dfa_lab_test_session";
    std::filesystem::create_directories(dir);
    const auto path = dir / "ends_in_a.afd";
    CHECK(serializer::save_file(path, fixtures::ends_in_a()).has_value());

    const auto before = session.automaton();
    auto missing = session.load(dir / "missing.afd");
    CHECK(!missing && missing.error().m_code == ErrorCode::Io);
    CHECK(session.automaton() == before);

    CHECK(serializer::write_text(dir / "broken.afd", "{ not json").has_value());
    CHECK(!session.load(dir / "broken.afd").has_value());
    CHECK(session.automaton() == before);

    CHECK(session.check("").has_value() == false);
    CHECK(session.load(path).has_value());
    CHECK(session.automaton() == fixtures::ends_in_a());
    CHECK(session.check("a") == Result<bool>(true));

    // an invalid model cannot be saved
    session.reset();
    CHECK(session.automaton().empty());
    CHECK(!session.trace().has_value());
    auto refused = session.save(dir / "empty.afd");
    CHECK(!refused && refused.error().m_code == ErrorCode::Validation);

    // closure limits travel with the session
    app::Session limited(language::ClosureLimits{10});
    CHECK(limited.closure("ab", 2, true).has_value() == true);
    auto too_big = limited.closure("ab", 3, true);
    CHECK(!too_big && too_big.error().m_code == ErrorCode::ResourceLimit);

    std::filesystem::remove_all(dir);
    return check::finish("test_session");
}
