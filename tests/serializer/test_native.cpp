#include <string>

#include "serializer.hpp"
#include "check.hpp"
#include "fixtures.hpp"

using namespace dfa;

static const char* kSample = R"({
  "alphabet": ["a", "b"],
  "states": ["q0", "q1"],
  "initial_state": "q0",
  "final_states": ["q1"],
  "transitions": {
    "q0,a": "q1",
    "q1,a": "q1",
    "q0,b": "q0",
    "q1,b": "q0"
  }
})";

static ErrorCode code_of(const char* text) {
    auto loaded = serializer::load_native(text);
    return loaded ? ErrorCode::Validation : loaded.error().m_code;
}

int main() {
    // loading the documented example gives the same model as building it by hand
    auto loaded = serializer::load_native(kSample);
    CHECK(loaded.has_value());
    CHECK(loaded.value() == fixtures::ends_in_a());

    // round trip
    auto model = fixtures::ends_in_a();
    model.add_symbol('c');
    auto saved = serializer::save_native(model);
    CHECK(saved.has_value());
    auto restored = serializer::load_native(saved.value());
    CHECK(restored.has_value());
    CHECK(restored.value() == model);
    CHECK(restored->alphabet() == model.alphabet());
    CHECK(restored->initial_state() == model.initial_state());
    CHECK(restored->final_states() == model.final_states());
    CHECK(restored->transitions() == model.transitions());

    // the written layout
    CHECK(saved->find("\"transitions\": {\n    \"q0,a\": \"q1\",") != std::string::npos);
    CHECK(saved->find("\"initial_state\": \"q0\"") != std::string::npos);

    // saving an automaton that does not validate is refused
    Automaton unfinished;
    CHECK(unfinished.add_state("q0").has_value());
    auto refused = serializer::save_native(unfinished);
    CHECK(!refused && refused.error().m_code == ErrorCode::Validation);

    // a symbol that is itself a comma
    Automaton comma;
    CHECK(comma.add_state("s", true, true).has_value());
    CHECK(comma.add_transition("s", ',', "s").has_value());
    auto comma_text = serializer::save_native(comma);
    CHECK(comma_text.has_value() && comma_text->find("\"s,,\": \"s\"") != std::string::npos);
    auto comma_back = serializer::load_native(comma_text.value());
    CHECK(comma_back.has_value() && comma_back.value() == comma);

    // a repeated key keeps the last target
    auto last_wins = serializer::load_native(R"({
        "alphabet": ["a"], "states": ["p", "q"], "initial_state": "p", "final_states": [],
        "transitions": {"p,a": "p", "p,a": "q"}
    })");
    CHECK(last_wins.has_value());
    CHECK(last_wins->target("p", 'a') == std::optional<std::string>("q"));
    CHECK(last_wins->transitions().size() == 1);

    // an empty symbol is epsilon, an empty initial state means none
    auto lambda = serializer::load_native(R"({
        "alphabet": [], "states": ["p", "q"], "initial_state": "", "final_states": ["q"],
        "transitions": {"p,": "q"}
    })");
    CHECK(lambda.has_value());
    CHECK(lambda->target("p", epsilon) == std::optional<std::string>("q"));
    CHECK(!lambda->initial_state().has_value());
    CHECK(lambda->alphabet().empty());

    // malformed and incomplete documents
    CHECK(code_of("{\"alphabet\": [") == ErrorCode::Parse);
    CHECK(code_of("[]") == ErrorCode::Schema);
    CHECK(code_of(R"({"states": [], "initial_state": "", "final_states": [], "transitions": {}})") == ErrorCode::Schema);
    CHECK(code_of(R"({"alphabet": "ab", "states": [], "initial_state": "", "final_states": [], "transitions": {}})") == ErrorCode::Schema);
    CHECK(code_of(R"({"alphabet": ["ab"], "states": [], "initial_state": "", "final_states": [], "transitions": {}})") == ErrorCode::Schema);
    CHECK(code_of(R"({"alphabet": [], "states": [1], "initial_state": "", "final_states": [], "transitions": {}})") == ErrorCode::Schema);
    CHECK(code_of(R"({"alphabet": [], "states": ["p"], "initial_state": "x", "final_states": [], "transitions": {}})") == ErrorCode::Schema);
    CHECK(code_of(R"({"alphabet": [], "states": ["p"], "initial_state": "p", "final_states": ["x"], "transitions": {}})") == ErrorCode::Schema);
    CHECK(code_of(R"({"alphabet": [], "states": ["p"], "initial_state": "p", "final_states": [], "transitions": {"pa": "p"}})") == ErrorCode::Schema);
    CHECK(code_of(R"({"alphabet": [], "states": ["p"], "initial_state": "p", "final_states": [], "transitions": {"p,ab": "p"}})") == ErrorCode::Schema);
    CHECK(code_of(R"({"alphabet": [], "states": ["p"], "initial_state": "p", "final_states": [], "transitions": {"p,a": "x"}})") == ErrorCode::Schema);
    CHECK(code_of(R"({"alphabet": [], "states": ["p"], "initial_state": "p", "final_states": [], "transitions": {"p,a": 3}})") == ErrorCode::Schema);
    CHECK(code_of(R"({"alphabet": [], "states": ["p", "p"], "initial_state": "p", "final_states": [], "transitions": {}})") == ErrorCode::DuplicateState);

    return check::finish("test_native");
}
