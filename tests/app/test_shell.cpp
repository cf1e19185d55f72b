#include <filesystem>
#include <sstream>
#include <string>

#include "shell.hpp"
#include "check.hpp"
#include "fixtures.hpp"

static bool contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

int main() {
    // building and checking through commands
    {
        app::Session session;
        std::ostringstream out, err;
        app::Shell shell(session, out, err);
        std::istringstream script(
            "# ends in a\n"
            "state q0 initial\n"
            "state q1 final\n"
            "\n"
            "transition q0 a q1\n"
            "transition q1 a q1\n"
            "transition q0 b q0\n"
            "transition q1 b q0\n"
            "check ba\n"
            "next\n"
            "quit\n"
            "state never_reached\n");
        CHECK(shell.run(script, false) == 0);
        CHECK(err.str().empty());
        CHECK(session.automaton() == fixtures::ends_in_a());
        CHECK(!session.automaton().has_state("never_reached"));
        CHECK(contains(out.str(), "The string \"ba\" is ACCEPTED by the automaton"));
        CHECK(contains(out.str(), "→ Step 1: q0"));
        CHECK(contains(out.str(), "Position: b[a]"));
        CHECK(session.cursor() == 1);
    }

    // failures are reported and counted, the shell keeps going
    {
        app::Session session;
        std::ostringstream out, err;
        app::Shell shell(session, out, err);
        std::istringstream script(
            "state p initial\n"
            "state p\n"
            "state q sideways\n"
            "transition p a missing\n"
            "transition p ab p\n"
            "transition p a p\n"
            "transition p a p\n"
            "state q\n"
            "transition p a q\n"
            "frobnicate\n"
            "closure ab x\n"
            "check\n");
        CHECK(shell.run(script, false) == 7);
        CHECK(contains(err.str(), "<DUPLICATE STATE>"));
        CHECK(contains(err.str(), "<UNKNOWN STATE>"));
        CHECK(contains(err.str(), "<NON DETERMINISTIC TRANSITION>"));
        CHECK(contains(err.str(), "unknown command 'frobnicate'"));
        CHECK(contains(out.str(), "The string \"\" is REJECTED by the automaton"));
        CHECK(session.automaton().target("p", 'a') == std::optional<std::string>("p"));
    }

    // language tools, validation and editing commands
    {
        app::Session session;
        std::ostringstream out, err;
        app::Shell shell(session, out, err);
        CHECK(shell.execute("closure ab 1"));
        CHECK(contains(out.str(), "Kleene closure (Σ*) - 3 strings:"));
        CHECK(shell.execute("closure ab 1 plus"));
        CHECK(contains(out.str(), "Positive closure (Σ+) - 2 strings:"));
        CHECK(shell.execute("substrings abc"));
        CHECK(contains(out.str(), "Substrings (6):"));

        CHECK(shell.execute("validate"));
        CHECK(contains(out.str(), "no initial state defined"));
        CHECK(shell.execute("state s"));
        CHECK(shell.execute("initial s"));
        CHECK(shell.execute("final s"));
        CHECK(session.automaton().is_final("s"));
        CHECK(shell.execute("final s off"));
        CHECK(!session.automaton().is_final("s"));
        CHECK(shell.execute("symbol xy"));
        CHECK(session.automaton().alphabet().size() == 2);
        CHECK(shell.execute("untransition s eps"));
        CHECK(err.str().empty());
        CHECK(shell.execute("transition s eps s"));
        CHECK(contains(err.str(), "<VALIDATION ERROR>"));
        CHECK(!session.automaton().target("s", dfa::epsilon).has_value());
        CHECK(shell.execute("table"));
        CHECK(contains(out.str(), "s (I)"));
        CHECK(shell.execute("remove s"));
        CHECK(!session.automaton().has_state("s"));
        CHECK(shell.execute("where"));
        CHECK(contains(out.str(), "no string has been checked"));
        CHECK(!shell.execute("exit"));
    }

    // save and load round trip
    {
        const auto dir = std::filesystem::temp_directory_path() / "dfa_lab_test_shell";
        std::filesystem::create_directories(dir);
        const auto file = (dir / "machine.afd").string();

        app::Session session;
        std::ostringstream out, err;
        app::Shell shell(session, out, err);
        std::istringstream script(
            "state q0 initial\n"
            "state q1 final\n"
            "transition q0 a q1\n"
            "transition q1 a q1\n"
            "transition q0 b q0\n"
            "transition q1 b q0\n"
            "save " + file + "\n"
            "reset\n"
            "load " + file + "\n"
            "load " + (dir / "machine.txt").string() + "\n");
        CHECK(shell.run(script, false) == 1);
        CHECK(contains(out.str(), "saved " + file));
        CHECK(contains(out.str(), "loaded " + file));
        CHECK(contains(err.str(), "<IO ERROR>"));
        CHECK(session.automaton() == fixtures::ends_in_a());

        std::filesystem::remove_all(dir);
    }

    return check::finish("test_shell");
}
