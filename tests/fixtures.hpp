#ifndef FIXTURES_H
#define FIXTURES_H

#include "automaton.hpp"

namespace fixtures
{
    // q0 initial, q1 final; accepts the strings over {a,b} ending in 'a'
    inline auto ends_in_a() -> dfa::Automaton
    {
        dfa::Automaton automaton;
        (void)automaton.add_state("q0", true, false);
        (void)automaton.add_state("q1", false, true);
        (void)automaton.add_transition("q0", 'a', "q1");
        (void)automaton.add_transition("q1", 'a', "q1");
        (void)automaton.add_transition("q0", 'b', "q0");
        (void)automaton.add_transition("q1", 'b', "q0");
        return automaton;
    }
}

#endif
