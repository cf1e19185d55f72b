#ifndef SHELL_H
#define SHELL_H

#include "session.hpp"

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace app
{
    // Line oriented editor and simulator over a session, e.g.
    //   state q0 initial
    //   state q1 final
    //   transition q0 a q1
    //   check aab
    //   next
    class Shell
    {
    public:
        Shell(Session& session, std::ostream& out, std::ostream& err);

        // runs one command, returns false once the user asked to quit
        auto execute(std::string_view line) -> bool;

        // reads commands until end of input or quit, returns the number of failed commands
        auto run(std::istream& in, bool prompt) -> unsigned;

    private:
        using Arguments = std::vector<std::string>;

        auto dispatch(const std::string& command, const Arguments& args) -> dfa::Result<void>;

        auto show_trace() -> void;
        auto show_help() -> void;

        Session& m_session;
        std::ostream& m_out;
        std::ostream& m_err;
        unsigned m_failures{0};
    };
}

#endif
