#ifndef CHECK_H
#define CHECK_H

#include <iostream>

namespace check
{
    inline unsigned failures = 0;

    inline void unexpected(const char* msg, const char* file, unsigned line)
    {
        std::cerr << "[UNEXPECTED]: \"" << msg << "\", " << file << ":" << line << std::endl;
        ++failures;
    }

    // prints the verdict of the test executable and gives its exit status
    inline int finish(const char* name)
    {
        if (failures != 0)
        {
            std::cerr << name << ": " << failures << " check(s) failed\n";
            return 1;
        }
        std::cout << name << ": PASS\n";
        return 0;
    }
}

#undef CHECK
#define CHECK(expression) (void)( (!!(expression)) || (check::unexpected((#expression), (__FILE__), (unsigned)(__LINE__)), 0) )

#endif
