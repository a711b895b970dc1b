// Cross-platform shim for tests that call Windows-specific _putenv("NAME=VALUE").
// On POSIX define a local _putenv that maps to setenv/unsetenv.

#include "test_env.hpp"

#include <cstdlib>
#include <cstring>
#include <string>

#if !defined(_WIN32)
extern "C" int _putenv(const char* assignment)
{
    if (!assignment) return -1;
    const char* eq = std::strchr(assignment, '=');
    if (!eq) {
        // Not in NAME=VALUE form
        return -1;
    }
    std::string name(assignment, static_cast<size_t>(eq - assignment));
    const char* value = eq + 1;
    if (!*value) {
        return ::unsetenv(name.c_str());
    }
    return ::setenv(name.c_str(), value, 1);
}
#endif

namespace ccl::test {

ScopedEnv::ScopedEnv(const char* name, const char* value): name_(name){
    std::string assignment = std::string(name) + "=" + value;
    _putenv(assignment.c_str());
}

ScopedEnv::~ScopedEnv(){
    std::string assignment = std::string(name_) + "=";
    _putenv(assignment.c_str());
}

} // namespace ccl::test
