#pragma once

// Test-only cross-platform environment setter shim.
// Option tests use the Windows-style _putenv("NAME=VALUE"); on other
// platforms test_env.cpp provides it. "NAME=" removes the variable.

#ifndef _WIN32
extern "C" int _putenv(const char* assignment);
#endif

namespace ccl::test {

// Sets a variable for the lifetime of the guard and removes it afterwards.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value);
    ~ScopedEnv();
    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;
private:
    const char* name_;
};

} // namespace ccl::test
