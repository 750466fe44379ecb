#pragma once
#include <optional>
#include <string>

// Sets or, with std::nullopt, removes an environment variable.
void set_test_env(const std::string& name, const std::optional<std::string>& value);

// Sets a variable for the lifetime of the object and restores the previous value.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value);
    ~ScopedEnv();
    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    std::string name_;
    std::optional<std::string> old_;
};
