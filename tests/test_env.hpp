#pragma once
#include <cstdlib>
#include <optional>
#include <string>
#include <utility>

namespace rainbow::test {

// Sets one environment variable for the lifetime of the object and restores
// the previous value afterwards. An empty value unsets the variable.
class scoped_env {
public:
    scoped_env(std::string name, const std::string& value) : name_(std::move(name)) {
        if(const char* old = std::getenv(name_.c_str())) previous_ = old;
        apply(value);
    }
    ~scoped_env(){ apply(previous_.value_or("")); }
    scoped_env(const scoped_env&) = delete;
    scoped_env& operator=(const scoped_env&) = delete;

private:
    std::string name_;
    std::optional<std::string> previous_;

    void apply(const std::string& value){
        if(value.empty()) ::unsetenv(name_.c_str());
        else ::setenv(name_.c_str(), value.c_str(), 1);
    }
};

} // namespace rainbow::test
