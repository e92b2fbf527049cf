#pragma once

// Test-only environment setter. Options and diagnostics read the process
// environment, so tests flip variables for one scope and restore them after.

#include <optional>
#include <string>

namespace ednstream_test {

// Sets NAME=VALUE for the lifetime of the object, then restores the previous value (or unsets).
class scoped_env {
public:
    scoped_env(std::string name, const std::string& value);
    ~scoped_env();
    scoped_env(const scoped_env&) = delete;
    scoped_env& operator=(const scoped_env&) = delete;
private:
    std::string name_;
    std::optional<std::string> previous_;
};

} // namespace ednstream_test
