#pragma once
#include <array>
#include <cstdlib>
#include <print>
#include <source_location>
#include <string_view>
#include <utility>

#include <sys/wait.h>
#include <unistd.h>

namespace test {
using TestFunc = auto (*)() -> void;
using Entry    = std::pair<std::string_view, TestFunc>;

inline auto errors = 0uz;

inline auto fail(const int line) -> void {
    std::println(stderr, "test failed at line {}", line);
    errors += 1;
}

// runs fun in a child process and expects it to die
inline auto death(auto fun, const std::source_location location = std::source_location::current()) -> void {
    switch(const auto pid = fork()) {
    case -1:
        std::println(stderr, "fork failed at line {}", location.line());
        errors += 1;
        break;
    case 0:
        close(STDERR_FILENO);
        fun();
        std::exit(EXIT_SUCCESS);
    default: {
        auto status = 0;
        if(waitpid(pid, &status, 0) != pid || (WIFEXITED(status) && WEXITSTATUS(status) == EXIT_SUCCESS)) {
            std::println(stderr, "death test survived at line {}", location.line());
            errors += 1;
        }
    } break;
    }
}

template <size_t N>
auto run(const std::array<Entry, N>& tests) -> int {
    for(const auto& [name, func] : tests) {
        std::println(R"(running test "{}")", name);
        func();
    }
    if(errors == 0) {
        std::println("pass");
        return 0;
    } else {
        return 1;
    }
}
} // namespace test

#define ensure(cond)              \
    if(!(cond)) {                 \
        ::test::fail(__LINE__);   \
    }

#define test(name) \
    ::test::Entry { #name, &name##_test }
