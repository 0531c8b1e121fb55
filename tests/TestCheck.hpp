#pragma once
#include <iostream>
#include <string>

// Minimal check counter for the standalone test executables
namespace TestCheck {

inline int& passed() {
    static int count = 0;
    return count;
}

inline int& failed() {
    static int count = 0;
    return count;
}

inline void expect(bool condition, const std::string& description) {
    if (condition) {
        ++passed();
        std::cout << "✓ " << description << std::endl;
    } else {
        ++failed();
        std::cout << "✗ " << description << std::endl;
    }
}

inline void section(const std::string& title) {
    std::cout << "\n" << title << std::endl;
}

inline int finish(const std::string& suite) {
    std::cout << "\n=== " << suite << ": " << passed() << " passed, " << failed() << " failed ===" << std::endl;
    return failed() == 0 ? 0 : 1;
}

} // namespace TestCheck
