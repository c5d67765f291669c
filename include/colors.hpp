#pragma once
#include <unistd.h>  // for isatty(), STDERR_FILENO

#include <iostream>
#include <string>  // for std::string

namespace Color {
inline bool supports_color() {
    return isatty(STDERR_FILENO);
}

// colour only the process's own stderr when it is a terminal
inline bool supports_color(const std::ostream& os) {
    return &os == &std::cerr && supports_color();
}

const std::string reset = "\033[0m";

// Bright versions
const std::string bright_black = "\033[90m";  // gray
const std::string bright_red = "\033[91m";

inline std::string paint(const std::string& s, const std::string& color, bool use_color) {
    return use_color ? color + s + reset : s;
}
}  // namespace Color
