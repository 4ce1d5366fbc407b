#include "config.hpp"

#include <cctype>
#include <stdexcept>

std::string open_mode_name(OpenMode mode) {
    switch (mode) {
        case OpenMode::Create: return "create";
        case OpenMode::Truncate: return "truncate";
        case OpenMode::Recover: return "recover";
    }
    return "unknown";
}

OpenMode parse_open_mode(const std::string& name) {
    if (name == "create") return OpenMode::Create;
    if (name == "truncate") return OpenMode::Truncate;
    if (name == "recover") return OpenMode::Recover;
    throw std::invalid_argument("Unknown open mode: " + name);
}

size_t parse_count(const std::string& text, const std::string& what) {
    // std::stoull accepts "-5" and wraps it around
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0]))) {
        throw std::invalid_argument("Invalid " + what + ": '" + text + "' (expected a non-negative integer)");
    }

    size_t pos = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(text, &pos);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("Invalid " + what + ": '" + text + "' is too large");
    }
    if (pos != text.size()) {
        throw std::invalid_argument("Invalid " + what + ": '" + text + "' (expected a non-negative integer)");
    }
    return static_cast<size_t>(value);
}
