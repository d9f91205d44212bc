#include "pawn_tour/options.hpp"
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace pawn_tour {

int parse_positive(const char* option, const char* value) {
    char* end = nullptr;
    long v = std::strtol(value, &end, 10);
    if (end == value || *end != '\0' || v <= 0 || v > 1000000) {
        throw std::invalid_argument(std::string("Invalid value for ") + option + ": " + value);
    }
    return static_cast<int>(v);
}

uint32_t parse_seed(const char* value) {
    char* end = nullptr;
    // strtoull は負号を受け付けて値を折り返すので先に弾く
    if (value[0] == '-') {
        throw std::invalid_argument(std::string("Invalid value for -r: ") + value);
    }
    unsigned long long v = std::strtoull(value, &end, 10);
    if (end == value || *end != '\0' || v > 0xffffffffULL) {
        throw std::invalid_argument(std::string("Invalid value for -r: ") + value);
    }
    return static_cast<uint32_t>(v);
}

} // namespace pawn_tour
