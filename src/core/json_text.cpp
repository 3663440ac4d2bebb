// json_text.cpp - String escaping shared by the JSON writers
// Part of ignite_build - Ignite Build Orchestrator

#include "core/json_text.hpp"

namespace ignite::build {

std::string escape_json(const std::string& str) {
    std::string out;
    out.reserve(str.size());
    for (char c : str) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            default:   out += c;
        }
    }
    return out;
}

} // namespace ignite::build
