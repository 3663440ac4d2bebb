#ifndef IGNITE_BUILD_JSON_TEXT_HPP
#define IGNITE_BUILD_JSON_TEXT_HPP

// json_text.hpp - String escaping shared by the JSON writers
// Part of ignite_build - Ignite Build Orchestrator

#include <string>

namespace ignite::build {

// Escape quotes, backslashes and the common control characters for a JSON string body
std::string escape_json(const std::string& str);

} // namespace ignite::build

#endif // IGNITE_BUILD_JSON_TEXT_HPP
