// output_classifier.cpp - Line classification for tool output
// Part of ignite_build - Ignite Build Orchestrator

#include "core/output_classifier.hpp"

#include <algorithm>
#include <cctype>

namespace ignite::build {

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool contains_any(const std::string& haystack, const std::vector<std::string>& needles) {
    for (const auto& needle : needles) {
        if (!needle.empty() && haystack.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

} // namespace

SubstringClassifier::SubstringClassifier(std::vector<std::string> error_markers,
                                         std::vector<std::string> warning_markers)
    : error_markers_(std::move(error_markers))
    , warning_markers_(std::move(warning_markers)) {
    for (auto& m : error_markers_) m = to_lower(m);
    for (auto& m : warning_markers_) m = to_lower(m);
}

Severity SubstringClassifier::classify(const std::string& line) const {
    std::string lowered = to_lower(line);

    if (contains_any(lowered, error_markers_)) {
        return Severity::ERROR;
    }
    if (contains_any(lowered, warning_markers_)) {
        return Severity::WARNING;
    }
    return Severity::INFO;
}

std::unique_ptr<OutputClassifier> make_default_classifier() {
    return std::make_unique<SubstringClassifier>(
        std::vector<std::string>{"error:", "error["},
        std::vector<std::string>{"warning:", "warning["});
}

} // namespace ignite::build
