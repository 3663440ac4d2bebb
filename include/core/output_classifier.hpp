#ifndef IGNITE_BUILD_OUTPUT_CLASSIFIER_HPP
#define IGNITE_BUILD_OUTPUT_CLASSIFIER_HPP

// output_classifier.hpp - Line classification for tool output
// Part of ignite_build - Ignite Build Orchestrator
//
// Classification is best-effort and purely textual: it never looks at exit
// codes and is not an authoritative diagnostic parser. Each tool family can
// plug its own classifier into the CommandRunner.

#include <memory>
#include <string>
#include <vector>

namespace ignite::build {

enum class Severity {
    INFO,
    WARNING,
    ERROR
};

inline const char* severity_to_string(Severity severity) {
    switch (severity) {
        case Severity::INFO:    return "info";
        case Severity::WARNING: return "warning";
        case Severity::ERROR:   return "error";
        default:                return "unknown";
    }
}

class OutputClassifier {
public:
    virtual ~OutputClassifier() = default;

    virtual Severity classify(const std::string& line) const = 0;
};

/**
 * Case-insensitive substring vocabulary.
 *
 * A line matching any error marker is an ERROR; otherwise a line matching any
 * warning marker is a WARNING; everything else is INFO.
 */
class SubstringClassifier : public OutputClassifier {
public:
    SubstringClassifier(std::vector<std::string> error_markers,
                        std::vector<std::string> warning_markers);

    Severity classify(const std::string& line) const override;

    const std::vector<std::string>& error_markers() const { return error_markers_; }
    const std::vector<std::string>& warning_markers() const { return warning_markers_; }

private:
    std::vector<std::string> error_markers_;    // stored lower-case
    std::vector<std::string> warning_markers_;  // stored lower-case
};

// "error:" / "error[" and "warning:" / "warning[" (rustc and most compilers)
std::unique_ptr<OutputClassifier> make_default_classifier();

} // namespace ignite::build

#endif // IGNITE_BUILD_OUTPUT_CLASSIFIER_HPP
