// metrics_store.cpp - Persistent cross-session build metrics
// Part of ignite_build - Ignite Build Orchestrator

#include "state/metrics_store.hpp"
#include "core/errors.hpp"
#include "core/json_text.hpp"
#include "core/timestamp.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>

namespace ignite::build {

// =============================================================================
// Minimal JSON reader for the metrics document
// =============================================================================

namespace {

class JsonReader {
public:
    explicit JsonReader(const std::string& text) : text_(text) {}

    void skip_ws() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            pos_++;
        }
    }

    bool at_end() {
        skip_ws();
        return pos_ >= text_.size();
    }

    char peek() {
        skip_ws();
        if (pos_ >= text_.size()) {
            fail("unexpected end of document");
        }
        return text_[pos_];
    }

    void expect(char c) {
        if (peek() != c) {
            fail(std::string("expected '") + c + "'");
        }
        pos_++;
    }

    bool consume(char c) {
        if (peek() == c) {
            pos_++;
            return true;
        }
        return false;
    }

    bool consume_literal(const char* literal) {
        skip_ws();
        size_t len = std::strlen(literal);
        if (text_.compare(pos_, len, literal) == 0) {
            pos_ += len;
            return true;
        }
        return false;
    }

    std::string read_string() {
        expect('"');
        std::string out;
        while (pos_ < text_.size()) {
            char c = text_[pos_++];
            if (c == '"') {
                return out;
            }
            if (c == '\\') {
                if (pos_ >= text_.size()) break;
                char esc = text_[pos_++];
                switch (esc) {
                    case '"':  out += '"'; break;
                    case '\\': out += '\\'; break;
                    case '/':  out += '/'; break;
                    case 'n':  out += '\n'; break;
                    case 't':  out += '\t'; break;
                    case 'r':  out += '\r'; break;
                    default:   fail("unsupported escape sequence");
                }
                continue;
            }
            out += c;
        }
        fail("unterminated string");
        return out;
    }

    // Raw numeric token: -?digits[.digits][e[+-]digits]
    std::string read_number_token() {
        skip_ws();
        size_t start = pos_;
        if (pos_ < text_.size() && text_[pos_] == '-') pos_++;
        size_t digits_start = pos_;
        while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) pos_++;
        if (pos_ == digits_start) {
            fail("expected number");
        }
        if (pos_ < text_.size() && text_[pos_] == '.') {
            pos_++;
            size_t frac_start = pos_;
            while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) pos_++;
            if (pos_ == frac_start) fail("malformed fraction");
        }
        if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
            pos_++;
            if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) pos_++;
            size_t exp_start = pos_;
            while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) pos_++;
            if (pos_ == exp_start) fail("malformed exponent");
        }
        return text_.substr(start, pos_ - start);
    }

    uint64_t read_counter() {
        std::string token = read_number_token();
        if (token.find_first_not_of("0123456789") != std::string::npos) {
            fail("counter must be a non-negative integer");
        }
        try {
            return std::stoull(token);
        } catch (const std::exception&) {
            fail("counter out of range");
        }
        return 0;
    }

    double read_double() {
        std::string token = read_number_token();
        std::istringstream iss(token);
        iss.imbue(std::locale::classic());
        double value = 0.0;
        iss >> value;
        if (iss.fail()) {
            fail("invalid number");
        }
        return value;
    }

    std::vector<double> read_double_array() {
        std::vector<double> values;
        expect('[');
        if (consume(']')) {
            return values;
        }
        do {
            values.push_back(read_double());
        } while (consume(','));
        expect(']');
        return values;
    }

    // Unknown keys: scalars and flat arrays are tolerated
    void skip_value() {
        char c = peek();
        if (c == '"') {
            read_string();
        } else if (c == '[') {
            pos_++;
            if (consume(']')) return;
            do {
                skip_value();
            } while (consume(','));
            expect(']');
        } else if (consume_literal("null") || consume_literal("true") || consume_literal("false")) {
            return;
        } else {
            read_number_token();
        }
    }

    [[noreturn]] void fail(const std::string& what) const {
        throw CorruptStateError("metrics document: " + what + " at offset " + std::to_string(pos_));
    }

private:
    const std::string& text_;
    size_t pos_ = 0;
};

void write_double_array(std::ostringstream& oss, const std::vector<double>& values) {
    oss << "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << values[i];
    }
    oss << "]";
}

} // namespace

// =============================================================================
// Lifecycle
// =============================================================================

MetricsStore::MetricsStore(const fs::path& state_dir)
    : file_path_(state_dir / FILE_NAME) {
}

// =============================================================================
// Persistence
// =============================================================================

LoadStatus MetricsStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);

    metrics_ = HistoricalMetrics{};

    std::error_code ec;
    bool present = fs::exists(file_path_, ec);
    if (ec) {
        throw StateAccessError("Cannot access metrics file " + file_path_.string()
                               + ": " + ec.message());
    }

    if (!present) {
        // No metrics yet - this is fine, start fresh
        last_load_status_ = LoadStatus::MISSING;
        return last_load_status_;
    }

    std::ifstream file(file_path_, std::ios::binary);
    if (!file) {
        throw StateAccessError("Cannot read metrics file " + file_path_.string()
                               + ": " + std::strerror(errno));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw StateAccessError("Read error on metrics file " + file_path_.string());
    }
    file.close();

    try {
        metrics_ = deserialize(buffer.str());
        last_load_status_ = LoadStatus::LOADED;
    } catch (const CorruptStateError& e) {
        metrics_ = HistoricalMetrics{};
        last_load_status_ = LoadStatus::CORRUPT;

        fs::path aside = file_path_;
        aside += CORRUPT_SUFFIX;
        fs::rename(file_path_, aside, ec);

        spdlog::warn("Metrics file {} is corrupt ({}); starting from defaults{}",
                     file_path_.string(), e.what(),
                     ec ? std::string(", could not preserve it: ") + ec.message()
                        : ", original kept as " + aside.string());
    }

    return last_load_status_;
}

bool MetricsStore::save() {
    std::lock_guard<std::mutex> lock(mutex_);

    // Ensure parent directory exists
    std::error_code ec;
    fs::path parent = file_path_.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            spdlog::error("Cannot create state directory {}: {}", parent.string(), ec.message());
            return false;
        }
    }

    fs::path temp_path = file_path_;
    temp_path += TEMP_SUFFIX;

    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            spdlog::error("Cannot write {}: {}", temp_path.string(), std::strerror(errno));
            return false;
        }
        file << serialize(metrics_);
        file.flush();
        if (!file.good()) {
            spdlog::error("Write error on {}", temp_path.string());
            file.close();
            fs::remove(temp_path, ec);
            return false;
        }
    }

    // Atomic replace: readers see either the old or the new document
    fs::rename(temp_path, file_path_, ec);
    if (ec) {
        spdlog::error("Cannot replace {}: {}", file_path_.string(), ec.message());
        std::error_code cleanup_ec;
        fs::remove(temp_path, cleanup_ec);
        return false;
    }

    return true;
}

// =============================================================================
// Updates
// =============================================================================

void MetricsStore::record_build(double duration_seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    metrics_.total_builds++;
    metrics_.build_times.push_back(duration_seconds);
    metrics_.last_success = iso8601_utc(std::chrono::system_clock::now());
}

void MetricsStore::record_test(double duration_seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    metrics_.total_tests++;
    metrics_.test_times.push_back(duration_seconds);
}

void MetricsStore::record_error() {
    std::lock_guard<std::mutex> lock(mutex_);
    metrics_.total_errors++;
}

// =============================================================================
// Queries
// =============================================================================

std::optional<double> MetricsStore::rolling_average(DurationKind kind, size_t n) const {
    std::lock_guard<std::mutex> lock(mutex_);

    const std::vector<double>& samples =
        kind == DurationKind::BUILD ? metrics_.build_times : metrics_.test_times;

    if (samples.empty() || n == 0) {
        return std::nullopt;
    }

    size_t count = std::min(n, samples.size());
    double sum = 0.0;
    for (size_t i = samples.size() - count; i < samples.size(); ++i) {
        sum += samples[i];
    }
    return sum / static_cast<double>(count);
}

HistoricalMetrics MetricsStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metrics_;
}

LoadStatus MetricsStore::last_load_status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_load_status_;
}

// =============================================================================
// JSON Serialization
// =============================================================================

std::string MetricsStore::serialize(const HistoricalMetrics& metrics) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::setprecision(std::numeric_limits<double>::max_digits10);

    oss << "{\n";
    oss << "  \"total_builds\": " << metrics.total_builds << ",\n";
    oss << "  \"total_tests\": " << metrics.total_tests << ",\n";
    oss << "  \"total_errors\": " << metrics.total_errors << ",\n";

    oss << "  \"build_times\": ";
    write_double_array(oss, metrics.build_times);
    oss << ",\n";

    oss << "  \"test_times\": ";
    write_double_array(oss, metrics.test_times);
    oss << ",\n";

    oss << "  \"last_success\": ";
    if (metrics.last_success) {
        oss << "\"" << escape_json(*metrics.last_success) << "\"";
    } else {
        oss << "null";
    }
    oss << "\n}\n";

    return oss.str();
}

HistoricalMetrics MetricsStore::deserialize(const std::string& json_str) {
    HistoricalMetrics metrics;
    JsonReader reader(json_str);

    reader.expect('{');
    if (!reader.consume('}')) {
        do {
            std::string key = reader.read_string();
            reader.expect(':');

            if (key == "total_builds") {
                metrics.total_builds = reader.read_counter();
            } else if (key == "total_tests") {
                metrics.total_tests = reader.read_counter();
            } else if (key == "total_errors") {
                metrics.total_errors = reader.read_counter();
            } else if (key == "build_times") {
                metrics.build_times = reader.read_double_array();
            } else if (key == "test_times") {
                metrics.test_times = reader.read_double_array();
            } else if (key == "last_success") {
                if (reader.consume_literal("null")) {
                    metrics.last_success.reset();
                } else {
                    metrics.last_success = reader.read_string();
                }
            } else {
                reader.skip_value();
            }
        } while (reader.consume(','));
        reader.expect('}');
    }

    if (!reader.at_end()) {
        reader.fail("trailing content");
    }

    return metrics;
}

} // namespace ignite::build
