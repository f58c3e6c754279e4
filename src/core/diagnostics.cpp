#include "minicss/core/diagnostics.h"

#include <algorithm>
#include <sstream>
#include <utility>

namespace minicss::core {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Info:    return "info";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
}

std::string format_diagnostic(const DiagnosticEvent& event) {
    std::ostringstream oss;
    oss << "[" << severity_name(event.severity) << "]";
    if (!event.module.empty()) {
        oss << " " << event.module;
    }
    if (!event.stage.empty()) {
        oss << "/" << event.stage;
    }
    if (event.line != 0) {
        oss << " (" << event.line << ":" << event.column << ")";
    }
    oss << ": " << event.message;
    return oss.str();
}

void DiagnosticEmitter::emit(Severity severity, const std::string& module,
                             const std::string& stage, const std::string& message,
                             std::size_t line, std::size_t column) {
    if (severity < min_severity_) {
        return;
    }

    DiagnosticEvent event;
    event.timestamp = std::chrono::steady_clock::now();
    event.severity = severity;
    event.module = module;
    event.stage = stage;
    event.message = message;
    event.line = line;
    event.column = column;

    events_.push_back(event);

    for (const auto& observer : observers_) {
        observer(event);
    }
}

void DiagnosticEmitter::set_min_severity(Severity min) {
    min_severity_ = min;
}

Severity DiagnosticEmitter::min_severity() const {
    return min_severity_;
}

void DiagnosticEmitter::add_observer(DiagnosticObserver observer) {
    observers_.push_back(std::move(observer));
}

const std::vector<DiagnosticEvent>& DiagnosticEmitter::events() const {
    return events_;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_severity(Severity severity) const {
    std::vector<DiagnosticEvent> result;
    for (const auto& e : events_) {
        if (e.severity == severity) {
            result.push_back(e);
        }
    }
    return result;
}

void DiagnosticEmitter::clear() {
    events_.clear();
}

std::size_t DiagnosticEmitter::size() const {
    return events_.size();
}

SourceLocation locate_offset(std::string_view source, std::size_t offset) {
    offset = std::min(offset, source.size());

    SourceLocation location;
    for (std::size_t i = 0; i < offset; ++i) {
        if (source[i] == '\n') {
            ++location.line;
            location.line_start = i + 1;
        }
    }
    location.column = offset - location.line_start;

    // A newline at `offset` terminates the line it belongs to.
    const std::size_t newline = source.find('\n', offset);
    location.line_end = newline == std::string_view::npos ? source.size() : newline;
    return location;
}

std::string format_source_diagnostic(std::string_view source, std::size_t offset,
                                     const std::string& message) {
    const SourceLocation location = locate_offset(source, offset);

    std::string_view line_text =
        source.substr(location.line_start, location.line_end - location.line_start);
    if (!line_text.empty() && line_text.back() == '\r') {
        line_text.remove_suffix(1);
    }

    std::ostringstream oss;
    oss << "Error at line " << location.line << ", column " << location.column << ". "
        << message << "\n\n";
    oss << line_text << "\n";
    oss << std::string(location.column, ' ') << "^ Near here.\n";
    return oss.str();
}

}  // namespace minicss::core
