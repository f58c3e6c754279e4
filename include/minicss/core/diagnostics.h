#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace minicss::core {

enum class Severity {
    Info,
    Warning,
    Error,
};

const char* severity_name(Severity severity);

struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;
    std::string stage;
    std::string message;
    // Source position of the event; line 0 means no position.
    std::size_t line = 0;
    std::size_t column = 0;
};

std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

class DiagnosticEmitter {
public:
    void emit(Severity severity, const std::string& module,
              const std::string& stage, const std::string& message,
              std::size_t line = 0, std::size_t column = 0);

    void set_min_severity(Severity min);
    Severity min_severity() const;

    void add_observer(DiagnosticObserver observer);

    const std::vector<DiagnosticEvent>& events() const;
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;

    void clear();
    std::size_t size() const;

private:
    std::vector<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    Severity min_severity_ = Severity::Info;
};

// Position of a byte offset inside a source buffer. `line` is 1-based and
// `column` is 0-based. [line_start, line_end) is the text of that line
// without its terminating newline.
struct SourceLocation {
    std::size_t line = 1;
    std::size_t column = 0;
    std::size_t line_start = 0;
    std::size_t line_end = 0;
};

// Recomputed by scanning from the beginning of `source`, independent of any
// parser state. Offsets past the end are clamped to `source.size()`.
SourceLocation locate_offset(std::string_view source, std::size_t offset);

// "Error at line L, column C. <message>", a blank line, the source line and
// a caret under the column.
std::string format_source_diagnostic(std::string_view source, std::size_t offset,
                                     const std::string& message);

}  // namespace minicss::core
