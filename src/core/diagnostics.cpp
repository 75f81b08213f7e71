#include <boa/core/diagnostics.h>
#include <boa/core/config.h>

#include <ostream>
#include <sstream>
#include <utility>

namespace boa::core {

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
    oss << "[" << config::kProgramName << "] ";
    switch (event.severity) {
        case Severity::Info:
            break;
        case Severity::Warning:
            oss << severity_name(event.severity) << ": ";
            break;
        case Severity::Error:
            if (!event.stage.empty()) {
                oss << event.stage << " failed: ";
            } else {
                oss << severity_name(event.severity) << ": ";
            }
            break;
    }
    oss << event.message;
    return oss.str();
}

DiagnosticObserver console_observer(std::ostream& out, std::ostream& err) {
    return [&out, &err](const DiagnosticEvent& event) {
        std::ostream& stream = event.severity == Severity::Info ? out : err;
        stream << format_diagnostic(event) << "\n";
        stream.flush();
    };
}

void DiagnosticEmitter::emit(Severity severity, const std::string& module,
                             const std::string& stage, const std::string& message) {
    if (severity < min_severity_) {
        return;
    }

    DiagnosticEvent event;
    event.severity = severity;
    event.module = module;
    event.stage = stage;
    event.message = message;

    events_.push_back(event);

    for (const auto& observer : observers_) {
        observer(event);
    }
}

void DiagnosticEmitter::info(const std::string& module, const std::string& message) {
    emit(Severity::Info, module, "", message);
}

void DiagnosticEmitter::error(const std::string& module, const std::string& stage,
                              const std::string& message) {
    emit(Severity::Error, module, stage, message);
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

}  // namespace boa::core
