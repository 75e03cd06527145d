/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#include "diagnostics.h"
#include "errors.h"
#include "util/log.h"

namespace textvault {

const char* to_string(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::FileIO:      return "FileIO";
        case ErrorCategory::Memory:      return "Memory";
        case ErrorCategory::Validation:  return "Validation";
        case ErrorCategory::Performance: return "Performance";
        case ErrorCategory::System:      return "System";
    }
    return "Unknown";
}

const char* to_string(Severity s) {
    switch (s) {
        case Severity::Info:     return "Info";
        case Severity::Warning:  return "Warning";
        case Severity::Error:    return "Error";
        case Severity::Critical: return "Critical";
    }
    return "Unknown";
}

static LogLevel level_for(Severity s) {
    switch (s) {
        case Severity::Info:     return LOG_INFO;
        case Severity::Warning:  return LOG_WARNING;
        case Severity::Error:    return LOG_ERROR;
        case Severity::Critical: return LOG_SEVERE;
    }
    return LOG_INFO;
}

void report(EventSink* sink, const ErrorEvent& event) {
    {
        auto out = textvault::log(level_for(event.severity));
        out << '[' << to_string(event.category) << "] " << event.message;
        if (event.context) {
            out << " (" << *event.context << ')';
        }
        if (event.detail) {
            out << ": " << *event.detail;
        }
    }

    if (sink) {
        sink->on_event(event);
    }
}

void report(EventSink* sink, ErrorCategory category, Severity severity,
            const std::string& message,
            const std::optional<std::string>& context) {
    ErrorEvent ev;
    ev.category = category;
    ev.severity = severity;
    ev.message = message;
    ev.context = context;
    report(sink, ev);
}

void report(EventSink* sink, ErrorCategory category, Severity severity,
            const std::string& message, std::exception_ptr ep,
            const std::optional<std::string>& context) {
    ErrorEvent ev;
    ev.category = category;
    ev.severity = severity;
    ev.message = message;
    ev.context = context;
    if (ep) {
        ev.detail = classify_exception(ep).message;
    }
    report(sink, ev);
}

} // namespace textvault
