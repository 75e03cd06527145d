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

#pragma once

#include <exception>
#include <optional>
#include <string>

namespace textvault {

enum class ErrorCategory {
    FileIO,
    Memory,
    Validation,
    Performance,
    System
};

enum class Severity {
    Info,
    Warning,
    Error,
    Critical
};

const char* to_string(ErrorCategory c);
const char* to_string(Severity s);

struct ErrorEvent {
    ErrorCategory category = ErrorCategory::System;
    Severity severity = Severity::Info;
    std::string message;
    std::optional<std::string> detail;    // what() of the triggering exception
    std::optional<std::string> context;   // usually the file path
};

/**
 * Receiver for structured error/performance events. The engine calls into
 * it but owns none of its state; implementations must be thread-safe.
 */
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void on_event(const ErrorEvent& event) = 0;
};

/**
 * Log the event at the level matching its severity and forward it to
 * `sink` when one is attached.
 */
void report(EventSink* sink, const ErrorEvent& event);

void report(EventSink* sink, ErrorCategory category, Severity severity,
            const std::string& message,
            const std::optional<std::string>& context = std::nullopt);

// Same as above with the current exception's message as detail.
void report(EventSink* sink, ErrorCategory category, Severity severity,
            const std::string& message, std::exception_ptr ep,
            const std::optional<std::string>& context = std::nullopt);

} // namespace textvault
