/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * Common test helpers for file-level tests
 */

#pragma once

#include <string>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <vector>
#include <cstdint>
#include <mutex>

#include <gmock/gmock.h>

#include "diagnostics.h"

namespace textvault::persist::test {

// Create a temporary directory for testing
inline std::string create_temp_dir(const std::string& prefix) {
    std::filesystem::path temp_path = std::filesystem::temp_directory_path();

    // Generate random suffix
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(10000, 99999);

    std::string dir_name = prefix + "_" + std::to_string(dis(gen));
    std::filesystem::path test_dir = temp_path / dir_name;

    std::filesystem::create_directories(test_dir);
    return test_dir.string();
}

// Write raw bytes, replacing any existing file
inline void write_file(const std::string& path, const std::string& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

inline std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// `count` lines of exactly `line_len` bytes each (newline included)
inline std::string make_lines(size_t count, size_t line_len, const std::string& tag = "line") {
    std::string out;
    out.reserve(count * line_len);
    for (size_t i = 0; i < count; i++) {
        std::string line = tag + " " + std::to_string(i) + " ";
        while (line.size() < line_len - 1) {
            line.push_back(static_cast<char>('a' + (line.size() % 26)));
        }
        line.resize(line_len - 1);
        line.push_back('\n');
        out += line;
    }
    return out;
}

// Generate test data with a pattern
inline std::vector<uint8_t> generate_test_data(size_t size, uint8_t pattern = 0) {
    std::vector<uint8_t> data(size);
    for (size_t i = 0; i < size; i++) {
        data[i] = pattern + (i % 256);
    }
    return data;
}

// Truncate file to simulate torn write
inline void truncate_file(const std::string& path, size_t new_size) {
    std::filesystem::resize_file(path, new_size);
}

class MockEventSink : public EventSink {
public:
    MOCK_METHOD(void, on_event, (const ErrorEvent& event), (override));
};

// Keeps every event for later inspection
class RecordingSink : public EventSink {
public:
    void on_event(const ErrorEvent& event) override {
        std::lock_guard<std::mutex> lock(mu_);
        events_.push_back(event);
    }

    std::vector<ErrorEvent> events() const {
        std::lock_guard<std::mutex> lock(mu_);
        return events_;
    }

    size_t count(Severity s) const {
        std::lock_guard<std::mutex> lock(mu_);
        size_t n = 0;
        for (const auto& e : events_) {
            if (e.severity == s) n++;
        }
        return n;
    }

private:
    mutable std::mutex mu_;
    std::vector<ErrorEvent> events_;
};

} // namespace textvault::persist::test
