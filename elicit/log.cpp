#include <elicit/log.hpp>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace elicit { namespace log {

namespace {
std::mutex lock_;
std::atomic<int> threshold_{static_cast<int>(level::warning)};
std::ofstream file_;
}

const char* to_string(level l) {
    switch (l) {
        case level::debug: return "DEBUG";
        case level::info: return "INFO";
        case level::warning: return "WARNING";
        case level::error: return "ERROR";
    }
    return "UNKNOWN";
}

level parse_level(const std::string &name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    if (lower == "debug") return level::debug;
    if (lower == "info") return level::info;
    if (lower == "warning" or lower == "warn") return level::warning;
    if (lower == "error") return level::error;
    throw std::invalid_argument("Unknown log level `" + name + "'");
}

void threshold(level min_level) { threshold_ = static_cast<int>(min_level); }

level threshold() { return static_cast<level>(threshold_.load()); }

bool enabled(level l) { return static_cast<int>(l) >= threshold_.load(); }

void open(const std::string &path) {
    std::unique_lock<std::mutex> lock(lock_);
    if (file_.is_open()) file_.close();
    file_.open(path, std::ios::out | std::ios::app);
    if (not file_.is_open())
        throw std::runtime_error("Unable to open log file `" + path + "' for writing");
}

void close() {
    std::unique_lock<std::mutex> lock(lock_);
    if (file_.is_open()) file_.close();
}

void write(level l, const std::string &message) {
    std::time_t t = std::time(nullptr);
    char tstr[100];
    std::tm local;
    localtime_r(&t, &local);
    std::strftime(tstr, sizeof(tstr), "%Y-%m-%d %H:%M:%S", &local);

    std::string line = std::string("[") + tstr + "] " + to_string(l) + ": " + message + "\n";

    std::unique_lock<std::mutex> lock(lock_);
    std::cerr << line << std::flush;
    if (file_.is_open()) file_ << line << std::flush;
}

}}
