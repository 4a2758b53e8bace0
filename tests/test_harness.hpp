#pragma once
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <random>
#include <string>

#include "tlsscan/errors.hpp"

// Simple test framework shared by every test executable
inline int g_failures = 0;

inline void run_test(const std::string& name, std::function<bool()> test_fn) {
    std::cout << "[RUN] " << name << "... ";
    try {
        if (test_fn()) {
            std::cout << "PASS\n";
        } else {
            std::cout << "FAIL\n";
            g_failures++;
        }
    } catch (const std::exception& e) {
        std::cout << "FAIL (Exception: " << e.what() << ")\n";
        g_failures++;
    }
}

inline int finish(const std::string& suite) {
    std::cout << "\n" << suite << " completed with " << g_failures << " failures.\n";
    return g_failures > 0 ? 1 : 0;
}

/**
 * true if `fn` throws a ConfigurationError of exactly `kind`.
 */
template <typename Fn>
bool throws_config_error(Fn&& fn, tlsscan::ConfigErrorKind kind) {
    try {
        fn();
    } catch (const tlsscan::ConfigurationError& e) {
        if (e.kind() != kind) {
            std::cerr << "  got " << tlsscan::to_string(e.kind()) << ": " << e.what() << "\n";
            return false;
        }
        return true;
    }
    std::cerr << "  no exception thrown\n";
    return false;
}

/**
 * Scratch directory removed when the test executable exits.
 */
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("tlsscan-test-" + std::to_string(rd()) + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string file(const std::string& name, const std::string& content) const {
        const auto p = path_ / name;
        std::ofstream f(p, std::ios::out | std::ios::trunc | std::ios::binary);
        f << content;
        return p.string();
    }

    std::string path(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};
