#pragma once

#include <gtest/gtest.h>
#include <httplib.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#ifdef _WIN32
inline int setenv(const char* name, const char* value, int overwrite) {
    if (!overwrite && std::getenv(name) != nullptr) {
        return 0;
    }
    return _putenv_s(name, value ? value : "");
}

inline int unsetenv(const char* name) {
    return _putenv_s(name, "");
}
#endif

namespace airdl::test {

namespace fs = std::filesystem;

/// Unique directory under the system temp dir, removed on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "airdl-test") {
        std::random_device rd;
        std::mt19937_64 rng(rd());
        for (int attempt = 0; attempt < 100; ++attempt) {
            auto candidate = fs::temp_directory_path() / (prefix + "-" + std::to_string(rng() % 1000000000ULL));
            std::error_code ec;
            if (fs::create_directory(candidate, ec)) {
                path = candidate;
                return;
            }
        }
        path = fs::temp_directory_path() / prefix;
        fs::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    fs::path path;
};

/// Restores the listed environment variables on destruction.
class EnvGuard {
public:
    explicit EnvGuard(const std::vector<std::string>& keys) : keys_(keys) {
        for (const auto& k : keys_) {
            const char* v = std::getenv(k.c_str());
            if (v) saved_[k] = v;
        }
    }
    ~EnvGuard() {
        for (const auto& k : keys_) {
            if (auto it = saved_.find(k); it != saved_.end()) {
                setenv(k.c_str(), it->second.c_str(), 1);
            } else {
                unsetenv(k.c_str());
            }
        }
    }

private:
    std::vector<std::string> keys_;
    std::unordered_map<std::string, std::string> saved_;
};

inline void wait_for_server(httplib::Server& server, std::chrono::milliseconds timeout) {
    const auto start = std::chrono::steady_clock::now();
    while (!server.is_running()) {
        if (std::chrono::steady_clock::now() - start > timeout) {
            FAIL() << "Server failed to start within timeout";
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

/// httplib::Server on a free loopback port. Register handlers, then start().
class LocalServer {
public:
    ~LocalServer() { stop(); }

    void start() {
        port = server.bind_to_any_port("127.0.0.1");
        ASSERT_GT(port, 0) << "could not bind a loopback port";
        thread = std::thread([this]() { server.listen_after_bind(); });
        wait_for_server(server, std::chrono::seconds(5));
    }

    void stop() {
        if (thread.joinable()) {
            server.stop();
            thread.join();
        }
    }

    std::string baseUrl() const { return "http://127.0.0.1:" + std::to_string(port); }

    httplib::Server server;
    int port{0};
    std::thread thread;
};

inline std::string read_file(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

}  // namespace airdl::test
