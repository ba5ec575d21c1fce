#pragma once

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unistd.h>
#include <vector>

namespace scape::test {

class EnvVarGuard {
public:
    EnvVarGuard(std::string key, std::optional<std::string> value) : m_key(std::move(key)) {
        const char* prev = std::getenv(m_key.c_str());
        if (prev != nullptr) {
            m_prev = std::string(prev);
        }

        if (value.has_value()) {
            setenv(m_key.c_str(), value->c_str(), 1);
        } else {
            unsetenv(m_key.c_str());
        }
    }

    ~EnvVarGuard() {
        if (m_prev.has_value()) {
            setenv(m_key.c_str(), m_prev->c_str(), 1);
        } else {
            unsetenv(m_key.c_str());
        }
    }

    EnvVarGuard(const EnvVarGuard&) = delete;
    EnvVarGuard& operator=(const EnvVarGuard&) = delete;
    EnvVarGuard(EnvVarGuard&&) = delete;
    EnvVarGuard& operator=(EnvVarGuard&&) = delete;

private:
    std::string m_key;
    std::optional<std::string> m_prev;
};

class TempDir {
public:
    explicit TempDir(std::string_view name_prefix) {
        auto base = std::filesystem::temp_directory_path();
        auto tmpl = (base / (std::string(name_prefix) + "-XXXXXX")).string();

        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');

        char* dir = mkdtemp(buf.data());
        if (dir == nullptr) {
            m_path = base / std::string(name_prefix);
            std::error_code ec;
            std::filesystem::create_directories(m_path, ec);
            return;
        }
        m_path = std::filesystem::path(dir);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return m_path; }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
    TempDir(TempDir&&) = delete;
    TempDir& operator=(TempDir&&) = delete;

private:
    std::filesystem::path m_path;
};

} // namespace scape::test
