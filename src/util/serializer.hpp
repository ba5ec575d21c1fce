#pragma once

#include "util/error.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace scape::util {

/// @brief Appends host-endian records to a byte buffer. Snapshots and control messages never
/// leave the machine that wrote them.
class BinaryWriter {
public:
    std::vector<char> buffer;

    void write(std::span<const char> bytes) { buffer.insert(buffer.end(), bytes.begin(), bytes.end()); }

    template <typename T>
    void write_pod(const T& val) {
        static_assert(std::is_trivially_copyable_v<T>, "Type must be trivially copyable");
        const auto* bytes = reinterpret_cast<const char*>(&val);
        write({bytes, sizeof(T)});
    }

    void write_bool(bool value) { write_pod(static_cast<uint8_t>(value ? 1 : 0)); }

    /// u32 length, then the bytes.
    auto write_str(std::string_view str) -> Result<void> {
        if (str.size() > std::numeric_limits<uint32_t>::max()) {
            return make_error<void>(ErrorCode::invalid_data, "String size exceeds uint32_t limit");
        }
        write_pod(static_cast<uint32_t>(str.size()));
        write({str.data(), str.size()});
        return {};
    }

    /// u32 count, then @p func(writer, item) per element.
    template <typename T, typename Func>
    auto write_vec(const std::vector<T>& vec, Func func) -> Result<void> {
        if (vec.size() > std::numeric_limits<uint32_t>::max()) {
            return make_error<void>(ErrorCode::invalid_data, "Vector size exceeds uint32_t limit");
        }
        write_pod(static_cast<uint32_t>(vec.size()));
        for (const auto& item : vec) {
            SCAPE_TRY(func(*this, item));
        }
        return {};
    }
};

/// @brief Bounds-checked cursor over a byte span. Reads return false on truncated input.
class BinaryReader {
public:
    explicit BinaryReader(std::span<const char> bytes) : m_rest(bytes) {}

    auto read(std::span<char> dest) -> bool {
        if (m_rest.size() < dest.size()) {
            return false;
        }
        std::copy_n(m_rest.begin(), dest.size(), dest.begin());
        m_rest = m_rest.subspan(dest.size());
        return true;
    }

    template <typename T>
    auto read_pod(T& val) -> bool {
        static_assert(std::is_trivially_copyable_v<T>, "Type must be trivially copyable");
        return read({reinterpret_cast<char*>(&val), sizeof(T)});
    }

    auto read_bool(bool& value) -> bool {
        uint8_t raw = 0;
        if (!read_pod(raw) || raw > 1) {
            return false;
        }
        value = raw != 0;
        return true;
    }

    auto read_str(std::string& str) -> bool {
        uint32_t len = 0;
        if (!read_pod(len) || m_rest.size() < len) {
            return false;
        }
        str.assign(m_rest.data(), len);
        m_rest = m_rest.subspan(len);
        return true;
    }

    template <typename T, typename Func>
    auto read_vec(std::vector<T>& vec, Func func) -> bool {
        uint32_t count = 0;
        if (!read_pod(count)) {
            return false;
        }
        // Every element occupies at least one byte; reject counts a truncated buffer cannot hold
        if (count > m_rest.size()) {
            return false;
        }
        vec.resize(count);
        for (auto& item : vec) {
            if (!func(*this, item)) {
                vec.clear();
                return false;
            }
        }
        return true;
    }

    /// Bytes not consumed yet.
    [[nodiscard]] auto rest() const -> std::span<const char> { return m_rest; }
    [[nodiscard]] auto exhausted() const -> bool { return m_rest.empty(); }

private:
    std::span<const char> m_rest;
};

/// 32-bit FNV-1a over raw bytes.
[[nodiscard]] inline auto fnv1a32(std::span<const char> bytes) -> uint32_t {
    uint32_t hash = 2166136261u;
    for (char c : bytes) {
        hash ^= static_cast<uint8_t>(c);
        hash *= 16777619u;
    }
    return hash;
}

inline auto read_file_binary(const std::filesystem::path& path) -> Result<std::vector<char>> {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return make_error<std::vector<char>>(ErrorCode::file_not_found,
                                             "File not found: " + path.string());
    }

    const auto size = file.tellg();
    if (size <= 0) {
        return std::vector<char>{};
    }

    std::vector<char> buffer(static_cast<size_t>(size));
    file.seekg(0, std::ios::beg);
    if (!file.read(buffer.data(), size)) {
        return make_error<std::vector<char>>(ErrorCode::file_read_failed, "Failed to read file");
    }

    return buffer;
}

inline auto write_file_binary(const std::filesystem::path& path, std::span<const char> data)
    -> Result<void> {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return make_error<void>(ErrorCode::file_write_failed,
                                    "Failed to create directory: " + path.parent_path().string());
        }
    }

    // Atomic replace: write a sibling, then rename over the target
    auto tmp_path = path;
    tmp_path += ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            return make_error<void>(ErrorCode::file_write_failed,
                                    "Failed to open file for writing: " + tmp_path.string());
        }
        file.write(data.data(), static_cast<std::streamsize>(data.size()));
        if (!file) {
            return make_error<void>(ErrorCode::file_write_failed,
                                    "Failed to write file: " + tmp_path.string());
        }
    }

    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        return make_error<void>(ErrorCode::file_write_failed,
                                "Failed to replace file: " + path.string());
    }
    return {};
}

} // namespace scape::util
