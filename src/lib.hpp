#pragma once

#include <exception>
#include <filesystem>
#include <fmt/format.h>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

namespace icongen {

enum class ErrorKind {
    NotFound,
    IoFailure,
    UnsupportedFormat,
    InvalidSelection,
};

constexpr std::string_view ToString(const ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NotFound:
        return "NotFound";
    case ErrorKind::IoFailure:
        return "IOFailure";
    case ErrorKind::UnsupportedFormat:
        return "UnsupportedFormat";
    case ErrorKind::InvalidSelection:
        return "InvalidSelection";
    }
    return "Unknown";
}

class FileError final : public std::exception {
public:
    FileError(const fs::path &path, const std::string &message, const ErrorKind kind = ErrorKind::IoFailure)
        : m_kind(kind) {
        m_msg = fmt::format("{} (while opening: {})", message, path.string());
    }

    [[nodiscard]] const char *what() const noexcept override {
        return m_msg.c_str();
    }

    [[nodiscard]] ErrorKind kind() const noexcept {
        return m_kind;
    }

private:
    ErrorKind m_kind;
    std::string m_msg;
};

} // namespace icongen
