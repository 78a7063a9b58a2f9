#pragma once

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

// Request-private scratch directory, removed with everything in it when the
// owner goes out of scope.
class TempDir {
public:
    static std::expected<TempDir, std::string> create(const std::string& root,
                                                      const std::string& prefix);

    ~TempDir();

    TempDir(TempDir&& other) noexcept;
    TempDir& operator=(TempDir&& other) noexcept;
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    explicit TempDir(std::filesystem::path path) : path_(std::move(path)) {}
    void remove();

    std::filesystem::path path_;
};

// Basename of an uploaded filename with path separators and NULs neutralized.
std::string safe_filename(std::string_view name);
