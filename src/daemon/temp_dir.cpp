#include "temp_dir.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <print>
#include <vector>

namespace fs = std::filesystem;

std::expected<TempDir, std::string> TempDir::create(const std::string& root,
                                                    const std::string& prefix) {
    auto tmpl_path = fs::path(root) / (prefix + "XXXXXX");
    std::string s = tmpl_path.string();
    // mkdtemp needs a mutable char*
    std::vector<char> tmpl(s.begin(), s.end());
    tmpl.push_back('\0');

    if (::mkdtemp(tmpl.data()) == nullptr) {
        return std::unexpected("mkdtemp(" + s + ") failed: " + std::strerror(errno));
    }
    return TempDir(fs::path(tmpl.data()));
}

TempDir::~TempDir() {
    remove();
}

TempDir::TempDir(TempDir&& other) noexcept : path_(std::move(other.path_)) {
    other.path_.clear();
}

TempDir& TempDir::operator=(TempDir&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

void TempDir::remove() {
    if (path_.empty()) return;
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        std::println(stderr, "tempdir: failed to remove {}: {}", path_.string(), ec.message());
    }
    path_.clear();
}

std::string safe_filename(std::string_view name) {
    auto slash = name.find_last_of("/\\");
    if (slash != std::string_view::npos) name.remove_prefix(slash + 1);

    std::string base;
    base.reserve(name.size());
    for (char c : name) {
        base.push_back(c == '\0' ? '_' : c);
    }

    auto first = base.find_first_not_of(" \t\r\n");
    auto last = base.find_last_not_of(" \t\r\n");
    base = first == std::string::npos ? std::string{} : base.substr(first, last - first + 1);

    if (base.empty() || base == "." || base == "..") return "upload.bin";
    return base;
}
