/**
 * @file temp_workspace.cpp
 * @brief TempWorkspace implementation.
 * @author Dimitris Kafetzis
 */

#include "sandbox/temp_workspace.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <string>
#include <system_error>
#include <unistd.h>
#include <vector>

namespace code_sandbox {

namespace fs = std::filesystem;

namespace {

bool escapes_root(const fs::path& relative) {
    if (relative.empty() || relative.is_absolute()) return true;
    for (const auto& part : relative) {
        if (part == "..") return true;
    }
    return false;
}

}  // anonymous namespace

Result<TempWorkspace> TempWorkspace::create(const fs::path& root, std::string_view prefix) {
    std::error_code ec;
    fs::path base = root.empty() ? fs::temp_directory_path(ec) : root;
    if (ec) {
        return Error{"Cannot determine temp directory: " + ec.message(), ErrorKind::SetupFailure};
    }
    fs::create_directories(base, ec);
    if (ec) {
        return Error{"Cannot create workspace root " + base.string() + ": " + ec.message(),
                     ErrorKind::SetupFailure};
    }

    std::string pattern = (base / (std::string{prefix} + "-XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (::mkdtemp(buffer.data()) == nullptr) {
        return Error{"mkdtemp failed: " + std::string{std::strerror(errno)},
                     ErrorKind::SetupFailure};
    }
    return TempWorkspace{fs::path{buffer.data()}};
}

TempWorkspace::~TempWorkspace() {
    remove();
}

TempWorkspace::TempWorkspace(TempWorkspace&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

TempWorkspace& TempWorkspace::operator=(TempWorkspace&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

void TempWorkspace::remove() noexcept {
    if (path_.empty()) return;
    std::error_code ec;
    fs::remove_all(path_, ec);
    path_.clear();
}

Result<void> TempWorkspace::write(std::span<const SourceFile> files) const {
    for (const auto& file : files) {
        fs::path relative{file.name};
        if (escapes_root(relative)) {
            return Error{"Refusing to write outside workspace: " + file.name,
                         ErrorKind::SetupFailure};
        }
        auto target = path_ / relative;
        std::error_code ec;
        if (target.has_parent_path()) {
            fs::create_directories(target.parent_path(), ec);
            if (ec) {
                return Error{"Cannot create " + target.parent_path().string() + ": " + ec.message(),
                             ErrorKind::SetupFailure};
            }
        }
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        out << file.content;
        out.close();
        if (!out) {
            return Error{"Failed to write " + target.string(), ErrorKind::SetupFailure};
        }
    }
    return {};
}

Result<void> chown_tree(const fs::path& root, uint32_t uid, uint32_t gid) {
    auto change = [&](const fs::path& p) -> Result<void> {
        if (::lchown(p.c_str(), uid, gid) != 0) {
            return Error{"chown " + p.string() + ": " + std::strerror(errno),
                         ErrorKind::SetupFailure};
        }
        return {};
    };

    if (auto r = change(root); !r) return r;
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(root, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (auto r = change(it->path()); !r) return r;
    }
    if (ec) {
        return Error{"Cannot walk workspace: " + ec.message(), ErrorKind::SetupFailure};
    }
    return {};
}

Result<void> open_tree_permissions(const fs::path& root, bool writable) {
    const auto dir_perms = writable ? fs::perms::all : (fs::perms::all & ~fs::perms::others_write
                                                                       & ~fs::perms::group_write);
    const auto file_perms = writable
        ? (fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read
           | fs::perms::group_write | fs::perms::others_read | fs::perms::others_write)
        : (fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read
           | fs::perms::others_read);

    std::error_code ec;
    fs::permissions(root, dir_perms, ec);
    if (ec) {
        return Error{"chmod " + root.string() + ": " + ec.message(), ErrorKind::SetupFailure};
    }
    for (auto it = fs::recursive_directory_iterator(root, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code perm_ec;
        fs::permissions(it->path(), it->is_directory() ? dir_perms : file_perms, perm_ec);
        if (perm_ec) {
            return Error{"chmod " + it->path().string() + ": " + perm_ec.message(),
                         ErrorKind::SetupFailure};
        }
    }
    if (ec) {
        return Error{"Cannot walk workspace: " + ec.message(), ErrorKind::SetupFailure};
    }
    return {};
}

}  // namespace code_sandbox
