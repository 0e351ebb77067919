/**
 * @file temp_workspace.hpp
 * @brief Private scratch directory that lives exactly as long as one execution.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <span>

namespace code_sandbox {

/**
 * @brief RAII temporary directory.
 *
 * Created with mkdtemp (mode 0700) and removed recursively on destruction,
 * which takes every materialized source and compiled artifact with it.
 */
class TempWorkspace {
public:
    /// Create a fresh directory under `root` (system temp dir when empty).
    static Result<TempWorkspace> create(const std::filesystem::path& root,
                                        std::string_view prefix = "sandbox");

    ~TempWorkspace();

    TempWorkspace(TempWorkspace&& other) noexcept;
    TempWorkspace& operator=(TempWorkspace&& other) noexcept;
    TempWorkspace(const TempWorkspace&) = delete;
    TempWorkspace& operator=(const TempWorkspace&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    /// Write files relative to the workspace; rejects names escaping it.
    Result<void> write(std::span<const SourceFile> files) const;

private:
    explicit TempWorkspace(std::filesystem::path path) : path_(std::move(path)) {}
    void remove() noexcept;

    std::filesystem::path path_;
};

/// lchown every entry below (and including) `root`.
Result<void> chown_tree(const std::filesystem::path& root, uint32_t uid, uint32_t gid);

/// Loosen permissions so a foreign uid can read (and optionally write) the tree.
Result<void> open_tree_permissions(const std::filesystem::path& root, bool writable);

}  // namespace code_sandbox
