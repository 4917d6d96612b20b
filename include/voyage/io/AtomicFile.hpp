// include/voyage/io/AtomicFile.hpp
//
// Atomic whole-file writes and full-file reads for the journey store.
//
// Guarantees:
//  - Data is written to a sibling "<final>.tmp", flushed and closed, then renamed
//    over the destination. std::filesystem::rename replaces an existing file
//    atomically on POSIX filesystems, so readers see either the old or the new
//    document, never a torn one.
//  - With make_backup, the previous destination is copied to "<final>.bak" first.

#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace voyage::io {

namespace fs = std::filesystem;

/// Atomically write the full contents of `bytes` to `final_path`.
/// Creates missing parent directories.
///
/// @return true on success; false on error (with `err` populated if provided).
[[nodiscard]] bool write_atomic(const fs::path& final_path,
                                std::string_view bytes,
                                std::string* err = nullptr,
                                bool make_backup = false);

/// Read the entire file at `path` into `out`.
///
/// @return true on success; false on error (with `err` populated if provided).
[[nodiscard]] bool read_all(const fs::path& path,
                            std::string& out,
                            std::string* err = nullptr);

/// "<final>.bak", the path write_atomic uses when make_backup is set.
[[nodiscard]] inline fs::path default_backup_path(const fs::path& final_path)
{
    fs::path p = final_path;
    p += ".bak";
    return p;
}

} // namespace voyage::io
