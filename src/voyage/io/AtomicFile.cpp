#include "voyage/io/AtomicFile.hpp"

#include <fstream>
#include <system_error>

namespace {
    bool write_temp_and_flush(const std::filesystem::path& temp, std::string_view bytes, std::string* err) {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            if (err) *err = "open failed: " + temp.string();
            return false;
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) {
            if (err) *err = "write failed: " + temp.string();
            return false;
        }
        out.close();
        return !out.fail();
    }
}

namespace voyage::io {
    bool write_atomic(const fs::path& path,
                      std::string_view bytes,
                      std::string* err,
                      bool make_backup)
    {
        std::error_code ec;
        if (path.has_parent_path()) {
            fs::create_directories(path.parent_path(), ec);
            if (ec) {
                if (err) *err = "create_directories failed: " + ec.message();
                return false;
            }
        }

        auto tmp = path; tmp += ".tmp";

        if (!write_temp_and_flush(tmp, bytes, err)) {
            fs::remove(tmp, ec);
            return false;
        }

        if (make_backup && fs::exists(path, ec)) {
            fs::copy_file(path, default_backup_path(path), fs::copy_options::overwrite_existing, ec);
            if (ec) {
                if (err) *err = "backup failed: " + ec.message();
                fs::remove(tmp, ec);
                return false;
            }
        }

        fs::rename(tmp, path, ec);
        if (ec) {
            if (err) *err = "rename failed: " + ec.message();
            std::error_code rec;
            fs::remove(tmp, rec);
            return false;
        }
        return true;
    }

    bool read_all(const fs::path& p, std::string& out, std::string* err) {
        std::ifstream in(p, std::ios::binary);
        if (!in) { if (err) *err = "open failed: " + p.string(); return false; }
        in.seekg(0, std::ios::end);
        const auto sz = in.tellg();
        if (sz < 0) { if (err) *err = "tellg failed: " + p.string(); return false; }
        in.seekg(0, std::ios::beg);
        out.resize(static_cast<size_t>(sz));
        if (sz > 0 && !in.read(out.data(), sz)) {
            if (err) *err = "read failed: " + p.string();
            return false;
        }
        return true;
    }
}
