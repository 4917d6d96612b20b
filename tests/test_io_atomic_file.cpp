// tests/test_io_atomic_file.cpp
//
// Regression coverage for voyage::io::write_atomic/read_all.
// The journey store relies on these for whole-document replacement and the
// ".bak" copy of the previous version.

#include <doctest/doctest.h>

#include "test_support/TempDir.hpp"
#include "voyage/io/AtomicFile.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;
using voyage::test::TempDir;

TEST_CASE("voyage::io::write_atomic round-trips bytes")
{
    const TempDir dir("io");
    const fs::path p = dir.path() / "atomic_io_roundtrip.txt";

    INFO("path: ", p.string());

    std::string err;
    CHECK(voyage::io::write_atomic(p, "hello\n", &err, /*make_backup=*/true));
    CHECK(err.empty());

    std::string read;
    err.clear();
    CHECK(voyage::io::read_all(p, read, &err));
    CHECK(err.empty());
    CHECK(read == "hello\n");

    // Overwrite should succeed and (with make_backup=true) preserve the prior version as .bak
    err.clear();
    CHECK(voyage::io::write_atomic(p, "world\n", &err, /*make_backup=*/true));
    CHECK(err.empty());

    read.clear();
    err.clear();
    CHECK(voyage::io::read_all(p, read, &err));
    CHECK(read == "world\n");

    const fs::path bak = voyage::io::default_backup_path(p);
    INFO("backup: ", bak.string());

    std::string bak_read;
    err.clear();
    CHECK(voyage::io::read_all(bak, bak_read, &err));
    CHECK(err.empty());
    CHECK(bak_read == "hello\n");

    // no temp file left behind
    fs::path tmp = p;
    tmp += ".tmp";
    CHECK_FALSE(fs::exists(tmp));
}

TEST_CASE("voyage::io::write_atomic make_backup=false does not create .bak")
{
    const TempDir dir("io");
    const fs::path p = dir.path() / "atomic_io_no_bak.txt";
    const fs::path bak = voyage::io::default_backup_path(p);

    std::string err;
    CHECK(voyage::io::write_atomic(p, "first", &err, /*make_backup=*/false));
    CHECK(err.empty());
    CHECK_FALSE(fs::exists(bak));

    err.clear();
    CHECK(voyage::io::write_atomic(p, "second", &err, /*make_backup=*/false));
    CHECK(err.empty());
    CHECK_FALSE(fs::exists(bak));
}

TEST_CASE("voyage::io::write_atomic creates missing parent directories")
{
    const TempDir dir("io");
    const fs::path p = dir.path() / "journeys" / "nested" / "doc.json";

    std::string err;
    CHECK(voyage::io::write_atomic(p, "{}", &err));
    CHECK(fs::exists(p));

    std::string read;
    CHECK(voyage::io::read_all(p, read));
    CHECK(read == "{}");
}

TEST_CASE("voyage::io::read_all reports a missing file")
{
    const TempDir dir("io");
    std::string out;
    std::string err;
    CHECK_FALSE(voyage::io::read_all(dir.path() / "absent.txt", out, &err));
    CHECK_FALSE(err.empty());
}
