/**
 * @file FileVaultTests.cpp
 * @brief Unit tests for the recording_<id>/ audio layout
 */

#include "FileVault.hpp"

#include "Errors.hpp"
#include "TestSupport.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <filesystem>

using namespace va;
using va::test::read_file;
using va::test::temp_directory;
using va::test::write_file;

namespace fs = std::filesystem;

// ============================================================================
// Root selection
// ============================================================================

TEST_CASE("vault: private root when no external root is configured", "[vault]") {
    temp_directory temp_dir;

    FileVault vault(VaultLocations{"", (temp_dir.path() / "private").string()});

    CHECK_FALSE(vault.uses_external_storage());
    CHECK(vault.base_directory() == temp_dir.path() / "private" / "audio_analysis");
    CHECK(fs::is_directory(vault.base_directory()));
}

TEST_CASE("vault: external root wins when usable", "[vault]") {
    temp_directory temp_dir;

    FileVault vault(VaultLocations{(temp_dir.path() / "shared").string(),
                                   (temp_dir.path() / "private").string()});

    CHECK(vault.uses_external_storage());
    CHECK(vault.base_directory() == temp_dir.path() / "shared" / "audio_analysis");
}

TEST_CASE("vault: unusable external root falls back to private", "[vault]") {
    temp_directory temp_dir;
    // A regular file where the external directory should be.
    write_file(temp_dir.path() / "blocked", "not a directory");

    FileVault vault(VaultLocations{(temp_dir.path() / "blocked").string(),
                                   (temp_dir.path() / "private").string()});

    CHECK_FALSE(vault.uses_external_storage());
}

TEST_CASE("vault: no usable root throws", "[vault]") {
    temp_directory temp_dir;
    write_file(temp_dir.path() / "blocked", "x");

    CHECK_THROWS_AS(FileVault(VaultLocations{"", (temp_dir.path() / "blocked").string()}),
                    FileSystemError);
}

// ============================================================================
// store
// ============================================================================

TEST_CASE("vault: store copies into recording_<id>", "[vault]") {
    temp_directory temp_dir;
    FileVault vault(VaultLocations{"", temp_dir.path().string()});

    const auto source = temp_dir.path() / "take.m4a";
    write_file(source, "audio-bytes");

    const std::string stored = vault.store(source.string(), 7);

    CHECK(fs::path(stored) == vault.base_directory() / "recording_7" / "recording.m4a");
    CHECK(read_file(stored) == "audio-bytes");
    CHECK(fs::exists(source));   // copied, not moved
    CHECK(vault.owns(stored, 7));
    CHECK_FALSE(vault.owns(stored, 8));
}

TEST_CASE("vault: extensionless source keeps no extension", "[vault]") {
    temp_directory temp_dir;
    FileVault vault(VaultLocations{"", temp_dir.path().string()});

    const auto source = temp_dir.path() / "take";
    write_file(source, "x");

    CHECK(fs::path(vault.store(source.string(), 1)).filename() == "recording");
}

TEST_CASE("vault: storing again leaves exactly one artifact", "[vault]") {
    temp_directory temp_dir;
    FileVault vault(VaultLocations{"", temp_dir.path().string()});

    write_file(temp_dir.path() / "first.wav", "first");
    write_file(temp_dir.path() / "second.m4a", "second");

    vault.store((temp_dir.path() / "first.wav").string(), 3);
    const std::string stored = vault.store((temp_dir.path() / "second.m4a").string(), 3);

    size_t entries = 0;
    for (const auto& e : fs::directory_iterator(vault.directory_for(3))) {
        (void)e;
        ++entries;
    }
    CHECK(entries == 1);
    CHECK(read_file(stored) == "second");
    REQUIRE(vault.recording_path(3).has_value());
    CHECK(*vault.recording_path(3) == stored);
}

TEST_CASE("vault: store of a missing source throws", "[vault]") {
    temp_directory temp_dir;
    FileVault vault(VaultLocations{"", temp_dir.path().string()});

    CHECK_THROWS_AS(vault.store((temp_dir.path() / "missing.m4a").string(), 1),
                    FileSystemError);
    CHECK_FALSE(fs::exists(vault.directory_for(1)));
}

TEST_CASE("vault: store fails when the directory slot is a file", "[vault]") {
    temp_directory temp_dir;
    FileVault vault(VaultLocations{"", temp_dir.path().string()});

    write_file(vault.base_directory() / "recording_4", "squatter");
    write_file(temp_dir.path() / "take.m4a", "x");

    CHECK_THROWS_AS(vault.store((temp_dir.path() / "take.m4a").string(), 4),
                    FileSystemError);
}

// ============================================================================
// remove / lookup
// ============================================================================

TEST_CASE("vault: remove deletes the directory", "[vault]") {
    temp_directory temp_dir;
    FileVault vault(VaultLocations{"", temp_dir.path().string()});
    write_file(temp_dir.path() / "take.m4a", "x");
    vault.store((temp_dir.path() / "take.m4a").string(), 5);

    CHECK(vault.remove(5));
    CHECK_FALSE(fs::exists(vault.directory_for(5)));
    CHECK_FALSE(vault.remove(5));
    CHECK_FALSE(vault.recording_path(5).has_value());
}

TEST_CASE("vault: partial copies are not reported as recordings", "[vault]") {
    temp_directory temp_dir;
    FileVault vault(VaultLocations{"", temp_dir.path().string()});

    write_file(vault.directory_for(9) / "recording.m4a.partial", "half");

    CHECK_FALSE(vault.recording_path(9).has_value());
}

TEST_CASE("vault: stored_ids lists numeric recording directories", "[vault]") {
    temp_directory temp_dir;
    FileVault vault(VaultLocations{"", temp_dir.path().string()});

    fs::create_directories(vault.directory_for(2));
    fs::create_directories(vault.directory_for(11));
    fs::create_directories(vault.base_directory() / "recording_abc");
    fs::create_directories(vault.base_directory() / "other");
    write_file(vault.base_directory() / "recording_12", "file, not dir");

    auto ids = vault.stored_ids();
    std::sort(ids.begin(), ids.end());
    CHECK(ids == std::vector<int64_t>{2, 11});
}
