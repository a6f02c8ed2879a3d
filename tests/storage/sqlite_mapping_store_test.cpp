/**
 * @file sqlite_mapping_store_test.cpp
 * @brief Unit tests for the encrypted SQLite mapping store
 */

#include <catch2/catch_test_macros.hpp>

#include "piiguard/storage/sqlite_mapping_store.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

using namespace piiguard::storage;
using piiguard::anonymization::placeholder_mapping;
using piiguard::security::cipher_options;
using piiguard::security::mapping_cipher;
namespace error_codes = piiguard::error_codes;

namespace {

const std::string test_secret = "store-test-secret-0123456789";

auto make_cipher(const std::string& secret = test_secret) -> mapping_cipher {
    cipher_options options;
    options.kdf_iterations = mapping_cipher::min_kdf_iterations;
    auto cipher = mapping_cipher::create(secret, options);
    REQUIRE(cipher.is_ok());
    return cipher.value();
}

auto open_store(const std::string& path = ":memory:",
                const std::string& secret = test_secret)
    -> std::unique_ptr<sqlite_mapping_store> {
    auto store = sqlite_mapping_store::open(path, make_cipher(secret));
    REQUIRE(store.is_ok());
    return std::move(store.value());
}

auto make_mapping(std::initializer_list<std::pair<const char*, const char*>> entries)
    -> placeholder_mapping {
    placeholder_mapping mapping;
    for (const auto& [label, value] : entries) {
        REQUIRE(mapping.add(label, value).is_ok());
    }
    return mapping;
}

/// Temporary database file removed on scope exit
class temp_database {
public:
    temp_database() {
        path_ = std::filesystem::temp_directory_path() /
                ("piiguard_store_test_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) +
                 ".db");
    }

    ~temp_database() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        std::filesystem::remove(path_.string() + "-wal", ec);
        std::filesystem::remove(path_.string() + "-shm", ec);
    }

    [[nodiscard]] auto path() const -> std::string { return path_.string(); }

private:
    std::filesystem::path path_;
};

} // namespace

TEST_CASE("SqliteMappingStore: Basic Operations", "[storage][mapping]") {
    auto store = open_store();
    const auto mapping = make_mapping({{"name_1", "John Smith"}, {"email_1", "a@b.com"}});

    SECTION("Opened store is empty") {
        REQUIRE(store->path() == ":memory:");
        auto keys = store->keys();
        REQUIRE(keys.is_ok());
        REQUIRE(keys.value().empty());
    }

    SECTION("save then load") {
        REQUIRE(store->save("doc-1", mapping).is_ok());

        auto loaded = store->load("doc-1");
        REQUIRE(loaded.is_ok());
        REQUIRE(loaded.value() == mapping);

        auto exists = store->contains("doc-1");
        REQUIRE(exists.is_ok());
        REQUIRE(exists.value());
    }

    SECTION("Missing key") {
        auto loaded = store->load("missing");
        REQUIRE(loaded.is_err());
        REQUIRE(loaded.error().code == error_codes::mapping_not_found);

        auto exists = store->contains("missing");
        REQUIRE(exists.is_ok());
        REQUIRE_FALSE(exists.value());
    }

    SECTION("save replaces the existing record") {
        REQUIRE(store->save("doc-1", mapping).is_ok());
        const auto replacement = make_mapping({{"name_1", "Jane Doe"}});
        REQUIRE(store->save("doc-1", replacement).is_ok());

        auto loaded = store->load("doc-1");
        REQUIRE(loaded.is_ok());
        REQUIRE(loaded.value() == replacement);
    }

    SECTION("keys are listed in order") {
        REQUIRE(store->save("b", mapping).is_ok());
        REQUIRE(store->save("a", mapping).is_ok());
        auto keys = store->keys();
        REQUIRE(keys.is_ok());
        REQUIRE(keys.value() == std::vector<std::string>{"a", "b"});
    }

    SECTION("remove") {
        REQUIRE(store->save("doc-1", mapping).is_ok());
        auto removed = store->remove("doc-1");
        REQUIRE(removed.is_ok());
        REQUIRE(removed.value());

        auto again = store->remove("doc-1");
        REQUIRE(again.is_ok());
        REQUIRE_FALSE(again.value());
    }

    SECTION("clear reports the number of records") {
        REQUIRE(store->save("a", mapping).is_ok());
        REQUIRE(store->save("b", mapping).is_ok());
        REQUIRE(store->save("c", mapping).is_ok());

        auto cleared = store->clear();
        REQUIRE(cleared.is_ok());
        REQUIRE(cleared.value() == 3);
        REQUIRE(store->keys().value().empty());
    }
}

TEST_CASE("SqliteMappingStore: Merge", "[storage][mapping]") {
    auto store = open_store();

    SECTION("Merge into a new key creates the record") {
        auto added = store->merge("doc-1", make_mapping({{"name_1", "John Smith"}}));
        REQUIRE(added.is_ok());
        REQUIRE(added.value() == 1);
        REQUIRE(store->load("doc-1").value().size() == 1);
    }

    SECTION("Merge keeps stored values") {
        REQUIRE(store->save("doc-1", make_mapping({{"name_1", "John Smith"}})).is_ok());

        auto added = store->merge(
            "doc-1", make_mapping({{"name_1", "Jane Doe"}, {"email_1", "jane@example.com"}}));
        REQUIRE(added.is_ok());
        REQUIRE(added.value() == 1);

        auto loaded = store->load("doc-1");
        REQUIRE(loaded.is_ok());
        REQUIRE(loaded.value().size() == 2);
        REQUIRE(loaded.value().find("name_1") == "John Smith");
        REQUIRE(loaded.value().find("email_1") == "jane@example.com");
    }
}

TEST_CASE("SqliteMappingStore: Key Validation", "[storage][mapping]") {
    auto store = open_store();
    const auto mapping = make_mapping({{"name_1", "John Smith"}});
    const std::string long_key(max_store_key_length + 1, 'k');

    REQUIRE(store->save("", mapping).error().code == error_codes::invalid_storage_key);
    REQUIRE(store->save(long_key, mapping).error().code == error_codes::invalid_storage_key);
    REQUIRE(store->load("").error().code == error_codes::invalid_storage_key);
    REQUIRE(store->merge("", mapping).error().code == error_codes::invalid_storage_key);
    REQUIRE(store->remove(long_key).error().code == error_codes::invalid_storage_key);
    REQUIRE(store->contains("").error().code == error_codes::invalid_storage_key);

    const std::string longest(max_store_key_length, 'k');
    REQUIRE(store->save(longest, mapping).is_ok());
}

TEST_CASE("SqliteMappingStore: Record Integrity", "[storage][mapping]") {
    auto store = open_store();
    REQUIRE(store->save("doc-1", make_mapping({{"name_1", "John Smith"}})).is_ok());

    SECTION("Export and import round trip") {
        auto record = store->export_record("doc-1");
        REQUIRE(record.is_ok());

        auto other = open_store();
        REQUIRE(other->import_record("doc-1", record.value()).is_ok());
        auto loaded = other->load("doc-1");
        REQUIRE(loaded.is_ok());
        REQUIRE(loaded.value().find("name_1") == "John Smith");
    }

    SECTION("Tampered record is reported as corrupt") {
        auto record = store->export_record("doc-1");
        REQUIRE(record.is_ok());
        auto tampered = record.value();
        tampered[mapping_cipher::header_size] ^= 0x01;
        REQUIRE(store->import_record("doc-1", tampered).is_ok());

        auto loaded = store->load("doc-1");
        REQUIRE(loaded.is_err());
        REQUIRE(loaded.error().code == error_codes::mapping_corrupt);
    }

    SECTION("Record moved to another key is reported as corrupt") {
        auto record = store->export_record("doc-1");
        REQUIRE(record.is_ok());
        REQUIRE(store->import_record("doc-2", record.value()).is_ok());

        auto loaded = store->load("doc-2");
        REQUIRE(loaded.is_err());
        REQUIRE(loaded.error().code == error_codes::mapping_corrupt);
    }

    SECTION("Merge refuses to overwrite a corrupt record") {
        auto record = store->export_record("doc-1");
        REQUIRE(record.is_ok());
        auto tampered = record.value();
        tampered.back() ^= 0x01;
        REQUIRE(store->import_record("doc-1", tampered).is_ok());

        auto merged = store->merge("doc-1", make_mapping({{"email_1", "a@b.com"}}));
        REQUIRE(merged.is_err());
        REQUIRE(merged.error().code == error_codes::mapping_corrupt);
    }

    SECTION("Truncated import is rejected") {
        piiguard::security::sealed_record truncated(mapping_cipher::header_size, 0);
        auto imported = store->import_record("doc-1", truncated);
        REQUIRE(imported.is_err());
        REQUIRE(imported.error().code == error_codes::mapping_corrupt);
    }

    SECTION("Exporting a missing key") {
        auto record = store->export_record("missing");
        REQUIRE(record.is_err());
        REQUIRE(record.error().code == error_codes::mapping_not_found);
    }
}

TEST_CASE("SqliteMappingStore: Persistence", "[storage][mapping]") {
    temp_database database;
    const auto mapping = make_mapping({{"name_1", "John Smith"}});

    {
        auto store = open_store(database.path());
        REQUIRE(store->save("doc-1", mapping).is_ok());
    }

    SECTION("Reopened with the same secret") {
        auto store = open_store(database.path());
        auto loaded = store->load("doc-1");
        REQUIRE(loaded.is_ok());
        REQUIRE(loaded.value() == mapping);
    }

    SECTION("Reopened with a different secret") {
        auto store = open_store(database.path(), "another-secret-0123456789");
        auto loaded = store->load("doc-1");
        REQUIRE(loaded.is_err());
        REQUIRE(loaded.error().code == error_codes::mapping_corrupt);
    }
}

TEST_CASE("SqliteMappingStore: Secret Rotation", "[storage][mapping]") {
    auto store = open_store();
    const auto mapping = make_mapping({{"name_1", "John Smith"}});
    REQUIRE(store->save("a", mapping).is_ok());
    REQUIRE(store->save("b", mapping).is_ok());

    SECTION("Rotation discards records sealed with the old secret") {
        auto rotated = store->rotate_secret("rotated-secret-0123456789");
        REQUIRE(rotated.is_ok());
        REQUIRE(rotated.value() == 2);
        REQUIRE(store->keys().value().empty());

        REQUIRE(store->save("c", mapping).is_ok());
        REQUIRE(store->load("c").is_ok());
    }

    SECTION("Invalid new secret leaves the store untouched") {
        auto rotated = store->rotate_secret("short");
        REQUIRE(rotated.is_err());
        REQUIRE(rotated.error().code == error_codes::invalid_secret);
        REQUIRE(store->keys().value().size() == 2);
        REQUIRE(store->load("a").is_ok());
    }
}

TEST_CASE("SqliteMappingStore: Concurrent Access", "[storage][mapping][concurrency]") {
    auto store = open_store();
    constexpr int thread_count = 8;
    constexpr int entries_per_thread = 5;

    SECTION("Merges into one key are serialized") {
        std::vector<std::thread> threads;
        std::atomic<int> failures{0};
        for (int t = 0; t < thread_count; ++t) {
            threads.emplace_back([&, t]() {
                for (int i = 0; i < entries_per_thread; ++i) {
                    placeholder_mapping entry;
                    (void)entry.add("name_" + std::to_string(t * entries_per_thread + i + 1),
                                    "value");
                    if (store->merge("shared", entry).is_err()) {
                        ++failures;
                    }
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        REQUIRE(failures == 0);
        auto loaded = store->load("shared");
        REQUIRE(loaded.is_ok());
        REQUIRE(loaded.value().size() == thread_count * entries_per_thread);
    }

    SECTION("Independent keys") {
        std::vector<std::thread> threads;
        std::atomic<int> failures{0};
        for (int t = 0; t < thread_count; ++t) {
            threads.emplace_back([&, t]() {
                const auto key = "doc-" + std::to_string(t);
                placeholder_mapping mapping;
                (void)mapping.add("name_1", "value " + std::to_string(t));
                if (store->save(key, mapping).is_err() || store->load(key).is_err()) {
                    ++failures;
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        REQUIRE(failures == 0);
        REQUIRE(store->keys().value().size() == thread_count);
    }
}
