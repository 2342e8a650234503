// Content store tests.
//
// Tests:
//   1. Put/get round trip and fingerprints
//   2. Range reads at the object boundaries
//   3. Idempotent delete
//   4. Listing: prefix, delimiter rollup, pagination, bucket isolation
//   5. Buckets: create, delete (recursive), implicit creation
//   6. Name rules and content type guessing
//   7. Concurrent same-key writers never produce a torn (body, metadata) pair
//   8. Reconciliation of orphan bodies and dangling records
//   9. Persistence across reopen
//  10. Delimited pagination never repeats a rolled-up prefix
//  11. A failed metadata commit leaves the previous object intact
//  12. delete_bucket racing writers never resurrects deleted objects
//  13. Concurrent create_bucket reports exactly one creator
//  14. Lookups of many missing buckets share a fixed set of locks

#include "test_harness.hpp"

#include "blobgate/core/log.hpp"
#include "blobgate/storage/content_store.hpp"
#include "blobgate/storage/fingerprint.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <atomic>
#include <map>
#include <set>
#include <mutex>

using namespace blobgate;

namespace {

std::string code(ErrorCode c) {
    return error_code_name(c);
}

std::vector<fs::path> body_files(const fs::path& data_dir, const std::string& bucket) {
    std::vector<fs::path> files;
    auto dir = data_dir / "objects" / bucket;
    if (!fs::exists(dir)) return files;
    for (const auto& entry : fs::recursive_directory_iterator(dir)) {
        if (entry.is_regular_file()) files.push_back(entry.path());
    }
    return files;
}

}  // namespace

static void test_round_trip() {
    std::cout << "\n[round trip]" << std::endl;
    auto tmpdir = make_temp_dir("blobgate-store");
    auto store = ContentStoreFactory::create_local(tmpdir);

    {
        TEST(put_then_get_returns_same_bytes);
        auto payload = to_bytes(make_payload(70000, 3));
        auto put = store->put("photos", "2024/trip/img.bin", payload);
        ASSERT_TRUE(put.success, "put failed: " + put.error_message);
        ASSERT_EQ(put.metadata.size, payload.size(), "metadata size");
        ASSERT_EQ(put.metadata.fingerprint, fingerprint_bytes(payload), "fingerprint");

        auto got = store->get("photos", "2024/trip/img.bin");
        ASSERT_TRUE(got.success, "get failed: " + got.error_message);
        ASSERT_TRUE(got.data == payload, "body differs");
        ASSERT_EQ(got.metadata.fingerprint, put.metadata.fingerprint, "get fingerprint");
        PASS();
    }

    {
        TEST(empty_object_round_trip);
        std::vector<uint8_t> empty;
        auto put = store->put("photos", "empty", empty);
        ASSERT_TRUE(put.success, "put failed: " + put.error_message);
        ASSERT_EQ(put.metadata.size, 0u, "size");
        ASSERT_EQ(put.metadata.fingerprint, std::string("d41d8cd98f00b204e9800998ecf8427e"),
                  "md5 of empty input");
        auto got = store->get("photos", "empty");
        ASSERT_TRUE(got.success && got.data.empty(), "empty get");
        PASS();
    }

    {
        TEST(head_reports_metadata_without_body);
        auto head = store->head("photos", "2024/trip/img.bin");
        ASSERT_TRUE(head.success, "head failed");
        ASSERT_EQ(head.metadata.size, 70000u, "head size");
        ASSERT_EQ(head.metadata.content_type, std::string("application/octet-stream"),
                  "default content type");
        PASS();
    }

    {
        TEST(missing_key_is_not_found);
        auto head = store->head("photos", "nope");
        ASSERT_TRUE(!head.success, "head should fail");
        ASSERT_EQ(code(head.error), std::string("NotFound"), "head error");
        auto got = store->get("nobucket", "nope");
        ASSERT_EQ(code(got.error), std::string("NotFound"), "get error");
        PASS();
    }

    {
        TEST(overwrite_keeps_created_and_replaces_body);
        auto first = store->put("docs", "readme.txt", to_bytes("first version"));
        ASSERT_TRUE(first.success, "first put");
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        auto second = store->put("docs", "readme.txt", to_bytes("second, longer version"));
        ASSERT_TRUE(second.success, "second put");
        ASSERT_TRUE(second.metadata.created == first.metadata.created, "created preserved");
        ASSERT_TRUE(second.metadata.last_modified >= first.metadata.last_modified,
                    "last-modified refreshed");
        auto got = store->get("docs", "readme.txt");
        ASSERT_EQ(to_string(got.data), std::string("second, longer version"), "new body");
        ASSERT_EQ(got.metadata.content_type, std::string("text/plain"), "guessed type");
        ASSERT_EQ(body_files(tmpdir, "docs").size(), 1u, "old generation unlinked");
        PASS();
    }

    {
        TEST(put_file_stores_local_file);
        auto src = tmpdir / "upload-src.json";
        write_file(src, "{\"a\": 1}");
        auto put = store->put_file("docs", "conf/settings.json", src);
        ASSERT_TRUE(put.success, "put_file failed: " + put.error_message);
        ASSERT_EQ(put.metadata.content_type, std::string("application/json"), "json type");
        ASSERT_EQ(put.metadata.fingerprint, *fingerprint_file(src), "file fingerprint");
        auto missing = store->put_file("docs", "x", tmpdir / "does-not-exist");
        ASSERT_TRUE(!missing.success, "missing source should fail");
        PASS();
    }

    {
        TEST(explicit_content_type_wins);
        auto put = store->put("docs", "page.html", to_bytes("<p/>"), "text/x-custom");
        ASSERT_TRUE(put.success, "put");
        ASSERT_EQ(store->head("docs", "page.html").metadata.content_type,
                  std::string("text/x-custom"), "stored type");
        PASS();
    }

    {
        TEST(open_reader_streams_body);
        auto opened = store->open("photos", "2024/trip/img.bin");
        ASSERT_TRUE(opened.success, "open failed");
        std::vector<uint8_t> chunk;
        ASSERT_TRUE(opened.reader->read(100, 50, chunk), "read");
        auto full = store->get("photos", "2024/trip/img.bin").data;
        ASSERT_TRUE(std::equal(chunk.begin(), chunk.end(), full.begin() + 100), "chunk bytes");
        ASSERT_EQ(chunk.size(), 50u, "chunk size");
        PASS();
    }

    store.reset();
    fs::remove_all(tmpdir);
}

static void test_ranges() {
    std::cout << "\n[ranges]" << std::endl;
    auto tmpdir = make_temp_dir("blobgate-store");
    auto store = ContentStoreFactory::create_local(tmpdir);
    auto payload = to_bytes(make_payload(1000, 9));
    store->put("b", "k", payload);
    const uint64_t n = payload.size();

    {
        TEST(full_window_equals_body);
        auto r = store->get_range("b", "k", 0, n - 1);
        ASSERT_TRUE(r.success, "range failed");
        ASSERT_TRUE(r.data == payload, "bytes differ");
        PASS();
    }

    {
        TEST(single_byte_window);
        auto r = store->get_range("b", "k", 500, 500);
        ASSERT_TRUE(r.success, "range failed");
        ASSERT_EQ(r.data.size(), 1u, "one byte");
        ASSERT_EQ(static_cast<int>(r.data[0]), static_cast<int>(payload[500]), "byte value");
        ASSERT_EQ(r.range_start, 500u, "start");
        ASSERT_EQ(r.range_end, 500u, "end");
        PASS();
    }

    {
        TEST(window_past_end_is_unsatisfiable);
        auto r = store->get_range("b", "k", n, n);
        ASSERT_TRUE(!r.success, "should fail");
        ASSERT_EQ(code(r.error), std::string("RangeNotSatisfiable"), "error");
        PASS();
    }

    {
        TEST(inverted_window_is_unsatisfiable);
        auto r = store->get_range("b", "k", 10, 5);
        ASSERT_EQ(code(r.error), std::string("RangeNotSatisfiable"), "error");
        PASS();
    }

    {
        TEST(range_on_missing_key_is_not_found);
        auto r = store->get_range("b", "missing", 0, 0);
        ASSERT_EQ(code(r.error), std::string("NotFound"), "error");
        PASS();
    }

    store.reset();
    fs::remove_all(tmpdir);
}

static void test_delete() {
    std::cout << "\n[delete]" << std::endl;
    auto tmpdir = make_temp_dir("blobgate-store");
    auto store = ContentStoreFactory::create_local(tmpdir);

    {
        TEST(delete_twice_reports_nothing_removed);
        store->put("b", "gone/soon.txt", to_bytes("bye"));
        auto first = store->remove("b", "gone/soon.txt");
        ASSERT_TRUE(first.success && first.removed, "first delete removes");
        auto second = store->remove("b", "gone/soon.txt");
        ASSERT_TRUE(second.success, "second delete is not an error");
        ASSERT_TRUE(!second.removed, "second delete removes nothing");
        ASSERT_EQ(code(store->head("b", "gone/soon.txt").error), std::string("NotFound"),
                  "object absent");
        ASSERT_TRUE(body_files(tmpdir, "b").empty(), "body unlinked");
        PASS();
    }

    {
        TEST(delete_in_unknown_bucket_is_not_an_error);
        auto r = store->remove("never-created", "x");
        ASSERT_TRUE(r.success && !r.removed, "idempotent");
        PASS();
    }

    store.reset();
    fs::remove_all(tmpdir);
}

static void test_listing() {
    std::cout << "\n[listing]" << std::endl;
    auto tmpdir = make_temp_dir("blobgate-store");
    auto store = ContentStoreFactory::create_local(tmpdir);

    for (const char* key : {"a/2.txt", "b/1.txt", "a/1.txt", "a/sub/3.txt", "ab.txt", "a/0.txt"}) {
        store->put("main", key, to_bytes(key));
    }
    store->put("other", "a/elsewhere.txt", to_bytes("x"));

    {
        TEST(prefix_filter_in_key_order);
        ListOptions opts;
        opts.prefix = "a/";
        auto r = store->list("main", opts);
        ASSERT_TRUE(r.success, "list failed");
        std::vector<std::string> keys;
        for (const auto& e : r.entries) keys.push_back(e.key);
        std::vector<std::string> expected = {"a/0.txt", "a/1.txt", "a/2.txt", "a/sub/3.txt"};
        ASSERT_TRUE(keys == expected, "keys in order, ab.txt and other bucket excluded");
        PASS();
    }

    {
        TEST(delimiter_rolls_up_common_prefixes);
        ListOptions opts;
        opts.delimiter = "/";
        auto r = store->list("main", opts);
        ASSERT_TRUE(r.success, "list failed");
        ASSERT_EQ(r.entries.size(), 1u, "only ab.txt at top level");
        ASSERT_EQ(r.entries[0].key, std::string("ab.txt"), "top-level key");
        std::vector<std::string> expected = {"a/", "b/"};
        ASSERT_TRUE(r.common_prefixes == expected, "common prefixes");
        PASS();
    }

    {
        TEST(delimiter_under_prefix);
        ListOptions opts;
        opts.prefix = "a/";
        opts.delimiter = "/";
        auto r = store->list("main", opts);
        ASSERT_EQ(r.entries.size(), 3u, "direct children");
        ASSERT_EQ(r.common_prefixes.size(), 1u, "one sub-directory");
        ASSERT_EQ(r.common_prefixes[0], std::string("a/sub/"), "sub prefix");
        PASS();
    }

    {
        TEST(max_keys_truncates_and_resumes);
        ListOptions opts;
        opts.max_keys = 4;
        auto page1 = store->list("main", opts);
        ASSERT_TRUE(page1.truncated, "first page truncated");
        ASSERT_EQ(page1.entries.size(), 4u, "page size");
        opts.start_after = page1.next_start_after;
        auto page2 = store->list("main", opts);
        ASSERT_TRUE(!page2.truncated, "second page complete");
        ASSERT_EQ(page1.entries.size() + page2.entries.size(), 6u, "all keys seen once");
        ASSERT_TRUE(page2.entries.front().key > page1.entries.back().key, "pages ordered");
        PASS();
    }

    {
        TEST(delimited_pages_do_not_repeat_prefixes);
        for (const char* key : {"a/1", "a/2", "a/3", "b"}) {
            store->put("paged", key, to_bytes(key));
        }
        ListOptions opts;
        opts.delimiter = "/";
        opts.max_keys = 1;
        std::vector<std::string> seen;
        int pages = 0;
        while (true) {
            auto r = store->list("paged", opts);
            ASSERT_TRUE(r.success, "list failed");
            ++pages;
            for (const auto& p : r.common_prefixes) seen.push_back("prefix:" + p);
            for (const auto& e : r.entries) seen.push_back("key:" + e.key);
            if (!r.truncated) break;
            ASSERT_TRUE(pages < 10, "pagination does not terminate");
            opts.start_after = r.next_start_after;
        }
        std::vector<std::string> expected = {"prefix:a/", "key:b"};
        ASSERT_TRUE(seen == expected, "each prefix and key exactly once");
        ASSERT_EQ(pages, 2, "one page per item");
        PASS();
    }

    {
        TEST(marker_ending_in_delimiter_skips_whole_prefix);
        ListOptions opts;
        opts.delimiter = "/";
        opts.start_after = "a/";
        auto r = store->list("paged", opts);
        ASSERT_TRUE(r.common_prefixes.empty(), "a/ already returned");
        ASSERT_EQ(r.entries.size(), 1u, "only b remains");
        ASSERT_EQ(r.entries[0].key, std::string("b"), "key");

        // A marker equal to the listing prefix is an ordinary marker
        opts.prefix = "a/";
        auto under = store->list("paged", opts);
        ASSERT_EQ(under.entries.size(), 3u, "keys under the prefix");
        PASS();
    }

    {
        TEST(unknown_bucket_listing_is_not_found);
        auto r = store->list("missing");
        ASSERT_EQ(code(r.error), std::string("NotFound"), "error");
        PASS();
    }

    store.reset();
    fs::remove_all(tmpdir);
}

static void test_buckets() {
    std::cout << "\n[buckets]" << std::endl;
    auto tmpdir = make_temp_dir("blobgate-store");
    auto store = ContentStoreFactory::create_local(tmpdir);

    {
        TEST(create_is_idempotent);
        auto first = store->create_bucket("alpha");
        ASSERT_TRUE(first.success && first.created, "created");
        auto again = store->create_bucket("alpha");
        ASSERT_TRUE(again.success && !again.created, "already exists");
        ASSERT_TRUE(store->bucket_info("alpha").has_value(), "bucket_info");
        PASS();
    }

    {
        TEST(racing_creators_see_one_creation);
        constexpr int kCreators = 8;
        std::atomic<int> created{0};
        std::atomic<int> failures{0};
        std::vector<std::thread> creators;
        for (int i = 0; i < kCreators; ++i) {
            creators.emplace_back([&]() {
                auto r = store->create_bucket("contested");
                if (!r.success) ++failures;
                else if (r.created) ++created;
            });
        }
        for (auto& t : creators) t.join();
        ASSERT_EQ(failures.load(), 0, "every creator succeeds");
        ASSERT_EQ(created.load(), 1, "exactly one creator");
        ASSERT_TRUE(store->delete_bucket("contested").removed, "cleanup");
        PASS();
    }

    {
        TEST(put_creates_bucket_implicitly);
        store->put("beta", "k", to_bytes("v"));
        auto buckets = store->list_buckets();
        ASSERT_TRUE(buckets.success, "list_buckets");
        ASSERT_EQ(buckets.buckets.size(), 2u, "two buckets");
        ASSERT_EQ(buckets.buckets[0].name, std::string("alpha"), "sorted");
        ASSERT_EQ(buckets.buckets[1].name, std::string("beta"), "sorted");
        PASS();
    }

    {
        TEST(delete_bucket_removes_everything);
        store->put("beta", "dir/a", to_bytes("1"));
        store->put("beta", "dir/b", to_bytes("2"));
        auto r = store->delete_bucket("beta");
        ASSERT_TRUE(r.success && r.removed, "deleted");
        ASSERT_TRUE(!store->bucket_info("beta"), "bucket gone");
        ASSERT_EQ(code(store->head("beta", "dir/a").error), std::string("NotFound"), "objects gone");
        ASSERT_TRUE(!fs::exists(tmpdir / "objects" / "beta"), "bodies gone");
        auto again = store->delete_bucket("beta");
        ASSERT_TRUE(again.success && !again.removed, "second delete removes nothing");
        PASS();
    }

    {
        TEST(stats_count_objects_and_bytes);
        store->put("alpha", "x", to_bytes("12345"));
        store->put("alpha", "y", to_bytes("123"));
        auto s = store->stats();
        ASSERT_EQ(s.buckets, 1u, "buckets");
        ASSERT_EQ(s.objects, 2u, "objects");
        ASSERT_EQ(s.bytes, 8u, "bytes");
        ASSERT_TRUE(store->is_healthy(), "healthy");
        PASS();
    }

    store.reset();
    fs::remove_all(tmpdir);
}

static void test_name_rules() {
    std::cout << "\n[name rules]" << std::endl;
    auto tmpdir = make_temp_dir("blobgate-store");
    auto store = ContentStoreFactory::create_local(tmpdir);

    {
        TEST(bucket_names);
        ASSERT_TRUE(is_valid_bucket_name("my-bucket.v2_x"), "valid");
        ASSERT_TRUE(!is_valid_bucket_name(""), "empty");
        ASSERT_TRUE(!is_valid_bucket_name(".."), "dot-dot");
        ASSERT_TRUE(!is_valid_bucket_name("a/b"), "slash");
        ASSERT_TRUE(!is_valid_bucket_name(std::string(256, 'a')), "too long");
        PASS();
    }

    {
        TEST(keys);
        ASSERT_TRUE(is_valid_key("a/b/c.txt"), "nested");
        ASSERT_TRUE(is_valid_key("spaces and ünïcode"), "utf-8");
        ASSERT_TRUE(!is_valid_key(""), "empty");
        ASSERT_TRUE(!is_valid_key("/abs"), "leading slash");
        ASSERT_TRUE(!is_valid_key("a/../b"), "dot-dot segment");
        ASSERT_TRUE(!is_valid_key(std::string("a\0b", 3)), "nul");
        ASSERT_TRUE(!is_valid_key(std::string(1025, 'k')), "too long");
        PASS();
    }

    {
        TEST(invalid_names_are_bad_requests);
        auto put = store->put("bad/bucket", "k", to_bytes("v"));
        ASSERT_EQ(code(put.error), std::string("BadRequest"), "bucket");
        put = store->put("ok", "../escape", to_bytes("v"));
        ASSERT_EQ(code(put.error), std::string("BadRequest"), "key");
        ASSERT_TRUE(!fs::exists(tmpdir.parent_path() / "escape"), "nothing written outside");
        PASS();
    }

    {
        TEST(prefix_key_and_nested_key_coexist);
        ASSERT_TRUE(store->put("ok", "dir", to_bytes("file")).success, "dir as object");
        ASSERT_TRUE(store->put("ok", "dir/child", to_bytes("nested")).success, "nested object");
        ASSERT_EQ(to_string(store->get("ok", "dir").data), std::string("file"), "dir body");
        ASSERT_EQ(to_string(store->get("ok", "dir/child").data), std::string("nested"),
                  "child body");
        PASS();
    }

    {
        TEST(content_type_guessing);
        ASSERT_EQ(guess_content_type("a/b.JSON"), std::string("application/json"), "upper ext");
        ASSERT_EQ(guess_content_type("page.html"), std::string("text/html"), "html");
        ASSERT_EQ(guess_content_type("noext"), std::string("application/octet-stream"), "none");
        PASS();
    }

    store.reset();
    fs::remove_all(tmpdir);
}

static void test_concurrent_writers() {
    std::cout << "\n[concurrency]" << std::endl;
    auto tmpdir = make_temp_dir("blobgate-store");
    auto store = ContentStoreFactory::create_local(tmpdir);
    store->put("c", "hot", to_bytes(make_payload(4096, 100)));

    {
        TEST(same_key_writers_never_tear);
        constexpr int kWriters = 8;
        constexpr int kRounds = 15;
        std::atomic<bool> done{false};
        std::atomic<int> torn{0};
        std::atomic<int> write_failures{0};

        std::thread reader([&]() {
            while (!done) {
                auto got = store->get("c", "hot");
                if (got.success && fingerprint_bytes(got.data) != got.metadata.fingerprint) {
                    ++torn;
                }
                if (got.success && got.data.size() != got.metadata.size) ++torn;
            }
        });

        std::vector<std::thread> writers;
        for (int w = 0; w < kWriters; ++w) {
            writers.emplace_back([&, w]() {
                for (int i = 0; i < kRounds; ++i) {
                    auto payload = to_bytes(make_payload(2048 + w * 512 + i, w * 100 + i));
                    if (!store->put("c", "hot", payload).success) ++write_failures;
                }
            });
        }
        for (auto& t : writers) t.join();
        done = true;
        reader.join();

        ASSERT_EQ(write_failures.load(), 0, "all writes succeed");
        ASSERT_EQ(torn.load(), 0, "reader saw a torn pair");
        auto final_get = store->get("c", "hot");
        ASSERT_EQ(fingerprint_bytes(final_get.data), final_get.metadata.fingerprint,
                  "final pair consistent");
        ASSERT_EQ(body_files(tmpdir, "c").size(), 1u, "one live generation");
        PASS();
    }

    {
        TEST(different_keys_in_parallel);
        std::vector<std::thread> writers;
        std::atomic<int> failures{0};
        for (int w = 0; w < 8; ++w) {
            writers.emplace_back([&, w]() {
                for (int i = 0; i < 10; ++i) {
                    auto key = "w" + std::to_string(w) + "/" + std::to_string(i);
                    if (!store->put("p", key, to_bytes(key)).success) ++failures;
                }
            });
        }
        for (auto& t : writers) t.join();
        ASSERT_EQ(failures.load(), 0, "writes");
        ASSERT_EQ(store->list("p").entries.size(), 80u, "all keys present");
        PASS();
    }

    store.reset();
    fs::remove_all(tmpdir);
}

static void test_reconcile_and_reopen() {
    std::cout << "\n[reconcile]" << std::endl;
    auto tmpdir = make_temp_dir("blobgate-store");

    {
        TEST(reconcile_removes_orphans_and_dangling_records);
        auto store = ContentStoreFactory::create_local(tmpdir);
        store->put("r", "keep", to_bytes("kept"));
        store->put("r", "lost", to_bytes("body will vanish"));

        // Orphan: a body file no record points at
        write_file(tmpdir / "objects" / "r" / "ff" / "orphan.1", "stray");

        // Dangling: remove the body behind "lost"
        auto opened = store->open("r", "lost");
        ASSERT_TRUE(opened.success, "open lost");
        auto lost_fp = opened.reader->metadata().fingerprint;
        opened.reader.reset();
        bool removed_body = false;
        for (const auto& f : body_files(tmpdir, "r")) {
            if (f.filename() == "orphan.1") continue;
            if (fingerprint_file(f).value_or("") == lost_fp) {
                fs::remove(f);
                removed_body = true;
            }
        }
        ASSERT_TRUE(removed_body, "found the body to remove");

        auto report = store->reconcile();
        ASSERT_EQ(report.orphaned_bodies_removed, 1u, "orphans");
        ASSERT_EQ(report.dangling_records_removed, 1u, "dangling");
        ASSERT_EQ(code(store->head("r", "lost").error), std::string("NotFound"), "lost is absent");
        ASSERT_EQ(to_string(store->get("r", "keep").data), std::string("kept"), "keep intact");

        auto again = store->reconcile();
        ASSERT_EQ(again.orphaned_bodies_removed + again.dangling_records_removed, 0u,
                  "second sweep is clean");
        PASS();
    }

    {
        TEST(objects_survive_reopen);
        auto store = ContentStoreFactory::create_local(tmpdir);
        auto got = store->get("r", "keep");
        ASSERT_TRUE(got.success, "get after reopen");
        ASSERT_EQ(to_string(got.data), std::string("kept"), "body");
        PASS();
    }

    fs::remove_all(tmpdir);
}

static void test_commit_failure() {
    std::cout << "\n[commit failure]" << std::endl;
    auto tmpdir = make_temp_dir("blobgate-store");
    auto store = ContentStoreFactory::create_local(tmpdir);

    auto original = to_bytes(make_payload(3000, 7));
    auto first = store->put("m", "k", original);

    // A second connection to the manifest makes every write of "k" abort
    sqlite3* db = nullptr;
    sqlite3_open((tmpdir / "manifest.db").c_str(), &db);
    auto exec = [&](const char* sql) {
        char* msg = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &msg);
        if (msg) sqlite3_free(msg);
        return rc == SQLITE_OK;
    };

    {
        TEST(metadata_failure_keeps_previous_object);
        ASSERT_TRUE(first.success, "initial put");
        ASSERT_TRUE(exec("CREATE TRIGGER reject_update BEFORE UPDATE ON objects "
                         "WHEN NEW.key = 'k' BEGIN SELECT RAISE(ABORT, 'rejected'); END"),
                    "update trigger");
        ASSERT_TRUE(exec("CREATE TRIGGER reject_insert BEFORE INSERT ON objects "
                         "WHEN NEW.key = 'k' BEGIN SELECT RAISE(ABORT, 'rejected'); END"),
                    "insert trigger");

        auto replacement = to_bytes(make_payload(5000, 8));
        auto put = store->put("m", "k", replacement);
        ASSERT_TRUE(!put.success, "put must fail");
        ASSERT_EQ(code(put.error), std::string("StorageIO"), "error code");

        auto head = store->head("m", "k");
        ASSERT_TRUE(head.success, "head after failure");
        ASSERT_EQ(head.metadata.fingerprint, first.metadata.fingerprint, "old fingerprint");
        ASSERT_EQ(head.metadata.size, original.size(), "old size");

        auto got = store->get("m", "k");
        ASSERT_TRUE(got.success, "get after failure");
        ASSERT_TRUE(got.data == original, "old body served");

        ASSERT_EQ(body_files(tmpdir, "m").size(), 1u, "new body removed");
        ASSERT_TRUE(fs::is_empty(tmpdir / "staging"), "staging empty");
        PASS();
    }

    {
        TEST(writes_resume_once_manifest_accepts_them);
        ASSERT_TRUE(exec("DROP TRIGGER reject_update"), "drop update trigger");
        ASSERT_TRUE(exec("DROP TRIGGER reject_insert"), "drop insert trigger");
        auto replacement = to_bytes("replacement");
        auto put = store->put("m", "k", replacement);
        ASSERT_TRUE(put.success, "put after recovery: " + put.error_message);
        ASSERT_EQ(to_string(store->get("m", "k").data), std::string("replacement"), "new body");
        ASSERT_EQ(body_files(tmpdir, "m").size(), 1u, "old body removed");
        PASS();
    }

    sqlite3_close(db);
    store.reset();
    fs::remove_all(tmpdir);
}

static void test_bucket_delete_races() {
    std::cout << "\n[bucket delete races]" << std::endl;
    auto tmpdir = make_temp_dir("blobgate-store");
    auto store = ContentStoreFactory::create_local(tmpdir);

    {
        TEST(deleted_objects_never_come_back);
        constexpr int kWriters = 4;
        constexpr int kKeys = 50;

        // Tickets order put completions against the deletion
        std::atomic<int> ticket{0};
        std::mutex mu;
        std::map<std::string, std::pair<int, int>> tickets;  // key -> (started, finished)
        std::atomic<int> failures{0};
        std::atomic<int> finished{0};

        std::vector<std::thread> writers;
        for (int w = 0; w < kWriters; ++w) {
            writers.emplace_back([&, w]() {
                for (int i = 0; i < kKeys; ++i) {
                    auto key = "w" + std::to_string(w) + "/" + std::to_string(i);
                    int started = ticket.fetch_add(1);
                    if (!store->put("doomed", key, to_bytes(make_payload(512, w * 100 + i))).success) {
                        ++failures;
                    }
                    int done = ticket.fetch_add(1);
                    std::lock_guard<std::mutex> lock(mu);
                    tickets[key] = {started, done};
                    ++finished;
                }
            });
        }

        bool progressed = wait_for([&]() { return finished.load() >= 40; });
        int before = ticket.fetch_add(1);
        auto del = store->delete_bucket("doomed");
        int after = ticket.fetch_add(1);
        for (auto& t : writers) t.join();

        ASSERT_TRUE(progressed, "writers progressing");
        ASSERT_TRUE(del.success && del.removed, "bucket deleted");
        ASSERT_EQ(failures.load(), 0, "writes succeed around the delete");

        // Absent only if every write finished before the delete
        auto listed = store->list("doomed");
        ASSERT_TRUE(listed.success || listed.error == ErrorCode::NotFound, "list after delete");
        std::set<std::string> present;
        for (const auto& e : listed.entries) {
            present.insert(e.key);
            ASSERT_TRUE(tickets[e.key].second > before,
                        "object finished before the delete survived: " + e.key);
            auto got = store->get("doomed", e.key);
            ASSERT_TRUE(got.success, "listed key readable: " + e.key);
            ASSERT_EQ(fingerprint_bytes(got.data), got.metadata.fingerprint, "consistent pair");
        }
        for (const auto& [key, t] : tickets) {
            if (t.first > after) {
                ASSERT_TRUE(present.count(key) == 1, "write after the delete was lost: " + key);
            }
        }
        ASSERT_EQ(body_files(tmpdir, "doomed").size(), listed.entries.size(),
                  "one body per listed object");
        PASS();
    }

    {
        TEST(many_missing_buckets_stay_cheap);
        auto buckets_before = store->stats().buckets;
        for (int i = 0; i < 5000; ++i) {
            auto name = "ghost-" + std::to_string(i);
            if (i % 2 == 0) {
                ASSERT_EQ(code(store->head(name, "k").error), std::string("NotFound"), "head");
            } else {
                auto r = store->delete_bucket(name);
                ASSERT_TRUE(r.success && !r.removed, "nothing to delete");
            }
        }
        ASSERT_EQ(store->stats().buckets, buckets_before, "lookups create nothing");
        PASS();
    }

    {
        TEST(buckets_sharing_a_lock_do_not_deadlock);
        // More buckets than lock stripes, so unrelated buckets collide
        constexpr int kThreads = 8;
        constexpr int kBuckets = 24;
        std::atomic<int> failures{0};
        std::vector<std::thread> threads;
        for (int t = 0; t < kThreads; ++t) {
            threads.emplace_back([&, t]() {
                for (int b = 0; b < kBuckets; ++b) {
                    auto bucket = "shared-" + std::to_string(t) + "-" + std::to_string(b);
                    if (!store->put(bucket, "k", to_bytes(bucket)).success) ++failures;
                    if (!store->list(bucket).success) ++failures;
                    if (b % 3 == 0 && !store->delete_bucket(bucket).success) ++failures;
                }
            });
        }
        for (auto& t : threads) t.join();
        ASSERT_EQ(failures.load(), 0, "operations succeed");
        auto got = store->get("shared-0-1", "k");
        ASSERT_EQ(to_string(got.data), std::string("shared-0-1"), "store still serves");
        ASSERT_TRUE(!store->bucket_info("shared-0-0"), "deleted bucket gone");
        PASS();
    }

    store.reset();
    fs::remove_all(tmpdir);
}

int main() {
    std::cout << "blobgate content store tests" << std::endl;
    std::cout << "============================" << std::endl;

    test_round_trip();
    test_ranges();
    test_delete();
    test_listing();
    test_buckets();
    test_name_rules();
    test_concurrent_writers();
    test_reconcile_and_reopen();
    test_commit_failure();
    test_bucket_delete_races();

    return print_results("content store");
}
