// Range resolution and transfer negotiation tests.

#include "test_harness.hpp"

#include "blobgate/storage/fingerprint.hpp"
#include "blobgate/transfer/byte_range.hpp"
#include "blobgate/transfer/negotiator.hpp"

using namespace blobgate;
using namespace blobgate::transfer;

static void test_resolve_range() {
    std::cout << "\n[resolve_range]" << std::endl;

    {
        TEST(absent_header_serves_whole_object);
        ASSERT_TRUE(resolve_range("", 100).status == RangeStatus::Absent, "empty");
        ASSERT_TRUE(resolve_range("   ", 100).status == RangeStatus::Absent, "blank");
        PASS();
    }

    {
        TEST(closed_range);
        auto r = resolve_range("bytes=10-19", 100);
        ASSERT_TRUE(r.status == RangeStatus::Satisfiable, "status");
        ASSERT_EQ(r.range.start, 10u, "start");
        ASSERT_EQ(r.range.end, 19u, "end");
        ASSERT_EQ(r.range.length(), 10u, "length");
        PASS();
    }

    {
        TEST(open_range_runs_to_end);
        auto r = resolve_range("bytes=4000-", 10000);
        ASSERT_TRUE(r.status == RangeStatus::Satisfiable, "status");
        ASSERT_EQ(r.range.start, 4000u, "start");
        ASSERT_EQ(r.range.end, 9999u, "end");
        PASS();
    }

    {
        TEST(explicit_end_past_object_is_unsatisfiable);
        ASSERT_TRUE(resolve_range("bytes=90-500", 100).status == RangeStatus::Unsatisfiable,
                    "end past object");
        ASSERT_TRUE(resolve_range("bytes=0-99999", 100).status == RangeStatus::Unsatisfiable,
                    "window larger than object");
        ASSERT_TRUE(resolve_range("bytes=0-100", 100).status == RangeStatus::Unsatisfiable,
                    "end equal to size");
        auto open = resolve_range("bytes=90-", 100);
        ASSERT_TRUE(open.status == RangeStatus::Satisfiable, "open form still runs to the end");
        ASSERT_EQ(open.range.end, 99u, "open end");
        PASS();
    }

    {
        TEST(suffix_range);
        auto r = resolve_range("bytes=-10", 100);
        ASSERT_TRUE(r.status == RangeStatus::Satisfiable, "status");
        ASSERT_EQ(r.range.start, 90u, "start");
        ASSERT_EQ(r.range.end, 99u, "end");
        auto whole = resolve_range("bytes=-1000", 100);
        ASSERT_EQ(whole.range.start, 0u, "suffix longer than object");
        ASSERT_TRUE(resolve_range("bytes=-0", 100).status == RangeStatus::Unsatisfiable,
                    "zero-length suffix");
        PASS();
    }

    {
        TEST(boundary_windows);
        auto full = resolve_range("bytes=0-99", 100);
        ASSERT_TRUE(full.status == RangeStatus::Satisfiable, "full window");
        auto last = resolve_range("bytes=99-99", 100);
        ASSERT_TRUE(last.status == RangeStatus::Satisfiable, "last byte");
        ASSERT_EQ(last.range.length(), 1u, "one byte");
        PASS();
    }

    {
        TEST(start_at_or_past_size_is_unsatisfiable);
        ASSERT_TRUE(resolve_range("bytes=100-", 100).status == RangeStatus::Unsatisfiable, "at size");
        ASSERT_TRUE(resolve_range("bytes=500-600", 100).status == RangeStatus::Unsatisfiable,
                    "past size");
        ASSERT_TRUE(resolve_range("bytes=0-", 0).status == RangeStatus::Unsatisfiable,
                    "empty object");
        PASS();
    }

    {
        TEST(malformed_headers);
        for (const char* bad : {"bytes=abc", "bytes=5-3", "items=0-1", "bytes=0-1,5-9",
                                "bytes=", "bytes=1-x", "bytes=--1"}) {
            auto r = resolve_range(bad, 100);
            ASSERT_TRUE(r.status == RangeStatus::Malformed, std::string("not malformed: ") + bad);
            ASSERT_NOT_EMPTY(r.error_message, "error message");
        }
        PASS();
    }

    {
        TEST(unit_is_case_insensitive);
        ASSERT_TRUE(resolve_range("Bytes=0-0", 10).status == RangeStatus::Satisfiable, "Bytes=");
        PASS();
    }
}

static void test_range_formatting() {
    std::cout << "\n[range headers]" << std::endl;

    {
        TEST(format_helpers);
        ASSERT_EQ(format_content_range({4000, 9999}, 10000), std::string("bytes 4000-9999/10000"),
                  "content-range");
        ASSERT_EQ(format_unsatisfied_range(100), std::string("bytes */100"), "unsatisfied");
        ASSERT_EQ(open_range_header(4000), std::string("bytes=4000-"), "open");
        ASSERT_EQ(closed_range_header(0, 9), std::string("bytes=0-9"), "closed");
        PASS();
    }

    {
        TEST(parse_content_range);
        auto cr = parse_content_range("bytes 4000-9999/10000");
        ASSERT_TRUE(cr.has_value(), "parsed");
        ASSERT_EQ(cr->range.start, 4000u, "start");
        ASSERT_EQ(cr->range.end, 9999u, "end");
        ASSERT_TRUE(cr->total && *cr->total == 10000u, "total");

        auto unknown = parse_content_range("bytes 0-9/*");
        ASSERT_TRUE(unknown && !unknown->total, "unknown total");

        ASSERT_TRUE(!parse_content_range("bytes */100"), "unsatisfied form has no window");
        ASSERT_TRUE(!parse_content_range("bytes 9-0/10"), "inverted");
        ASSERT_TRUE(!parse_content_range("items 0-1/2"), "unit");
        PASS();
    }
}

static void test_same_content() {
    std::cout << "\n[same_content]" << std::endl;

    {
        TEST(size_and_fingerprint_must_both_match);
        ASSERT_TRUE(same_content(10, "abc", 10, "abc"), "match");
        ASSERT_TRUE(!same_content(10, "abc", 11, "abc"), "size differs");
        ASSERT_TRUE(!same_content(10, "abc", 10, "abd"), "fingerprint differs");
        ASSERT_TRUE(!same_content(10, "", 10, ""), "missing fingerprints prove nothing");
        PASS();
    }
}

static void test_plan_upload() {
    std::cout << "\n[plan_upload]" << std::endl;
    auto tmpdir = make_temp_dir("blobgate-neg");
    auto file = tmpdir / "local.bin";
    auto payload = make_payload(5000, 7);
    write_file(file, payload);
    auto fp = fingerprint_bytes(to_bytes(payload));

    {
        TEST(no_remote_means_upload);
        auto plan = plan_upload(file, std::nullopt);
        ASSERT_TRUE(!plan.skip, "should upload");
        ASSERT_EQ(plan.local_size, 5000u, "size");
        ASSERT_EQ(plan.local_fingerprint, fp, "fingerprint computed");
        PASS();
    }

    {
        TEST(identical_remote_is_skipped);
        auto plan = plan_upload(file, RemoteObject{5000, fp, "application/octet-stream"});
        ASSERT_TRUE(plan.skip, "should skip");
        PASS();
    }

    {
        TEST(same_size_different_content_uploads);
        auto plan = plan_upload(file, RemoteObject{5000, std::string(32, '0'), ""});
        ASSERT_TRUE(!plan.skip, "should upload");
        ASSERT_EQ(plan.reason, std::string("fingerprint differs"), "reason");
        PASS();
    }

    {
        TEST(unreadable_local_file);
        auto plan = plan_upload(tmpdir / "missing.bin", std::nullopt);
        ASSERT_TRUE(!plan.local_readable, "unreadable");
        ASSERT_TRUE(!plan.skip, "not skipped");
        PASS();
    }

    fs::remove_all(tmpdir);
}

static void test_plan_download() {
    std::cout << "\n[plan_download]" << std::endl;
    auto tmpdir = make_temp_dir("blobgate-neg");
    auto payload = make_payload(10000, 11);
    RemoteObject remote{10000, fingerprint_bytes(to_bytes(payload)), ""};

    {
        TEST(missing_local_file_is_fresh);
        auto plan = plan_download(tmpdir / "none.bin", remote);
        ASSERT_TRUE(plan.action == DownloadAction::Fresh, "fresh");
        ASSERT_EQ(plan.offset, 0u, "offset");
        PASS();
    }

    {
        TEST(shorter_local_file_resumes);
        auto file = tmpdir / "partial.bin";
        write_file(file, payload.substr(0, 4000));
        auto plan = plan_download(file, remote);
        ASSERT_TRUE(plan.action == DownloadAction::Resume, "resume");
        ASSERT_EQ(plan.offset, 4000u, "offset");
        ASSERT_EQ(std::string(download_action_name(plan.action)), std::string("resume"), "name");
        PASS();
    }

    {
        TEST(longer_local_file_restarts);
        auto file = tmpdir / "long.bin";
        write_file(file, payload + "extra");
        ASSERT_TRUE(plan_download(file, remote).action == DownloadAction::Restart, "restart");
        PASS();
    }

    {
        TEST(equal_size_different_content_restarts);
        auto file = tmpdir / "other.bin";
        write_file(file, make_payload(10000, 12));
        ASSERT_TRUE(plan_download(file, remote).action == DownloadAction::Restart, "restart");
        PASS();
    }

    {
        TEST(identical_local_file_is_skipped);
        auto file = tmpdir / "same.bin";
        write_file(file, payload);
        ASSERT_TRUE(plan_download(file, remote).action == DownloadAction::Skip, "skip");
        PASS();
    }

    {
        TEST(empty_remote_and_empty_local_skip);
        auto file = tmpdir / "empty.bin";
        write_file(file, "");
        RemoteObject empty{0, fingerprint_bytes(std::vector<uint8_t>{}), ""};
        ASSERT_TRUE(plan_download(file, empty).action == DownloadAction::Skip, "skip");
        ASSERT_TRUE(plan_download(file, remote).action == DownloadAction::Fresh, "fresh");
        PASS();
    }

    fs::remove_all(tmpdir);
}

static void test_etag_helpers() {
    std::cout << "\n[etags]" << std::endl;

    {
        TEST(unquote_etag);
        ASSERT_EQ(unquote_etag("\"abc\""), std::string("abc"), "quoted");
        ASSERT_EQ(unquote_etag("W/\"abc\""), std::string("abc"), "weak");
        ASSERT_EQ(unquote_etag("abc"), std::string("abc"), "bare");
        PASS();
    }

    {
        TEST(incremental_fingerprint_matches_one_shot);
        auto payload = make_payload(300000, 5);
        Fingerprinter fp;
        fp.update(payload.data(), 1000);
        fp.update(payload.data() + 1000, payload.size() - 1000);
        ASSERT_EQ(fp.bytes_hashed(), 300000u, "bytes hashed");
        ASSERT_EQ(fp.finish(), fingerprint_bytes(to_bytes(payload)), "digest");
        ASSERT_EQ(fingerprint_bytes(to_bytes("hello")),
                  std::string("5d41402abc4b2a76b9719d911017c592"), "md5 of hello");
        PASS();
    }
}

int main() {
    std::cout << "blobgate negotiation tests" << std::endl;
    std::cout << "==========================" << std::endl;

    test_resolve_range();
    test_range_formatting();
    test_same_content();
    test_plan_upload();
    test_plan_download();
    test_etag_helpers();

    return print_results("negotiation");
}
