/**
 * test_transfer_manager.cpp
 *
 * Unit tests for TransferManager against the local object store: idempotent
 * single uploads, content-type resolution, multipart splitting around the
 * threshold and abort-on-failure.
 */

#include "core/storage/LocalFSBackend.hpp"
#include "core/storage/TransferManager.hpp"
#include "test_support.hpp"

#include <chrono>

using namespace potlog;

static const std::string kPng = std::string("\x89PNG\r\n\x1a\n\0\0\0\rIHDR", 16) + random_bytes(200, 3);

// Small threshold and part size so multipart paths run on tiny files.
static TransferConfig small_parts() {
    TransferConfig cfg;
    cfg.multipart_threshold = 1000;
    cfg.part_size = 300;
    return cfg;
}

static std::string object_bytes(LocalFSBackend& store, const std::string& bucket, const std::string& key) {
    TempDir dir;
    const auto path = dir.path() / "download";
    std::FILE* f = std::fopen(path.string().c_str(), "w+b");
    store.getObject(bucket, key, f);
    std::fclose(f);
    return read_file(path);
}

bool TestUploadIsIdempotent() {
    TempDir dir;
    LocalFSBackend local((dir.path() / "store").string());
    RecordingStore store(local);
    TransferManager tm(store, TransferConfig{});

    MemorySource first(kPng);
    std::string url1 = tm.uploadSingle("pottery-log", first, "pot.png", "image/png", "dev1");
    MemorySource second(random_bytes(50, 9));
    std::string url2 = tm.uploadSingle("pottery-log", second, "pot.png", "image/png", "dev1");

    ASSERT_EQ(url1, std::string("https://pottery-log.s3.amazonaws.com/dev1/pot.png"), "canonical URL");
    ASSERT_EQ(url2, url1, "second upload returns the same URL");
    ASSERT_EQ(store.puts.load(), 1, "only one put");
    ASSERT_EQ(object_bytes(local, "pottery-log", "dev1/pot.png"), kPng, "first bytes kept");
    return true;
}

bool TestUrlUsesConfiguredDomain() {
    TempDir dir;
    LocalFSBackend local(dir.str());
    TransferConfig cfg;
    cfg.store_domain = "objects.example.test";
    TransferManager tm(local, cfg);
    ASSERT_EQ(tm.objectUrl("b", "d/x.png"), std::string("https://b.objects.example.test/d/x.png"),
              "bucket subdomain of configured domain");
    return true;
}

bool TestStreamedSourceIsSniffed() {
    TempDir dir;
    LocalFSBackend local(dir.str());
    TransferManager tm(local, TransferConfig{});

    ChunkedSource streamed(kPng, 64);
    tm.uploadSingle("pottery-log", streamed, "a.bin", "", "dev2");
    ASSERT_EQ(local.attributes("pottery-log", "dev2/a.bin").content_type, std::string("image/png"),
              "missing hint replaced by sniffed type");

    ChunkedSource hinted(kPng, 64);
    tm.uploadSingle("pottery-log", hinted, "b.bin", "image/jpeg", "dev2");
    ASSERT_EQ(local.attributes("pottery-log", "dev2/b.bin").content_type, std::string("image/jpeg"),
              "image hint kept");

    ChunkedSource text(std::string("hello glaze"), 4);
    tm.uploadSingle("pottery-log", text, "c.txt", "application/octet-stream", "dev2");
    ASSERT_EQ(local.attributes("pottery-log", "dev2/c.txt").content_type,
              std::string("text/plain; charset=utf-8"), "non-image hint replaced");
    ASSERT_EQ(object_bytes(local, "pottery-log", "dev2/c.txt"), std::string("hello glaze"), "bytes");
    return true;
}

bool TestSeekableSourceKeepsHintAndAttributes() {
    TempDir dir;
    LocalFSBackend local(dir.str());
    TransferManager tm(local, TransferConfig{});

    MemorySource body(kPng);
    tm.uploadSingle("pottery-log", body, "d.png", "application/x-custom", "dev3");
    ObjectAttributes a = local.attributes("pottery-log", "dev3/d.png");
    ASSERT_EQ(a.content_type, std::string("application/x-custom"), "hint used verbatim");
    ASSERT_EQ(a.acl, std::string("public-read"), "public object");
    ASSERT_EQ(a.cache_control, std::string("max-age=31556926"), "cached for a year");

    const auto inYear = std::chrono::system_clock::now() + std::chrono::hours(24 * 365);
    const auto skew = std::chrono::duration_cast<std::chrono::seconds>(
        a.expires > inYear ? a.expires - inYear : inYear - a.expires).count();
    ASSERT_TRUE(skew < 3600, "expiry about a year out");
    return true;
}

bool TestBelowThresholdIsSinglePut() {
    TempDir dir;
    LocalFSBackend local((dir.path() / "store").string());
    RecordingStore store(local);
    TransferManager tm(store, small_parts());

    const std::string bytes = random_bytes(999, 11);
    write_file(dir.path() / "export.zip", bytes);
    FileSource file = FileSource::open((dir.path() / "export.zip").string());
    tm.uploadLarge("pottery-log-exports", file, "export.zip", "application/zip", "dev4");

    ASSERT_EQ(store.puts.load(), 1, "single put");
    ASSERT_EQ(store.creates.load(), 0, "no multipart");
    ASSERT_EQ(object_bytes(local, "pottery-log-exports", "dev4/export.zip"), bytes, "bytes");
    return true;
}

bool TestAtThresholdSplitsIntoParts() {
    TempDir dir;
    LocalFSBackend local((dir.path() / "store").string());
    RecordingStore store(local);
    TransferManager tm(store, small_parts());

    const std::string bytes = random_bytes(1000, 12);
    write_file(dir.path() / "export.zip", bytes);
    FileSource file = FileSource::open((dir.path() / "export.zip").string());
    std::string url = tm.uploadLarge("pottery-log-exports", file, "export.zip", "application/zip", "dev5");

    ASSERT_EQ(url, std::string("https://pottery-log-exports.s3.amazonaws.com/dev5/export.zip"), "URL");
    ASSERT_EQ(store.puts.load(), 0, "no single put");
    ASSERT_EQ(store.creates.load(), 1, "one multipart upload");
    ASSERT_EQ(store.completes.load(), 1, "completed");
    ASSERT_EQ(store.aborts.load(), 0, "not aborted");

    auto numbers = store.partNumbers();
    auto sizes = store.partSizes();
    ASSERT_EQ(numbers.size(), static_cast<std::size_t>(4), "four parts");
    const std::size_t expectedSizes[] = {300, 300, 300, 100};
    for (std::size_t i = 0; i < numbers.size(); ++i) {
        ASSERT_EQ(numbers[i], static_cast<int>(i + 1), "parts numbered from 1");
        ASSERT_EQ(sizes[i], expectedSizes[i], "part size");
    }
    ASSERT_EQ(object_bytes(local, "pottery-log-exports", "dev5/export.zip"), bytes, "reassembled bytes");
    ASSERT_EQ(local.attributes("pottery-log-exports", "dev5/export.zip").acl, std::string("public-read"),
              "multipart attributes applied");
    return true;
}

bool TestLastPartMayBeFull() {
    TempDir dir;
    LocalFSBackend local((dir.path() / "store").string());
    RecordingStore store(local);
    TransferManager tm(store, small_parts());

    const std::string bytes = random_bytes(1200, 13);
    write_file(dir.path() / "export.zip", bytes);
    FileSource file = FileSource::open((dir.path() / "export.zip").string());
    tm.uploadLarge("pottery-log-exports", file, "export.zip", "application/zip", "dev6");

    auto sizes = store.partSizes();
    ASSERT_EQ(sizes.size(), static_cast<std::size_t>(4), "four parts, no empty fifth");
    ASSERT_EQ(sizes[3], static_cast<std::size_t>(300), "last part full");
    ASSERT_EQ(object_bytes(local, "pottery-log-exports", "dev6/export.zip"), bytes, "bytes");
    return true;
}

bool TestPartFailureAborts() {
    for (int failing = 1; failing <= 4; ++failing) {
        TempDir dir;
        LocalFSBackend local((dir.path() / "store").string());
        RecordingStore store(local);
        store.failPart = failing;
        TransferManager tm(store, small_parts());

        write_file(dir.path() / "export.zip", random_bytes(1000, 14));
        FileSource file = FileSource::open((dir.path() / "export.zip").string());
        ASSERT_THROWS(tm.uploadLarge("pottery-log-exports", file, "export.zip", "application/zip", "dev7"),
                      StorageError, "part failure propagates");
        ASSERT_EQ(store.aborts.load(), 1, "upload aborted exactly once");
        ASSERT_EQ(store.completes.load(), 0, "never completed");
        ASSERT_EQ(static_cast<int>(store.partNumbers().size()), failing, "stopped at the failing part");
        ASSERT_FALSE(local.headObject("pottery-log-exports", "dev7/export.zip"), "no object left behind");
        ASSERT_FALSE(std::filesystem::exists(dir.path() / "store" / ".multipart") &&
                     !std::filesystem::is_empty(dir.path() / "store" / ".multipart"),
                     "no pending upload left behind");
    }
    return true;
}

bool TestAbortFailureKeepsOriginalError() {
    TempDir dir;
    LocalFSBackend local((dir.path() / "store").string());
    RecordingStore store(local);
    store.failPart = 2;
    store.failAbort = true;
    TransferManager tm(store, small_parts());

    write_file(dir.path() / "export.zip", random_bytes(1000, 15));
    FileSource file = FileSource::open((dir.path() / "export.zip").string());
    std::string diagnostic;
    try {
        tm.uploadLarge("pottery-log-exports", file, "export.zip", "application/zip", "dev8");
    } catch (const StorageError& e) {
        diagnostic = e.diagnostic();
    }
    ASSERT_EQ(diagnostic, std::string("injected part failure"), "part failure reported, not abort failure");
    ASSERT_EQ(store.aborts.load(), 1, "abort attempted");
    return true;
}

bool TestReadFailureAborts() {
    TempDir dir;
    LocalFSBackend local((dir.path() / "store").string());
    RecordingStore store(local);
    TransferManager tm(store, small_parts());

    // two good parts, then the third read fails
    FailingRandomSource broken(1000, 600);
    ASSERT_THROWS(tm.uploadLarge("pottery-log-exports", broken, "export.zip", "application/zip", "dev12"),
                  IOError, "read failure propagates as IOError");
    ASSERT_EQ(store.creates.load(), 1, "multipart upload started");
    ASSERT_EQ(store.aborts.load(), 1, "upload aborted");
    ASSERT_EQ(store.completes.load(), 0, "never completed");
    ASSERT_EQ(static_cast<int>(store.partNumbers().size()), 2, "parts before the failure were sent");
    ASSERT_FALSE(local.headObject("pottery-log-exports", "dev12/export.zip"), "no object left behind");
    return true;
}

bool TestExistingKeySkipsMultipart() {
    TempDir dir;
    LocalFSBackend local((dir.path() / "store").string());
    RecordingStore store(local);
    TransferManager tm(store, small_parts());

    MemorySource existing(std::string("already here"));
    local.putObject("pottery-log-exports", "dev9/export.zip", existing, ObjectAttributes{});

    write_file(dir.path() / "export.zip", random_bytes(5000, 16));
    FileSource file = FileSource::open((dir.path() / "export.zip").string());
    std::string url = tm.uploadLarge("pottery-log-exports", file, "export.zip", "application/zip", "dev9");

    ASSERT_EQ(url, std::string("https://pottery-log-exports.s3.amazonaws.com/dev9/export.zip"), "URL");
    ASSERT_EQ(store.creates.load(), 0, "no multipart upload started");
    ASSERT_EQ(object_bytes(local, "pottery-log-exports", "dev9/export.zip"), std::string("already here"),
              "existing object untouched");
    return true;
}

bool TestDeleteImage() {
    TempDir dir;
    LocalFSBackend local(dir.str());
    TransferManager tm(local, TransferConfig{});

    MemorySource body(kPng);
    tm.uploadSingle("pottery-log", body, "gone.png", "image/png", "dev10");
    ASSERT_TRUE(tm.exists("pottery-log", "dev10/gone.png"), "uploaded");
    tm.deleteImage("dev10/gone.png");
    ASSERT_FALSE(tm.exists("pottery-log", "dev10/gone.png"), "deleted");
    return true;
}

bool TestFailingHeadReadsAsAbsent() {
    TempDir dir;
    LocalFSBackend local(dir.str());
    RecordingStore store(local);
    store.failHead = true;
    TransferManager tm(store, TransferConfig{});

    ASSERT_FALSE(tm.exists("pottery-log", "dev11/x.png"), "head failure is not existence");
    MemorySource body(kPng);
    tm.uploadSingle("pottery-log", body, "x.png", "image/png", "dev11");
    ASSERT_EQ(store.puts.load(), 1, "upload proceeds after failed head");
    return true;
}

int main() {
    TestRunner runner("TransferManager Tests");
    runner.run(TestUploadIsIdempotent, "Upload is idempotent");
    runner.run(TestUrlUsesConfiguredDomain, "URL uses configured domain");
    runner.run(TestStreamedSourceIsSniffed, "Streamed source is sniffed");
    runner.run(TestSeekableSourceKeepsHintAndAttributes, "Seekable source keeps hint and attributes");
    runner.run(TestBelowThresholdIsSinglePut, "Below threshold is a single put");
    runner.run(TestAtThresholdSplitsIntoParts, "At threshold splits into parts");
    runner.run(TestLastPartMayBeFull, "Last part may be full");
    runner.run(TestPartFailureAborts, "Part failure aborts");
    runner.run(TestAbortFailureKeepsOriginalError, "Abort failure keeps original error");
    runner.run(TestReadFailureAborts, "Read failure aborts");
    runner.run(TestExistingKeySkipsMultipart, "Existing key skips multipart");
    runner.run(TestDeleteImage, "Delete image");
    runner.run(TestFailingHeadReadsAsAbsent, "Failing head reads as absent");
    return runner.finish();
}
