/**
 * test_upload_spool.cpp
 *
 * Unit tests for UploadSpool: multipart bodies arrive in small chunks, the
 * upload part lands in a scratch file, text fields stay in memory.
 */

#include "services/api/UploadSpool.hpp"
#include "test_support.hpp"

using namespace potlog;

// Feeds data to the spool in pieces of at most `chunk` bytes.
static bool feed(UploadSpool& spool, const std::string& data, std::size_t chunk) {
    for (std::size_t off = 0; off < data.size(); off += chunk) {
        if (!spool.append(data.data() + off, std::min(chunk, data.size() - off))) return false;
    }
    return true;
}

static std::size_t files_in(const std::filesystem::path& dir) {
    std::size_t n = 0;
    for (const auto& e : std::filesystem::directory_iterator(dir)) {
        if (e.is_regular_file()) ++n;
    }
    return n;
}

bool TestUploadGoesToScratchFile() {
    TempDir dir;
    const std::string image = random_bytes(5 * 1024 * 1024 + 3, 41);

    UploadSpool spool(dir.str(), "image");
    ASSERT_TRUE(spool.beginPart("deviceId", "", "text/plain"), "text part accepted");
    ASSERT_TRUE(feed(spool, "dev1", 2), "text data accepted");
    ASSERT_TRUE(spool.beginPart("image", "pot.png", "image/png"), "file part accepted");
    ASSERT_TRUE(feed(spool, image, 16 * 1024), "file data accepted");

    SpooledForm form = spool.finish();
    ASSERT_EQ(form.field("deviceId"), std::string("dev1"), "text field");
    ASSERT_EQ(form.field("missing"), std::string(), "absent field is empty");
    ASSERT_EQ(form.filename, std::string("pot.png"), "file name");
    ASSERT_EQ(form.content_type, std::string("image/png"), "content type");
    ASSERT_TRUE(form.file != nullptr, "file spooled");
    ASSERT_EQ(form.file->size(), static_cast<std::uint64_t>(image.size()), "spooled size");
    ASSERT_EQ(read_file(form.file->path()), image, "spooled bytes");
    ASSERT_EQ(form.file->readAll(), image, "spooled file rewound");

    const std::string path = form.file->path();
    form.file.reset();
    ASSERT_FALSE(std::filesystem::exists(path), "spooled file removed on release");
    return true;
}

bool TestTextOnlyForm() {
    TempDir dir;
    UploadSpool spool(dir.str(), "import");
    spool.beginPart("deviceId", "", "");
    feed(spool, "dev2", 100);
    spool.beginPart("importURL", "", "");
    feed(spool, "https://pottery-log-exports.s3.amazonaws.com/dev2/x.zip", 7);

    SpooledForm form = spool.finish();
    ASSERT_TRUE(form.file == nullptr, "no file part");
    ASSERT_EQ(form.field("importURL"), std::string("https://pottery-log-exports.s3.amazonaws.com/dev2/x.zip"),
              "chunked text field reassembled");
    ASSERT_EQ(files_in(dir.path()), static_cast<std::size_t>(0), "nothing spooled");
    return true;
}

bool TestOtherFilePartsAreDropped() {
    TempDir dir;
    UploadSpool spool(dir.str(), "image");
    spool.beginPart("attachment", "notes.txt", "text/plain");
    feed(spool, random_bytes(10000, 42), 1000);

    SpooledForm form = spool.finish();
    ASSERT_TRUE(form.file == nullptr, "unrelated file not spooled");
    ASSERT_TRUE(form.fields.empty(), "unrelated file not kept as text");
    return true;
}

bool TestDuplicateUploadRejected() {
    TempDir dir;
    {
        UploadSpool spool(dir.str(), "image");
        spool.beginPart("image", "a.png", "image/png");
        feed(spool, "first", 2);
        ASSERT_FALSE(spool.beginPart("image", "b.png", "image/png"), "second upload stops the transfer");
        ASSERT_FALSE(spool.append("x", 1), "later data refused");
        ASSERT_THROWS(spool.finish(), ValidationError, "duplicate reported on finish");
    }
    ASSERT_EQ(files_in(dir.path()), static_cast<std::size_t>(0), "failed spool leaves no file");
    return true;
}

bool TestOversizedFieldRejected() {
    TempDir dir;
    UploadSpool spool(dir.str(), "image");
    spool.beginPart("metadata", "", "application/json");
    std::string block(1024 * 1024, 'm');
    bool accepted = true;
    for (std::size_t i = 0; i <= UploadSpool::kMaxFieldBytes / block.size() && accepted; ++i) {
        accepted = spool.append(block.data(), block.size());
    }
    ASSERT_FALSE(accepted, "field past the limit stops the transfer");
    ASSERT_THROWS(spool.finish(), ValidationError, "oversized field reported");
    return true;
}

bool TestRepeatedTextFieldKeepsLast() {
    TempDir dir;
    UploadSpool spool(dir.str(), "image");
    spool.beginPart("deviceId", "", "");
    feed(spool, "old", 10);
    spool.beginPart("deviceId", "", "");
    feed(spool, "new", 10);
    ASSERT_EQ(spool.finish().field("deviceId"), std::string("new"), "last value wins");
    return true;
}

int main() {
    TestRunner runner("UploadSpool Tests");
    runner.run(TestUploadGoesToScratchFile, "Upload goes to a scratch file");
    runner.run(TestTextOnlyForm, "Text-only form");
    runner.run(TestOtherFilePartsAreDropped, "Other file parts are dropped");
    runner.run(TestDuplicateUploadRejected, "Duplicate upload rejected");
    runner.run(TestOversizedFieldRejected, "Oversized field rejected");
    runner.run(TestRepeatedTextFieldKeepsLast, "Repeated text field keeps last");
    return runner.finish();
}
