#include "fake_transport.hpp"

#include "streamdrop/errors.hpp"
#include "streamdrop/logging.hpp"
#include "streamdrop/upload_dispatcher.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <utility>

namespace streamdrop {
namespace {

using test::FakeTransport;
using test::RecordingProgress;

ByteStream streamOf(const std::string& text) {
    TransferBuffer buffer;
    buffer.write(text.data(), text.size());
    buffer.seekStart();
    return std::move(buffer).asReadableStream();
}

class UploadDispatcherTest : public ::testing::Test {
protected:
    FakeTransport transport;
    RecordingProgress progress;
    UploadDispatcher uploader{transport, progress, makeNullLogger()};
    Credentials credentials{"alice", "secret-key"};
};

TEST_F(UploadDispatcherTest, SendsStreamAsMultipartFile) {
    const auto result = uploader.upload(streamOf("file body"), "notes.txt", credentials);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.id, "abc123");
    EXPECT_EQ(transport.post_calls, 1);
    EXPECT_EQ(transport.last_upload.url, kUploadEndpoint);
    EXPECT_EQ(transport.last_upload.username, "alice");
    EXPECT_EQ(transport.last_upload.password, "secret-key");
    EXPECT_EQ(transport.last_upload.field_name, "file");
    EXPECT_EQ(transport.last_upload.filename, "notes.txt");
    EXPECT_EQ(transport.last_upload.headers.at("name"), "notes.txt");
    EXPECT_EQ(transport.last_upload.size, 9u);
    EXPECT_EQ(transport.uploaded_body, "file body");
    EXPECT_EQ(progress.begins, 1);
    EXPECT_EQ(progress.ends, 1);
    EXPECT_EQ(progress.current, 9u);
}

TEST_F(UploadDispatcherTest, ReportsServiceFailureMessage) {
    transport.post_response = HttpResponse{401, {}, R"({"success":false,"value":"unauthorized","message":"bad key"})"};

    const auto result = uploader.upload(streamOf("x"), "x", credentials);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "bad key");
}

TEST_F(UploadDispatcherTest, NonJsonReplyIsFailure) {
    transport.post_response = HttpResponse{502, {}, "<html>Bad Gateway</html>"};

    const auto result = uploader.upload(streamOf("x"), "x", credentials);

    EXPECT_FALSE(result.success);
    EXPECT_NE(result.message.find("HTTP 502"), std::string::npos);
}

TEST_F(UploadDispatcherTest, NetworkFailureBecomesUploadError) {
    transport.post_fails = true;

    EXPECT_THROW((void)uploader.upload(streamOf("x"), "x", credentials), UploadError);
    EXPECT_EQ(progress.ends, 1);
}

TEST_F(UploadDispatcherTest, MissingLocalFileFailsBeforeAnyRequest) {
    const std::filesystem::path missing = std::filesystem::temp_directory_path() / "streamdrop-no-such-file.bin";
    std::filesystem::remove(missing);

    try {
        (void)uploader.uploadFile(missing, "gone.bin", credentials);
        FAIL() << "expected LocalResourceError";
    } catch (const LocalResourceError& ex) {
        EXPECT_EQ(ex.path().string(), missing.string());
    }
    EXPECT_EQ(transport.post_calls, 0);
    EXPECT_EQ(transport.head_calls, 0);
    EXPECT_TRUE(transport.requests.empty());
}

TEST_F(UploadDispatcherTest, DirectoryIsNotUploadable) {
    EXPECT_THROW((void)uploader.uploadFile(std::filesystem::temp_directory_path(), "dir", credentials),
                 LocalResourceError);
    EXPECT_EQ(transport.post_calls, 0);
}

TEST_F(UploadDispatcherTest, UploadsLocalFile) {
    const std::filesystem::path path = std::filesystem::temp_directory_path() / "streamdrop-upload-test.txt";
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << "local content";
    }

    const auto result = uploader.uploadFile(path, "renamed.txt", credentials);
    std::filesystem::remove(path);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(transport.last_upload.path.string(), path.string());
    EXPECT_EQ(transport.last_upload.filename, "renamed.txt");
    EXPECT_EQ(transport.last_upload.size, 13u);
    EXPECT_EQ(transport.uploaded_body, "local content");
}

TEST(ParseUploadResponseTest, SuccessWithoutIdIsFailure) {
    const auto result = parseUploadResponse(HttpResponse{201, {}, R"({"success":true})"});
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.message.empty());
}

TEST_F(UploadDispatcherTest, StripsLineBreaksFromFilename) {
    const auto result = uploader.upload(streamOf("x"), "evil\r\nX-Injected: 1.txt", credentials);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(transport.last_upload.filename, "evilX-Injected: 1.txt");
    EXPECT_EQ(transport.last_upload.headers.at("name"), "evilX-Injected: 1.txt");
}

TEST(SanitizeFilenameTest, KeepsOrdinaryNamesAndDefaultsEmptyOnes) {
    EXPECT_EQ(sanitizeFilename("report final.pdf"), "report final.pdf");
    EXPECT_EQ(sanitizeFilename("\r\n"), "Unnamed");
}

} // namespace
} // namespace streamdrop
