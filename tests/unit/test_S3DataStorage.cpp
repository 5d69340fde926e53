#include <gtest/gtest.h>
#include "storage/S3DataStorage.hpp"
#include "FakeS3Client.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;
using namespace sk::storage;
using sk::storage::s3::ClientError;
using sk::test::FakeS3Client;

class S3DataStorageTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeS3Client> client;
    std::unique_ptr<S3DataStorage> storage;
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / ("skein_s3_storage_" + std::string(
            ::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);

        client = std::make_shared<FakeS3Client>();
        storage = std::make_unique<S3DataStorage>(client);
    }

    void TearDown() override { fs::remove_all(test_dir); }

    static std::string readFile(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }

    static std::vector<uint8_t> bytes(const std::string& s) { return {s.begin(), s.end()}; }
};

TEST_F(S3DataStorageTest, RejectsNullClient) {
    EXPECT_THROW(S3DataStorage(std::shared_ptr<const s3::Client>{}), std::invalid_argument);
}

TEST_F(S3DataStorageTest, ReportsCloudType) {
    EXPECT_EQ(storage->type(), StorageType::Cloud);
    EXPECT_EQ(storage->client(), client);
}

TEST_F(S3DataStorageTest, CheckExistsSendsHeadForBucketAndKey) {
    client->seed("foo", "bar/baz/dummy", bytes("x"));
    EXPECT_TRUE(storage->checkExists("s3://foo/bar/baz/dummy"));

    const auto calls = client->calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].op, "head");
    EXPECT_EQ(calls[0].bucket, "foo");
    EXPECT_EQ(calls[0].key, "bar/baz/dummy");
}

TEST_F(S3DataStorageTest, CheckExistsIsFalseForMissingKey) {
    EXPECT_FALSE(storage->checkExists("s3://foo/bar/baz/dummy"));

    client->failNextWith(ClientError("NoSuchKey", 404, "missing"));
    EXPECT_FALSE(storage->checkExists("s3://foo/bar/baz/dummy"));
}

TEST_F(S3DataStorageTest, CheckExistsRethrowsOtherErrors) {
    client->failNextWith(ClientError("AccessDenied", 403, "denied"));
    try {
        (void)storage->checkExists("s3://foo/bar/baz/dummy");
        FAIL() << "expected ClientError";
    } catch (const ClientError& e) {
        EXPECT_EQ(e.code(), "AccessDenied");
        EXPECT_EQ(e.httpStatus(), 403);
    }

    client->failNextWith(ClientError(ClientError::REQUEST_ERROR, 0, "connection reset"));
    EXPECT_THROW((void)storage->checkExists("s3://foo/bar"), ClientError);
}

TEST_F(S3DataStorageTest, CheckExistsRejectsPlainPath) {
    EXPECT_THROW((void)storage->checkExists("foo/bar"), std::invalid_argument);
    EXPECT_TRUE(client->calls().empty());
}

TEST_F(S3DataStorageTest, PutObject) {
    storage->putObject(bytes("object bytes"), "s3://foo/bar/baz/dummy");
    EXPECT_EQ(client->object("foo", "bar/baz/dummy"), bytes("object bytes"));
}

TEST_F(S3DataStorageTest, PutFile) {
    const auto local = test_dir / "upload.bin";
    std::ofstream(local, std::ios::binary) << "file contents";

    storage->putFile(local, "s3://foo/bar/baz/dummy");

    const auto calls = client->calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].op, "upload");
    EXPECT_EQ(calls[0].filename, local.string());
    EXPECT_EQ(client->object("foo", "bar/baz/dummy"), bytes("file contents"));
}

TEST_F(S3DataStorageTest, PutFileMissingLocalFile) {
    try {
        storage->putFile(test_dir / "nope.bin", "s3://foo/bar");
        FAIL() << "expected filesystem_error";
    } catch (const fs::filesystem_error& e) {
        EXPECT_EQ(e.code(), std::make_error_code(std::errc::no_such_file_or_directory));
    }
    EXPECT_TRUE(client->calls().empty());
}

TEST_F(S3DataStorageTest, FetchFileMirrorsKeyUnderPrefix) {
    client->seed("foo", "bar/baz/dummy", bytes("remote payload"));

    const auto dst = storage->fetchFile("s3://foo/bar/baz/dummy", test_dir);

    EXPECT_EQ(dst, test_dir / "bar/baz/dummy");
    EXPECT_EQ(readFile(dst), "remote payload");

    const auto calls = client->calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].op, "download");
    EXPECT_EQ(calls[0].bucket, "foo");
    EXPECT_EQ(calls[0].key, "bar/baz/dummy");
    EXPECT_NE(calls[0].filename, dst.string());
    EXPECT_TRUE(calls[0].filename.starts_with(dst.string() + ".tmp-"));
}

TEST_F(S3DataStorageTest, FetchFileSkipsExistingDestination) {
    client->seed("foo", "bar/baz/dummy", bytes("remote payload"));
    fs::create_directories(test_dir / "bar/baz");
    std::ofstream(test_dir / "bar/baz/dummy") << "cached";

    const auto dst = storage->fetchFile("s3://foo/bar/baz/dummy", test_dir);

    EXPECT_EQ(readFile(dst), "cached");
    EXPECT_TRUE(client->calls().empty());
}

TEST_F(S3DataStorageTest, FetchFileMissingKeyPropagatesNotFound) {
    try {
        (void)storage->fetchFile("s3://foo/bar/baz/dummy", test_dir);
        FAIL() << "expected ClientError";
    } catch (const ClientError& e) {
        EXPECT_TRUE(e.notFound());
    }

    EXPECT_FALSE(fs::exists(test_dir / "bar/baz/dummy"));
    for (const auto& entry : fs::recursive_directory_iterator(test_dir))
        EXPECT_FALSE(entry.is_regular_file()) << entry.path();
}

TEST_F(S3DataStorageTest, FetchFileTransportErrorLeavesNoTempFile) {
    client->failNextWith(ClientError("InternalError", 500, "boom"));
    EXPECT_THROW((void)storage->fetchFile("s3://foo/a/b", test_dir), ClientError);

    for (const auto& entry : fs::recursive_directory_iterator(test_dir))
        EXPECT_FALSE(entry.is_regular_file()) << entry.path();
}

TEST_F(S3DataStorageTest, FetchFileKeepsAbsoluteKeyUnderPrefix) {
    client->seed("foo", "/etc/evil", bytes("payload"));

    const auto dst = storage->fetchFile("s3://foo//etc/evil", test_dir);

    EXPECT_EQ(dst, test_dir / "etc" / "evil");
    EXPECT_EQ(readFile(dst), "payload");
}

TEST_F(S3DataStorageTest, FetchFileNormalizesInnerDotSegments) {
    client->seed("foo", "a/./b/../c", bytes("payload"));
    EXPECT_EQ(storage->fetchFile("s3://foo/a/./b/../c", test_dir), test_dir / "a" / "c");
}

TEST_F(S3DataStorageTest, FetchFileRejectsKeysEscapingPrefix) {
    const auto dst = test_dir / "cache";
    for (const std::string address : {"s3://foo/../../escaped", "s3://foo/a/../../escaped", "s3://foo//../escaped"}) {
        client->seed("foo", S3DataStorage::bucketKeyFromS3Path(address).key, bytes("x"));
        EXPECT_THROW((void)storage->fetchFile(address, dst), std::invalid_argument) << address;
    }

    EXPECT_TRUE(client->calls().empty());
    EXPECT_FALSE(fs::exists(test_dir / "escaped"));
    EXPECT_FALSE(fs::exists(dst));
}

TEST_F(S3DataStorageTest, FetchFileRejectsDirectoryLikeKeys) {
    for (const std::string address : {"s3://foo", "s3://foo/", "s3://foo/dir/", "s3://foo/a/b/..", "s3://foo/a/.."})
        EXPECT_THROW((void)storage->fetchFile(address, test_dir), std::invalid_argument) << address;

    EXPECT_TRUE(client->calls().empty());
    EXPECT_TRUE(fs::is_empty(test_dir));
}

TEST_F(S3DataStorageTest, FetchObjectAndPartialObject) {
    client->seed("foo", "blob", bytes("0123456789"));

    EXPECT_EQ(storage->fetchObject("s3://foo/blob"), bytes("0123456789"));
    EXPECT_EQ(storage->fetchPartialObject("s3://foo/blob", 2, 4), bytes("2345"));
    EXPECT_THROW((void)storage->fetchPartialObject("s3://foo/blob", 2, 0), std::invalid_argument);
    EXPECT_THROW((void)storage->fetchObject("s3://foo/missing"), ClientError);
}

TEST_F(S3DataStorageTest, UsableThroughFacade) {
    client->seed("foo", "k", bytes("v"));
    const DataStorage& facade = *storage;
    EXPECT_EQ(readFile(facade.fetchFile("s3://foo/k", test_dir)), "v");
}
