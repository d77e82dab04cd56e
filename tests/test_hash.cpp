#include <gtest/gtest.h>
#include "../src/hash.hpp"
#include "../src/exception.hpp"
#include "../src/localization.hpp"
#include "../src/utils.hpp"
#include <filesystem>
#include <unistd.h>

namespace fs = std::filesystem;

class HashTest : public ::testing::Test {
protected:
    fs::path work_dir;

    void SetUp() override {
        set_l10n_dir(PIPKIN_SOURCE_L10N_DIR);
        init_localization();
        work_dir = fs::absolute("tmp_hash_test_" + std::to_string(getpid()));
        fs::remove_all(work_dir);
        fs::create_directories(work_dir);
    }

    void TearDown() override {
        fs::remove_all(work_dir);
    }
};

TEST_F(HashTest, FileDigestIsLowerCaseHex) {
    write_file_bytes(work_dir / "abc.txt", "abc");
    EXPECT_EQ(calculate_sha256(work_dir / "abc.txt"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(HashTest, MissingFileThrows) {
    EXPECT_THROW(calculate_sha256(work_dir / "missing"), PipkinException);
}

TEST_F(HashTest, RecordHashIsUrlsafeWithoutPadding) {
    EXPECT_EQ(record_hash(""), "sha256=47DEQpj8HBSa-_TImW-5JCeuQeRkm5NMpJWZG3hSuFU");
    EXPECT_EQ(sha256_digest("abc").size(), 32u);
}

TEST_F(HashTest, Base64) {
    EXPECT_EQ(base64_encode("hello"), "aGVsbG8=");
    EXPECT_EQ(base64_decode("aGVsbG8="), "hello");
    EXPECT_EQ(base64_decode("aGVsbA=="), "hell");
    EXPECT_EQ(base64_decode(""), "");

    const std::string binary("\x00\xff\x10\x80", 4);
    EXPECT_EQ(base64_decode(base64_encode(binary)), binary);

    EXPECT_THROW(base64_decode("abc"), PipkinException);
    EXPECT_THROW(base64_decode("a*b!"), PipkinException);
}
