#include "reasm/reassembly/integrity.hpp"
#include "../support/fakes.hpp"

#include <gtest/gtest.h>

#include <cctype>
#include <fstream>
#include <string>
#include <vector>

using reasm::reassembly::normalize_digest;
using reasm::reassembly::sha256_file;
using reasm::reassembly::sha256_hex;
using reasm::reassembly::Sha256;
using reasm::reassembly::verify_chunk;

namespace {

const std::string kAbcDigest = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

std::vector<std::uint8_t> bytes_of(const std::string& text) {
    return {text.begin(), text.end()};
}

} // namespace

TEST(IntegrityTest, Sha256KnownVectors) {
    EXPECT_EQ(sha256_hex(bytes_of("abc")), kAbcDigest);
    EXPECT_EQ(sha256_hex({}), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(IntegrityTest, IncrementalMatchesOneShot) {
    Sha256 hasher;
    hasher.update(bytes_of("a"));
    hasher.update(bytes_of("bc"));
    EXPECT_EQ(hasher.final_hex(), kAbcDigest);
}

TEST(IntegrityTest, MissingChecksumAcceptsAnything) {
    EXPECT_TRUE(verify_chunk({9, 9, 9}, std::nullopt));
    EXPECT_TRUE(verify_chunk({9, 9, 9}, std::string{}));
}

TEST(IntegrityTest, MismatchRejected) {
    EXPECT_FALSE(verify_chunk({9, 9, 9}, std::string("deadbeef")));
}

TEST(IntegrityTest, MatchIsCaseAndFormatInsensitive) {
    std::string upper = kAbcDigest;
    for (auto& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    EXPECT_TRUE(verify_chunk(bytes_of("abc"), kAbcDigest));
    EXPECT_TRUE(verify_chunk(bytes_of("abc"), upper));
    EXPECT_TRUE(verify_chunk(bytes_of("abc"), "  sha256:" + kAbcDigest + "\n"));
    EXPECT_TRUE(verify_chunk(bytes_of("abc"), "0x" + kAbcDigest));
}

TEST(IntegrityTest, NormalizeDigest) {
    EXPECT_EQ(normalize_digest(" AbCd "), "abcd");
    EXPECT_EQ(normalize_digest("SHA256:FF"), "ff");
    EXPECT_EQ(normalize_digest("   "), "");
}

TEST(IntegrityTest, HashesFileContents) {
    const auto dir = reasm::test_support::create_temp_dir("reasm_integrity_test");
    const auto path = dir / "abc.bin";
    {
        std::ofstream out(path, std::ios::binary);
        out << "abc";
    }

    auto digest = sha256_file(path);
    ASSERT_TRUE(digest.is_ok());
    EXPECT_EQ(digest.value(), kAbcDigest);

    auto missing = sha256_file(dir / "missing.bin");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().code, reasm::ErrorCode::Io);

    std::filesystem::remove_all(dir);
}

TEST(IntegrityTest, ErrorCodesHaveStableNames) {
    EXPECT_STREQ(reasm::to_string(reasm::ErrorCode::IntegrityFailure), "integrity-failure");
    EXPECT_STREQ(reasm::to_string(reasm::ErrorCode::Backpressure), "backpressure");
    EXPECT_STREQ(reasm::to_string(reasm::ErrorCode::FinalizeFailure), "finalize-failure");
}
