#include <gtest/gtest.h>
#include "relaysave/transfer/assembler.hpp"
#include "relaysave/crypto/hash.hpp"
#include "relaysave/crypto/key_agreement.hpp"
#include "relaysave/crypto/payload_cipher.hpp"
#include <string>

namespace relaysave::transfer::test {

using storage::ChunkRecord;
using storage::EncryptionMode;
using storage::FetchError;

namespace {

std::vector<std::uint8_t> bytes_of(const std::string& text) {
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

ChunkRecord plain_chunk(std::uint32_t index, const std::string& text) {
    ChunkRecord chunk;
    chunk.index = index;
    chunk.record_id = "plain-" + std::to_string(index);
    chunk.content = crypto::hash_utils::to_base64(bytes_of(text));
    return chunk;
}

}

class AssemblerTest : public ::testing::Test {
protected:
    void SetUp() override {
        secret_ = crypto::SecureBytes(crypto::SECRET_KEY_SIZE);
        secret_.data.back() = 1;
        ASSERT_TRUE(crypto::KeyAgreement::derive_public_key(secret_.span(), owner_key_));
        ASSERT_TRUE(crypto::KeyAgreement::derive_conversation_key(secret_.span(), owner_key_, conversation_key_));

        keys_.secret_key = secret_.span();
        keys_.owner_key = owner_key_;
    }

    ChunkRecord sealed_chunk(std::uint32_t index, const std::string& text) {
        ChunkRecord chunk;
        chunk.index = index;
        chunk.record_id = "sealed-" + std::to_string(index);
        chunk.encryption = "nip44";
        auto result = crypto::PayloadCipher::encrypt(bytes_of(text), conversation_key_, chunk.content);
        EXPECT_TRUE(result.success()) << result.message;
        return chunk;
    }

    crypto::SecureBytes secret_;
    crypto::PublicKey owner_key_{};
    crypto::ConversationKey conversation_key_{};
    SealingKeys keys_;
};

TEST_F(AssemblerTest, ConcatenatesPlainChunksInIndexOrder) {
    std::vector<ChunkRecord> chunks = {plain_chunk(2, "!"), plain_chunk(0, "hello "), plain_chunk(1, "world")};

    std::vector<std::uint8_t> data;
    auto result = Assembler::assemble(chunks, 3, EncryptionMode::None, nullptr, data);
    ASSERT_TRUE(result.success()) << result.message;
    EXPECT_EQ(std::string(data.begin(), data.end()), "hello world!");
}

TEST_F(AssemblerTest, DecodesEachChunkSeparately) {
    std::vector<ChunkRecord> chunks = {plain_chunk(0, "ab"), plain_chunk(1, "cde")};

    std::vector<std::vector<std::uint8_t>> parts;
    ASSERT_TRUE(Assembler::decode_chunks(chunks, 2, EncryptionMode::None, nullptr, parts));
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0], bytes_of("ab"));
    EXPECT_EQ(parts[1], bytes_of("cde"));
    EXPECT_EQ(Assembler::concatenate(parts), bytes_of("abcde"));
}

TEST_F(AssemblerTest, DecryptsSealedChunks) {
    std::vector<ChunkRecord> chunks = {sealed_chunk(1, "second half"), sealed_chunk(0, "first half, ")};

    std::vector<std::uint8_t> data;
    auto result = Assembler::assemble(chunks, 2, EncryptionMode::Sealed, &keys_, data);
    ASSERT_TRUE(result.success()) << result.message;
    EXPECT_EQ(std::string(data.begin(), data.end()), "first half, second half");
}

TEST_F(AssemblerTest, MissingChunksAreReported) {
    std::vector<ChunkRecord> chunks = {plain_chunk(0, "a"), plain_chunk(2, "c")};

    std::vector<std::uint8_t> data;
    auto result = Assembler::assemble(chunks, 3, EncryptionMode::None, nullptr, data);
    EXPECT_EQ(result.error, FetchError::CHUNK_COUNT_MISMATCH);
    EXPECT_EQ(result.message, "Missing chunks: got 2/3");
    EXPECT_TRUE(data.empty());

    // Right count, wrong indices
    chunks.push_back(plain_chunk(5, "f"));
    result = Assembler::assemble(chunks, 3, EncryptionMode::None, nullptr, data);
    EXPECT_EQ(result.error, FetchError::CHUNK_COUNT_MISMATCH);
}

TEST_F(AssemblerTest, SealedWithoutKeyFails) {
    std::vector<ChunkRecord> chunks = {sealed_chunk(0, "secret")};
    std::vector<std::uint8_t> data;

    EXPECT_EQ(Assembler::assemble(chunks, 1, EncryptionMode::Sealed, nullptr, data).error,
              FetchError::MISSING_SECRET_KEY);

    SealingKeys empty_keys;
    empty_keys.owner_key = owner_key_;
    EXPECT_EQ(Assembler::assemble(chunks, 1, EncryptionMode::Sealed, &empty_keys, data).error,
              FetchError::MISSING_SECRET_KEY);
}

TEST_F(AssemblerTest, OneBadChunkAbortsTheFile) {
    auto tampered = sealed_chunk(1, "middle");
    tampered.content[tampered.content.size() / 2] =
        tampered.content[tampered.content.size() / 2] == 'A' ? 'B' : 'A';

    std::vector<ChunkRecord> chunks = {sealed_chunk(0, "start"), tampered, sealed_chunk(2, "end")};

    std::vector<std::uint8_t> data;
    auto result = Assembler::assemble(chunks, 3, EncryptionMode::Sealed, &keys_, data);
    EXPECT_EQ(result.error, FetchError::DECRYPTION_FAILED);
    EXPECT_EQ(result.crypto_error, crypto::CryptoError::INVALID_MAC);
    EXPECT_NE(result.message.find("Chunk 1"), std::string::npos);
    EXPECT_TRUE(data.empty());
}

TEST_F(AssemblerTest, WrongSecretKeyFailsDecryption) {
    std::vector<ChunkRecord> chunks = {sealed_chunk(0, "secret")};

    crypto::SecureBytes other_secret(crypto::SECRET_KEY_SIZE);
    other_secret.data.back() = 2;
    SealingKeys wrong_keys;
    wrong_keys.secret_key = other_secret.span();
    wrong_keys.owner_key = owner_key_;

    std::vector<std::uint8_t> data;
    auto result = Assembler::assemble(chunks, 1, EncryptionMode::Sealed, &wrong_keys, data);
    EXPECT_EQ(result.error, FetchError::DECRYPTION_FAILED);
    EXPECT_EQ(result.crypto_error, crypto::CryptoError::INVALID_MAC);
}

TEST_F(AssemblerTest, PlainChunkMustBeBase64) {
    auto broken = plain_chunk(0, "abc");
    broken.content = "not base64!";

    std::vector<std::uint8_t> data;
    EXPECT_EQ(Assembler::assemble({broken}, 1, EncryptionMode::None, nullptr, data).error,
              FetchError::PARSE_ERROR);
}

TEST_F(AssemblerTest, EmptyFileAssemblesToNothing) {
    std::vector<std::uint8_t> data = {1, 2, 3};
    ASSERT_TRUE(Assembler::assemble({}, 0, EncryptionMode::None, nullptr, data));
    EXPECT_TRUE(data.empty());
}

}
