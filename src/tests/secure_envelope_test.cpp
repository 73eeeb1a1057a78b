#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <memory>
#include "crypto/secure_envelope.hpp"
#include "test_utils.hpp"

using namespace vault::crypto;
using ::testing::_;
using ::testing::Return;

class MockCipher : public Cipher {
public:
    MOCK_METHOD(std::string, encrypt, (const std::string& plaintext), (const, override));
    MOCK_METHOD(std::string, decrypt, (const std::string& envelope), (const, override));
};

class SecureEnvelopeTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_logging();
    }

    std::shared_ptr<AesGcmCipher> real_cipher = std::make_shared<AesGcmCipher>("envelope-key", 1000);
};

TEST_F(SecureEnvelopeTest, PlaintextSealing) {
    SecureEnvelope envelope;
    auto sealed = envelope.seal(R"({"a":1})");

    EXPECT_TRUE(Integrity::has_integrity(sealed));
    EXPECT_NE(sealed.find("plaintext:"), std::string::npos);
    EXPECT_EQ(envelope.inspect(sealed), SecureEnvelope::Format::Plaintext);
    EXPECT_EQ(envelope.open(sealed), R"({"a":1})");
}

TEST_F(SecureEnvelopeTest, EncryptedSealing) {
    SecureEnvelope envelope(real_cipher);
    auto sealed = envelope.seal(R"({"secret":"value"})");

    EXPECT_TRUE(Integrity::has_integrity(sealed));
    EXPECT_EQ(sealed.find("secret"), std::string::npos);
    EXPECT_TRUE(envelope.is_encrypted(sealed));
    EXPECT_EQ(envelope.open(sealed), R"({"secret":"value"})");
}

TEST_F(SecureEnvelopeTest, ReadsLegacyLayouts) {
    SecureEnvelope plain;
    EXPECT_EQ(plain.open(R"({"legacy":true})"), R"({"legacy":true})");
    EXPECT_EQ(plain.inspect(R"({"legacy":true})"), SecureEnvelope::Format::Raw);
    EXPECT_EQ(plain.open("plaintext:[1,2]"), "[1,2]");

    // Cipher envelope without the integrity layer
    SecureEnvelope encrypted(real_cipher);
    EXPECT_EQ(encrypted.open(real_cipher->encrypt("[3]")), "[3]");
}

TEST_F(SecureEnvelopeTest, EncryptedRecordWithoutKey) {
    SecureEnvelope encrypted(real_cipher);
    auto sealed = encrypted.seal("{}");

    SecureEnvelope plain;
    EXPECT_THROW(plain.open(sealed), KeyUnavailableError);
}

TEST_F(SecureEnvelopeTest, WrongKeyFailsAuthentication) {
    auto sealed = SecureEnvelope(real_cipher).seal("{}");
    SecureEnvelope other(std::make_shared<AesGcmCipher>("different-key", 1000));
    EXPECT_THROW(other.open(sealed), AuthenticationError);
}

// Corruption must be reported by the integrity layer before any decryption attempt
TEST_F(SecureEnvelopeTest, IntegrityCheckedBeforeDecryption) {
    auto mock = std::make_shared<MockCipher>();
    const std::string fake_envelope =
        "aes256gcm:" + std::string(64, 'a') + ":" + std::string(24, 'b') + ":" + std::string(32, 'c') + ":abcd";
    EXPECT_CALL(*mock, encrypt(_)).WillOnce(Return(fake_envelope));
    EXPECT_CALL(*mock, decrypt(_)).Times(0);

    SecureEnvelope envelope(mock);
    auto sealed = envelope.seal("{}");

    // Flip one character of the ciphertext inside the wrapped envelope
    sealed.back() = sealed.back() == 'd' ? 'e' : 'd';
    EXPECT_THROW(envelope.open(sealed), IntegrityError);
}

TEST_F(SecureEnvelopeTest, DecryptsAfterIntegrityPasses) {
    auto mock = std::make_shared<MockCipher>();
    EXPECT_CALL(*mock, encrypt("{}")).WillOnce(Return("aes256gcm:stub"));
    EXPECT_CALL(*mock, decrypt("aes256gcm:stub")).WillOnce(Return("{}"));

    SecureEnvelope envelope(mock);
    EXPECT_EQ(envelope.open(envelope.seal("{}")), "{}");
}

TEST_F(SecureEnvelopeTest, FormatNames) {
    EXPECT_STREQ(to_string(SecureEnvelope::Format::Raw), "raw");
    EXPECT_STREQ(to_string(SecureEnvelope::Format::Plaintext), "plaintext");
    EXPECT_STREQ(to_string(SecureEnvelope::Format::Encrypted), "encrypted");
}
