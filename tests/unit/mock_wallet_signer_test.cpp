// tests/unit/mock_wallet_signer_test.cpp
#include <gtest/gtest.h>
#include "host/MockWalletSigner.hpp"
#include "common/utils/encoding/Hex.hpp"
#include <vector>

using namespace wallet_link;
using namespace wallet_link::host;
using wallet_link::protocol::SigningOutcome;

namespace
{
    // SHA-256("")
    const char* kEmptySha256 = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
    // SHA-256("abc")
    const char* kAbcSha256 = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
}

class MockWalletSignerTest : public ::testing::Test {
protected:
    std::unique_ptr<MockWalletSigner> MakeSigner(MockSignerMode mode, int delay_ms = 0) {
        return std::make_unique<MockWalletSigner>(io_context, mode, std::chrono::milliseconds(delay_ms));
    }

    signer::SigningCompletion Collect() {
        return [this](const SigningOutcome& outcome) { outcomes.push_back(outcome); };
    }

    asio::io_context io_context;
    std::vector<SigningOutcome> outcomes;
};

TEST(MockWalletSignerDigestTest, Sha256KnownVectors) {
    EXPECT_EQ(utils::HexEncode(MockWalletSigner::Sha256(Bytes{})), kEmptySha256);
    EXPECT_EQ(utils::HexEncode(MockWalletSigner::Sha256(Bytes{ 'a', 'b', 'c' })), kAbcSha256);
}

TEST(MockWalletSignerDigestTest, PersonalMessagePrefix) {
    Bytes preimage = MockWalletSigner::PersonalMessagePreimage(Bytes{ 'a', 'b', 'c' });
    std::string expected = "\x19" "Ethereum Signed Message:\n3abc";
    EXPECT_EQ(std::string(preimage.begin(), preimage.end()), expected);
}

TEST(MockWalletSignerModeTest, ParsesConfigValues) {
    EXPECT_EQ(MockSignerModeFromString("approve"), MockSignerMode::APPROVE);
    EXPECT_EQ(MockSignerModeFromString("Reject"), MockSignerMode::REJECT);
    EXPECT_EQ(MockSignerModeFromString("watch-only"), MockSignerMode::WATCH_ONLY);
    EXPECT_FALSE(MockSignerModeFromString("maybe").has_value());
}

TEST_F(MockWalletSignerTest, CompletionIsDeferredUntilIoContextRuns) {
    auto signer = MakeSigner(MockSignerMode::APPROVE);
    signer->SignMessage(Bytes{ 'a', 'b', 'c' }, std::nullopt, Collect());

    EXPECT_TRUE(outcomes.empty());
    io_context.run();

    ASSERT_EQ(outcomes.size(), 1u);
    ASSERT_TRUE(outcomes[0].IsSuccess());
    EXPECT_EQ(utils::HexEncode(outcomes[0].SignedPayload()), kAbcSha256);
    EXPECT_EQ(signer->GetRequestCount(), 1u);
}

TEST_F(MockWalletSignerTest, PersonalMessageDigestsPrefixedPreimage) {
    auto signer = MakeSigner(MockSignerMode::APPROVE, 5);
    signer->SignPersonalMessage(Bytes{ 'h', 'i' }, std::nullopt, Collect());
    io_context.run();

    ASSERT_EQ(outcomes.size(), 1u);
    ASSERT_TRUE(outcomes[0].IsSuccess());
    EXPECT_EQ(outcomes[0].SignedPayload(),
              MockWalletSigner::Sha256(MockWalletSigner::PersonalMessagePreimage(Bytes{ 'h', 'i' })));
}

TEST_F(MockWalletSignerTest, TransactionDigestsItsJson) {
    auto signer = MakeSigner(MockSignerMode::APPROVE);
    protocol::Transaction tx{
        utils::BigInt::FromUInt64(1),
        utils::BigInt::FromUInt64(2),
        utils::BigInt::FromUInt64(21000),
        *protocol::Address::FromString("0x52908400098527886e0f7030069857d2e4169ee7"),
        utils::BigInt::FromUInt64(3),
        std::nullopt
    };

    signer->SignTransaction(tx, Collect());
    io_context.run();

    std::string json = tx.ToJson();
    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0].SignedPayload(), MockWalletSigner::Sha256(Bytes(json.begin(), json.end())));
}

TEST_F(MockWalletSignerTest, RejectAndWatchOnlyModesFail) {
    auto rejecting = MakeSigner(MockSignerMode::REJECT);
    auto watch_only = MakeSigner(MockSignerMode::WATCH_ONLY);

    rejecting->SignMessage(Bytes{ 0x01 }, std::nullopt, Collect());
    watch_only->SignMessage(Bytes{ 0x01 }, std::nullopt, Collect());
    io_context.run();

    ASSERT_EQ(outcomes.size(), 2u);
    EXPECT_FALSE(outcomes[0].IsSuccess());
    EXPECT_EQ(outcomes[0].Error(), WalletError::CANCELLED);
    EXPECT_FALSE(outcomes[1].IsSuccess());
    EXPECT_EQ(outcomes[1].Error(), WalletError::WATCH_ONLY);
}
