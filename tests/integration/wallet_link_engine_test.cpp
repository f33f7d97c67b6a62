// tests/integration/wallet_link_engine_test.cpp
#include <gtest/gtest.h>
#include "engine/WalletLinkEngine.hpp"
#include "host/MockWalletSigner.hpp"
#include "common/utils/encoding/Base64.hpp"
#include "common/url/include/UrlComponents.hpp"
#include "support/FakeWalletSigner.hpp"
#include "support/RecordingUrlLauncher.hpp"

using namespace wallet_link;
using namespace wallet_link::engine;
using wallet_link::protocol::SigningOutcome;
using wallet_link::test::FakeWalletSigner;
using wallet_link::test::RecordingUrlLauncher;

namespace
{
    const std::string kTo = "0x52908400098527886e0f7030069857d2e4169ee7";
}

// ========== 테스트 Fixture ==========

class WalletLinkEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        signer = std::make_shared<FakeWalletSigner>();
        launcher = std::make_shared<RecordingUrlLauncher>();
        engine = std::make_unique<WalletLinkEngine>(signer, launcher);
    }

    std::shared_ptr<FakeWalletSigner> signer;
    std::shared_ptr<RecordingUrlLauncher> launcher;
    std::unique_ptr<WalletLinkEngine> engine;
};

TEST_F(WalletLinkEngineTest, SignMessageRoundTripToCallback) {
    ASSERT_TRUE(engine->HandleOpenUrl("scheme://sign-message?message=aGVsbG8=&callback=app://cb"));

    ASSERT_EQ(signer->Calls().size(), 1u);
    EXPECT_EQ(signer->Calls()[0].method, "SignMessage");
    EXPECT_EQ(signer->Calls()[0].message, (Bytes{ 'h', 'e', 'l', 'l', 'o' }));
    EXPECT_FALSE(signer->Calls()[0].address.has_value());

    signer->CompleteLast(SigningOutcome::Success(Bytes{ 0x01, 0x02 }));

    auto urls = launcher->Urls();
    ASSERT_EQ(urls.size(), 1u);
    EXPECT_EQ(urls[0], "app://cb?result=AQI=");
}

TEST_F(WalletLinkEngineTest, ResultSurvivesBase64RoundTrip) {
    Bytes signature;
    for (int i = 0; i < 65; ++i) {
        signature.push_back(static_cast<uint8_t>(i * 37 + 251));
    }

    ASSERT_TRUE(engine->HandleOpenUrl("scheme://sign-personal-message?message=aGk=&callback=app://cb"));
    signer->CompleteLast(SigningOutcome::Success(signature));

    ASSERT_EQ(launcher->Count(), 1u);
    auto callback = url::UrlComponents::Parse(launcher->Urls()[0]);
    ASSERT_TRUE(callback.has_value());

    auto result = callback->QueryValue("result");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(utils::Base64Decode(*result), std::optional<Bytes>(signature));
}

TEST_F(WalletLinkEngineTest, MissingTransactionFieldsReportInvalidRequest) {
    DispatchResult result = engine->Handle("scheme://sign-transaction?callback=app://cb");
    EXPECT_TRUE(result.accepted);
    EXPECT_EQ(result.error, WalletError::INVALID_REQUEST);

    auto urls = launcher->Urls();
    ASSERT_EQ(urls.size(), 1u);
    EXPECT_EQ(urls[0], "app://cb?error=invalidRequest");
    EXPECT_TRUE(signer->Calls().empty());
}

TEST_F(WalletLinkEngineTest, UnknownOperationIsNotClaimed) {
    EXPECT_FALSE(engine->HandleOpenUrl("scheme://unknown-op?x=1"));
    EXPECT_FALSE(engine->HandleOpenUrl("not a url"));
    EXPECT_TRUE(signer->Calls().empty());
    EXPECT_EQ(launcher->Count(), 0u);
}

TEST_F(WalletLinkEngineTest, TransactionWithoutNonceUsesZero) {
    ASSERT_TRUE(engine->HandleOpenUrl(
        "scheme://sign-transaction?gasPrice=1&gasLimit=21000&to=" + kTo + "&amount=5&callback=app://cb"));

    ASSERT_EQ(signer->Calls().size(), 1u);
    ASSERT_TRUE(signer->Calls()[0].transaction.has_value());
    EXPECT_TRUE(signer->Calls()[0].transaction->nonce.IsZero());

    signer->CompleteLast(SigningOutcome::Failure(WalletError::UNSUPPORTED_ADDRESS));
    auto urls = launcher->Urls();
    ASSERT_EQ(urls.size(), 1u);
    EXPECT_EQ(urls[0], "app://cb?error=unsupportedAddress");
}

TEST_F(WalletLinkEngineTest, NoSignerMeansNoCallbackActivity) {
    signer.reset();
    EXPECT_FALSE(engine->HasSigner());

    EXPECT_FALSE(engine->HandleOpenUrl("scheme://sign-message?message=aGk=&callback=app://cb"));
    EXPECT_FALSE(engine->HandleOpenUrl("scheme://sign-transaction?callback=app://cb"));
    EXPECT_EQ(launcher->Count(), 0u);
}

TEST_F(WalletLinkEngineTest, SignerDroppedBeforeCompletionNeverCallsBack) {
    ASSERT_TRUE(engine->HandleOpenUrl("scheme://sign-message?message=aGk=&callback=app://cb"));
    signer.reset();
    EXPECT_EQ(launcher->Count(), 0u);
}

TEST(WalletLinkEngineOptionsTest, NumericErrorFormat) {
    auto signer = std::make_shared<FakeWalletSigner>();
    auto launcher = std::make_shared<RecordingUrlLauncher>();

    EngineOptions options;
    options.error_format = ErrorCodeFormat::NUMERIC;
    WalletLinkEngine engine(signer, launcher, options);

    EXPECT_TRUE(engine.HandleOpenUrl("scheme://sign-message?callback=app://cb"));
    ASSERT_EQ(launcher->Count(), 1u);
    EXPECT_EQ(launcher->Urls()[0], "app://cb?error=1");
}

// ========== MockWalletSigner + io_context ==========

TEST(WalletLinkEngineHostTest, MockSignerDeliversThroughIoContext) {
    host::asio::io_context io_context;
    auto signer = std::make_shared<host::MockWalletSigner>(
        io_context, host::MockSignerMode::APPROVE, std::chrono::milliseconds(1));
    auto launcher = std::make_shared<RecordingUrlLauncher>();
    WalletLinkEngine engine(signer, launcher);

    ASSERT_TRUE(engine.HandleOpenUrl("scheme://sign-message?message=YWJj&callback=app://cb?session%3D9"));
    ASSERT_TRUE(engine.HandleOpenUrl("scheme://sign-personal-message?message=YWJj"));
    EXPECT_EQ(launcher->Count(), 0u);

    io_context.run();

    auto urls = launcher->Urls();
    ASSERT_EQ(urls.size(), 1u);

    auto callback = url::UrlComponents::Parse(urls[0]);
    ASSERT_TRUE(callback.has_value());
    EXPECT_EQ(callback->QueryValue("session"), std::optional<std::string>("9"));

    auto result = callback->QueryValue("result");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(utils::Base64Decode(*result), std::optional<Bytes>(host::MockWalletSigner::Sha256(Bytes{ 'a', 'b', 'c' })));
}

TEST(WalletLinkEngineHostTest, RejectingSignerReportsCancelled) {
    host::asio::io_context io_context;
    auto signer = std::make_shared<host::MockWalletSigner>(
        io_context, host::MockSignerMode::REJECT, std::chrono::milliseconds(0));
    auto launcher = std::make_shared<RecordingUrlLauncher>();
    WalletLinkEngine engine(signer, launcher);

    ASSERT_TRUE(engine.HandleOpenUrl("scheme://sign-message?message=YWJj&callback=app://cb"));
    io_context.run();

    auto urls = launcher->Urls();
    ASSERT_EQ(urls.size(), 1u);
    EXPECT_EQ(urls[0], "app://cb?error=cancelled");
}
