// tests/unit/result_encoder_test.cpp
#include <gtest/gtest.h>
#include "engine/encoder/include/ResultEncoder.hpp"
#include "support/RecordingUrlLauncher.hpp"

using namespace wallet_link;
using namespace wallet_link::engine;
using wallet_link::protocol::SigningOutcome;
using wallet_link::test::RecordingUrlLauncher;

class ResultEncoderTest : public ::testing::Test {
protected:
    void SetUp() override {
        launcher = std::make_shared<RecordingUrlLauncher>();
        encoder = std::make_unique<ResultEncoder>(launcher);
    }

    std::shared_ptr<RecordingUrlLauncher> launcher;
    std::unique_ptr<ResultEncoder> encoder;
};

TEST_F(ResultEncoderTest, SuccessAppendsBase64Result) {
    EXPECT_EQ(encoder->BuildSuccessUrl("app://cb", Bytes{ 0x01, 0x02 }),
              std::optional<std::string>("app://cb?result=AQI="));
}

TEST_F(ResultEncoderTest, ResultIsAppendedAfterExistingQueryAndBeforeFragment) {
    EXPECT_EQ(encoder->BuildSuccessUrl("app://cb/done?session=7#top", Bytes{ 0x01, 0x02 }),
              std::optional<std::string>("app://cb/done?session=7&result=AQI=#top"));
}

TEST_F(ResultEncoderTest, PlusInBase64IsPercentEncoded) {
    EXPECT_EQ(encoder->BuildSuccessUrl("app://cb", Bytes{ 0xfb, 0xff }),
              std::optional<std::string>("app://cb?result=%2B/8="));
}

TEST_F(ResultEncoderTest, EmptyPayloadProducesEmptyResult) {
    EXPECT_EQ(encoder->BuildSuccessUrl("app://cb", Bytes{}),
              std::optional<std::string>("app://cb?result="));
}

TEST_F(ResultEncoderTest, FailureUsesSymbolicCodeByDefault) {
    EXPECT_EQ(encoder->BuildFailureUrl("app://cb", WalletError::INVALID_REQUEST),
              std::optional<std::string>("app://cb?error=invalidRequest"));
    EXPECT_EQ(encoder->BuildFailureUrl("app://cb", WalletError::WATCH_ONLY),
              std::optional<std::string>("app://cb?error=watchOnly"));
}

TEST_F(ResultEncoderTest, NumericFormatUsesStableCodes) {
    ResultEncoder numeric(launcher, ErrorCodeFormat::NUMERIC);
    EXPECT_EQ(numeric.BuildFailureUrl("app://cb", WalletError::CANCELLED),
              std::optional<std::string>("app://cb?error=3"));
    EXPECT_EQ(numeric.BuildFailureUrl("app://cb", WalletError::UNKNOWN),
              std::optional<std::string>("app://cb?error=0"));
}

TEST_F(ResultEncoderTest, NoneErrorIsEncodedAsUnknown) {
    EXPECT_EQ(encoder->BuildFailureUrl("app://cb", WalletError::NONE),
              std::optional<std::string>("app://cb?error=unknown"));
}

TEST_F(ResultEncoderTest, UnparsableCallbackIsSilentNoOp) {
    EXPECT_FALSE(encoder->BuildSuccessUrl("app://c b", Bytes{ 0x01 }).has_value());

    encoder->SendSuccess("app://c b", Bytes{ 0x01 });
    encoder->SendFailure("", WalletError::CANCELLED);
    EXPECT_EQ(launcher->Count(), 0u);
}

TEST_F(ResultEncoderTest, SendOutcomeLaunchesExactlyOneUrl) {
    encoder->SendOutcome("app://cb", SigningOutcome::Success(Bytes{ 0x01, 0x02 }));
    encoder->SendOutcome("app://cb", SigningOutcome::Failure(WalletError::SIGNING_FAILED));

    auto urls = launcher->Urls();
    ASSERT_EQ(urls.size(), 2u);
    EXPECT_EQ(urls[0], "app://cb?result=AQI=");
    EXPECT_EQ(urls[1], "app://cb?error=signingFailed");
}

TEST_F(ResultEncoderTest, LauncherExceptionIsContained) {
    launcher->fail_with = "no handler for scheme";
    EXPECT_NO_THROW(encoder->SendFailure("app://cb", WalletError::CANCELLED));
    EXPECT_EQ(launcher->Count(), 1u);
}

TEST(ResultEncoderConstructionTest, NullLauncherIsRejected) {
    EXPECT_THROW(ResultEncoder(nullptr), std::invalid_argument);
}

TEST(ErrorCodeFormatTest, ParsesConfigValues) {
    EXPECT_EQ(ErrorCodeFormatFromString("symbolic"), ErrorCodeFormat::SYMBOLIC);
    EXPECT_EQ(ErrorCodeFormatFromString("NUMERIC"), ErrorCodeFormat::NUMERIC);
    EXPECT_FALSE(ErrorCodeFormatFromString("binary").has_value());
}
