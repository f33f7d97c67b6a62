// src/host/MockWalletSigner.cpp
#include "host/MockWalletSigner.hpp"
#include "common/utils/logger/Logger.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <memory>
#include <stdexcept>

namespace wallet_link::host
{
    using protocol::SigningOutcome;

    std::optional<MockSignerMode> MockSignerModeFromString(const std::string& str)
    {
        std::string lower = str;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return std::tolower(c); });

        if (lower == "approve") return MockSignerMode::APPROVE;
        if (lower == "reject") return MockSignerMode::REJECT;
        if (lower == "watch-only") return MockSignerMode::WATCH_ONLY;
        return std::nullopt;
    }

    const char* MockSignerModeToString(MockSignerMode mode)
    {
        switch (mode) {
            case MockSignerMode::APPROVE:
                return "approve";
            case MockSignerMode::REJECT:
                return "reject";
            case MockSignerMode::WATCH_ONLY:
                return "watch-only";
            default:
                return "unknown";
        }
    }

    MockWalletSigner::MockWalletSigner(asio::io_context& io_context, MockSignerMode mode, std::chrono::milliseconds delay)
        : io_context_(io_context)
        , mode_(mode)
        , delay_(delay)
    {
        LOG_INFOF("MockWalletSigner", "Mode: %s, delay: %lld ms",
            MockSignerModeToString(mode_), static_cast<long long>(delay_.count()));
    }

    void MockWalletSigner::SignMessage(
        const Bytes& message,
        const std::optional<protocol::Address>& address,
        signer::SigningCompletion on_complete)
    {
        LOG_INFOF("MockWalletSigner", "SignMessage: %zu bytes, account %s",
            message.size(), address ? address->ToString().c_str() : "(default)");
        Complete(message, std::move(on_complete));
    }

    void MockWalletSigner::SignPersonalMessage(
        const Bytes& message,
        const std::optional<protocol::Address>& address,
        signer::SigningCompletion on_complete)
    {
        LOG_INFOF("MockWalletSigner", "SignPersonalMessage: %zu bytes, account %s",
            message.size(), address ? address->ToString().c_str() : "(default)");
        Complete(PersonalMessagePreimage(message), std::move(on_complete));
    }

    void MockWalletSigner::SignTransaction(
        const protocol::Transaction& transaction,
        signer::SigningCompletion on_complete)
    {
        LOG_INFOF("MockWalletSigner", "SignTransaction: to %s, nonce %s, %zu data bytes",
            transaction.to.ToString().c_str(), transaction.nonce.ToDecimalString().c_str(),
            transaction.payload ? transaction.payload->size() : static_cast<size_t>(0));

        std::string json = transaction.ToJson();
        Complete(Bytes(json.begin(), json.end()), std::move(on_complete));
    }

    Bytes MockWalletSigner::PersonalMessagePreimage(const Bytes& message)
    {
        std::string prefix = "\x19" "Ethereum Signed Message:\n" + std::to_string(message.size());

        Bytes preimage(prefix.begin(), prefix.end());
        preimage.insert(preimage.end(), message.begin(), message.end());
        return preimage;
    }

    Bytes MockWalletSigner::Sha256(const Bytes& data)
    {
        Bytes digest(EVP_MAX_MD_SIZE);
        unsigned int digest_len = 0;

        if (EVP_Digest(data.data(), data.size(), digest.data(), &digest_len, EVP_sha256(), nullptr) != 1) {
            throw std::runtime_error("MockWalletSigner: SHA-256 failed");
        }

        digest.resize(digest_len);
        return digest;
    }

    void MockWalletSigner::Complete(const Bytes& preimage, signer::SigningCompletion on_complete)
    {
        request_count_.fetch_add(1);

        std::optional<SigningOutcome> outcome;
        switch (mode_) {
            case MockSignerMode::APPROVE:
                outcome = SigningOutcome::Success(Sha256(preimage));
                break;
            case MockSignerMode::REJECT:
                outcome = SigningOutcome::Failure(WalletError::CANCELLED);
                break;
            case MockSignerMode::WATCH_ONLY:
                outcome = SigningOutcome::Failure(WalletError::WATCH_ONLY);
                break;
        }

        if (!outcome) {
            throw std::logic_error("MockWalletSigner: unhandled mode");
        }

        auto timer = std::make_shared<asio::steady_timer>(io_context_, delay_);
        timer->async_wait([timer, outcome = *outcome, on_complete = std::move(on_complete)](const boost::system::error_code& ec) {
            if (ec) {
                LOG_WARNF("MockWalletSigner", "Completion timer cancelled: %s", ec.message().c_str());
                return;
            }
            on_complete(outcome);
        });
    }

} // namespace wallet_link::host
