// src/host/MockWalletSigner.hpp
#pragma once
#include "signer/include/IWalletSigner.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <optional>
#include <string>

namespace wallet_link::host
{
    namespace asio = boost::asio;

    enum class MockSignerMode
    {
        APPROVE = 0,      // SHA-256 digest를 서명 결과로 반환
        REJECT = 1,       // 사용자 거절 (CANCELLED)
        WATCH_ONLY = 2    // 서명 불가 계정 (WATCH_ONLY)
    };

    // "approve" / "reject" / "watch-only" (대소문자 무시)
    std::optional<MockSignerMode> MockSignerModeFromString(const std::string& str);
    const char* MockSignerModeToString(MockSignerMode mode);

    /**
     * @brief 개발/데모용 서명자
     *
     * 실제 키 없이 SHA-256 digest를 "서명"으로 돌려준다.
     * 완료는 io_context 위의 steady_timer로 지연 전달되므로 run()을 돌려야 도착함.
     */
    class MockWalletSigner : public signer::IWalletSigner
    {
    public:
        MockWalletSigner(asio::io_context& io_context, MockSignerMode mode, std::chrono::milliseconds delay);
        ~MockWalletSigner() override = default;

        void SignMessage(
            const Bytes& message,
            const std::optional<protocol::Address>& address,
            signer::SigningCompletion on_complete
        ) override;

        void SignPersonalMessage(
            const Bytes& message,
            const std::optional<protocol::Address>& address,
            signer::SigningCompletion on_complete
        ) override;

        void SignTransaction(
            const protocol::Transaction& transaction,
            signer::SigningCompletion on_complete
        ) override;

        MockSignerMode GetMode() const { return mode_; }
        size_t GetRequestCount() const { return request_count_.load(); }

        // "\x19Ethereum Signed Message:\n" + 10진 길이 + message
        static Bytes PersonalMessagePreimage(const Bytes& message);

        // OpenSSL EVP SHA-256, 실패 시 std::runtime_error
        static Bytes Sha256(const Bytes& data);

    private:
        void Complete(const Bytes& preimage, signer::SigningCompletion on_complete);

        asio::io_context& io_context_;
        MockSignerMode mode_;
        std::chrono::milliseconds delay_;
        std::atomic<size_t> request_count_{0};
    };

} // namespace wallet_link::host
