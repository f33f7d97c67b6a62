// src/signer/include/IWalletSigner.hpp
#pragma once
#include "protocols/wallet_link/include/Address.hpp"
#include "protocols/wallet_link/include/SigningOutcome.hpp"
#include "protocols/wallet_link/include/Transaction.hpp"
#include "types/BasicTypes.hpp"
#include <functional>
#include <optional>

namespace wallet_link::signer
{
    /**
     * @brief 서명 완료 핸들러
     *
     * 서명자는 요청당 정확히 한 번 호출해야 하며, 호출 스레드는 서명자가 결정합니다.
     */
    using SigningCompletion = std::function<void(const protocol::SigningOutcome&)>;

    /**
     * @brief 지갑 서명자 인터페이스
     *
     * 실제 키 관리와 서명은 호스트 애플리케이션이 구현합니다.
     * 모든 메서드는 즉시 반환하고 결과는 on_complete로 전달합니다.
     */
    class IWalletSigner
    {
    public:
        virtual ~IWalletSigner() = default;

        /**
         * @brief 원본 메시지 서명
         *
         * @param message 서명할 메시지 (base64 디코딩된 바이트)
         * @param address 서명 계정 (없으면 서명자 기본 계정)
         * @param on_complete 결과 핸들러
         */
        virtual void SignMessage(
            const Bytes& message,
            const std::optional<protocol::Address>& address,
            SigningCompletion on_complete
        ) = 0;

        /**
         * @brief personal_sign 메시지 서명 (접두사 부착은 서명자 책임)
         */
        virtual void SignPersonalMessage(
            const Bytes& message,
            const std::optional<protocol::Address>& address,
            SigningCompletion on_complete
        ) = 0;

        /**
         * @brief 트랜잭션 서명
         *
         * @param transaction 모든 필드가 채워진 트랜잭션
         * @param on_complete 결과 핸들러 (성공 시 서명된 RLP 등)
         */
        virtual void SignTransaction(
            const protocol::Transaction& transaction,
            SigningCompletion on_complete
        ) = 0;
    };

} // namespace wallet_link::signer
