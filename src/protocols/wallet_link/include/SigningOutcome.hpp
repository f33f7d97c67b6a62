// src/protocols/wallet_link/include/SigningOutcome.hpp
#pragma once
#include "types/BasicTypes.hpp"
#include "types/WalletError.hpp"
#include <utility>

namespace wallet_link::protocol
{
    /**
     * @brief 서명자가 명령 하나에 대해 돌려주는 결과
     *
     * 성공: 서명된 페이로드, 실패: WalletError
     */
    class SigningOutcome
    {
    public:
        static SigningOutcome Success(Bytes signed_payload) {
            return SigningOutcome(true, std::move(signed_payload), WalletError::NONE);
        }

        static SigningOutcome Failure(WalletError error) {
            return SigningOutcome(false, Bytes{}, error);
        }

        bool IsSuccess() const { return success_; }
        const Bytes& SignedPayload() const { return signed_payload_; }
        WalletError Error() const { return error_; }

    private:
        SigningOutcome(bool success, Bytes payload, WalletError error)
            : success_(success), signed_payload_(std::move(payload)), error_(error) {}

        bool success_;
        Bytes signed_payload_;
        WalletError error_;
    };

} // namespace wallet_link::protocol
