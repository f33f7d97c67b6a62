// src/engine/encoder/include/ResultEncoder.hpp
#pragma once
#include "launcher/include/IUrlLauncher.hpp"
#include "protocols/wallet_link/include/SigningOutcome.hpp"
#include "types/BasicTypes.hpp"
#include "types/WalletError.hpp"
#include <memory>
#include <optional>
#include <string>

namespace wallet_link::engine
{
    enum class ErrorCodeFormat
    {
        SYMBOLIC = 0,   // error=invalidRequest
        NUMERIC = 1     // error=1
    };

    // "symbolic" / "numeric" (대소문자 무시)
    std::optional<ErrorCodeFormat> ErrorCodeFormatFromString(const std::string& str);

    /**
     * @brief 서명 결과를 콜백 URL로 변환하여 런처로 전달
     *
     * 콜백의 기존 쿼리 뒤에 result=<base64> 또는 error=<code> 하나를 추가.
     * 콜백을 다시 파싱할 수 없으면 아무것도 하지 않음 (경고 로그).
     * 런처 예외는 로그만 남기고 전파하지 않음.
     */
    class ResultEncoder
    {
    public:
        explicit ResultEncoder(
            std::shared_ptr<launcher::IUrlLauncher> launcher,
            ErrorCodeFormat error_format = ErrorCodeFormat::SYMBOLIC
        );

        std::optional<std::string> BuildSuccessUrl(const std::string& callback, const Bytes& signed_payload) const;
        std::optional<std::string> BuildFailureUrl(const std::string& callback, WalletError error) const;

        void SendSuccess(const std::string& callback, const Bytes& signed_payload) const;
        void SendFailure(const std::string& callback, WalletError error) const;
        void SendOutcome(const std::string& callback, const protocol::SigningOutcome& outcome) const;

        ErrorCodeFormat GetErrorFormat() const { return error_format_; }

    private:
        std::optional<std::string> BuildUrl(const std::string& callback, const char* name, const std::string& value) const;
        std::string EncodeError(WalletError error) const;
        void Launch(const std::string& url) const;

        std::shared_ptr<launcher::IUrlLauncher> launcher_;
        ErrorCodeFormat error_format_;
    };

} // namespace wallet_link::engine
