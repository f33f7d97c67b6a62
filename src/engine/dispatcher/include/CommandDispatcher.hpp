// src/engine/dispatcher/include/CommandDispatcher.hpp
#pragma once
#include "engine/encoder/include/ResultEncoder.hpp"
#include "engine/parser/include/CommandParser.hpp"
#include "signer/include/IWalletSigner.hpp"
#include "types/CommandType.hpp"
#include "types/WalletError.hpp"
#include <array>
#include <functional>
#include <memory>

namespace wallet_link::engine
{
    /**
     * @brief Dispatch 결과
     *
     * accepted: 엔진이 URL을 처리했는지 (HandleOpenUrl 반환값)
     * error: 동기적으로 확정된 실패 (INVALID_REQUEST) 또는 NONE
     */
    struct DispatchResult
    {
        bool accepted = false;
        WalletError error = WalletError::NONE;
    };

    /**
     * @brief 파싱된 명령을 서명자에게 전달하고 완료를 ResultEncoder로 연결
     *
     * 서명자는 weak_ptr로 보관. 호출 시점에 만료되어 있으면 명령을 받지 않음.
     * 명령 타입별 핸들러는 생성 시 고정 테이블에 등록.
     */
    class CommandDispatcher
    {
    public:
        using HandlerFunction = std::function<void(
            signer::IWalletSigner&,
            const protocol::Command&,
            signer::SigningCompletion
        )>;

        CommandDispatcher(std::weak_ptr<signer::IWalletSigner> signer, std::shared_ptr<ResultEncoder> encoder);
        ~CommandDispatcher() = default;

        CommandDispatcher(const CommandDispatcher&) = delete;
        CommandDispatcher& operator=(const CommandDispatcher&) = delete;

        DispatchResult Dispatch(const ParseResult& parsed);

        void SetSigner(std::weak_ptr<signer::IWalletSigner> signer);
        bool HasSigner() const;

    private:
        static void HandleSignMessage(signer::IWalletSigner& wallet_signer, const protocol::Command& command, signer::SigningCompletion on_complete);
        static void HandleSignPersonalMessage(signer::IWalletSigner& wallet_signer, const protocol::Command& command, signer::SigningCompletion on_complete);
        static void HandleSignTransaction(signer::IWalletSigner& wallet_signer, const protocol::Command& command, signer::SigningCompletion on_complete);

        signer::SigningCompletion MakeCompletion(CommandType type, const std::optional<std::string>& callback) const;

        std::weak_ptr<signer::IWalletSigner> signer_;
        std::shared_ptr<ResultEncoder> encoder_;

        std::array<HandlerFunction, static_cast<size_t>(CommandType::MAX_COMMAND_TYPE)> handlers_{};
    };

} // namespace wallet_link::engine
