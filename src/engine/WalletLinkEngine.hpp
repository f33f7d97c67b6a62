// src/engine/WalletLinkEngine.hpp
#pragma once
#include "engine/dispatcher/include/CommandDispatcher.hpp"
#include "engine/encoder/include/ResultEncoder.hpp"
#include "launcher/include/IUrlLauncher.hpp"
#include "signer/include/IWalletSigner.hpp"
#include <memory>
#include <string>

namespace wallet_link::engine
{
    struct EngineOptions
    {
        ErrorCodeFormat error_format = ErrorCodeFormat::SYMBOLIC;
    };

    /**
     * @brief 인바운드 URL 진입점
     *
     * Parse → Dispatch → (비동기) 서명 완료 → 콜백 URL 전달.
     * 단일 스레드에서 호출하는 것을 전제로 하며, 서명 완료는 임의 스레드에서 와도 됨.
     */
    class WalletLinkEngine
    {
    public:
        WalletLinkEngine(
            std::weak_ptr<signer::IWalletSigner> signer,
            std::shared_ptr<launcher::IUrlLauncher> launcher,
            EngineOptions options = {}
        );
        ~WalletLinkEngine() = default;

        WalletLinkEngine(const WalletLinkEngine&) = delete;
        WalletLinkEngine& operator=(const WalletLinkEngine&) = delete;

        /**
         * @brief URL 처리
         * @return 엔진이 URL을 받아들였는지 (서명자가 없거나 인식하지 못한 URL이면 false)
         */
        bool HandleOpenUrl(const std::string& url);

        /**
         * @brief URL 처리 (accepted + 동기 에러)
         */
        DispatchResult Handle(const std::string& url);

        void SetSigner(std::weak_ptr<signer::IWalletSigner> signer);
        bool HasSigner() const;

    private:
        std::shared_ptr<ResultEncoder> encoder_;
        CommandDispatcher dispatcher_;
    };

} // namespace wallet_link::engine
