// src/engine/WalletLinkEngine.cpp
#include "engine/WalletLinkEngine.hpp"
#include "engine/parser/include/CommandParser.hpp"
#include "common/utils/logger/Logger.hpp"

namespace wallet_link::engine
{
    WalletLinkEngine::WalletLinkEngine(
        std::weak_ptr<signer::IWalletSigner> signer,
        std::shared_ptr<launcher::IUrlLauncher> launcher,
        EngineOptions options
    )
        : encoder_(std::make_shared<ResultEncoder>(std::move(launcher), options.error_format))
        , dispatcher_(std::move(signer), encoder_)
    {
    }

    bool WalletLinkEngine::HandleOpenUrl(const std::string& url)
    {
        return Handle(url).accepted;
    }

    DispatchResult WalletLinkEngine::Handle(const std::string& url)
    {
        ParseResult parsed = CommandParser::Parse(url);

        if (!parsed.IsHandled()) {
            LOG_DEBUG("WalletLinkEngine", "URL not handled");
            return DispatchResult{};
        }

        LOG_INFOF("WalletLinkEngine", "Received %s (%s)",
            CommandTypeToHost(parsed.type), ParseStatusToString(parsed.status));

        DispatchResult result = dispatcher_.Dispatch(parsed);

        LOG_DEBUGF("WalletLinkEngine", "accepted=%d error=%s",
            result.accepted ? 1 : 0, WalletErrorToString(result.error));
        return result;
    }

    void WalletLinkEngine::SetSigner(std::weak_ptr<signer::IWalletSigner> signer)
    {
        dispatcher_.SetSigner(std::move(signer));
    }

    bool WalletLinkEngine::HasSigner() const
    {
        return dispatcher_.HasSigner();
    }

} // namespace wallet_link::engine
