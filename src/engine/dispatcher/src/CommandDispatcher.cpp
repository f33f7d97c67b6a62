// src/engine/dispatcher/src/CommandDispatcher.cpp
#include "engine/dispatcher/include/CommandDispatcher.hpp"
#include "engine/dispatcher/include/OneShotCompletion.hpp"
#include "common/utils/logger/Logger.hpp"
#include <stdexcept>

namespace wallet_link::engine
{
    using namespace wallet_link::protocol;

    CommandDispatcher::CommandDispatcher(std::weak_ptr<signer::IWalletSigner> signer, std::shared_ptr<ResultEncoder> encoder)
        : signer_(std::move(signer))
        , encoder_(std::move(encoder))
    {
        if (!encoder_) {
            throw std::invalid_argument("CommandDispatcher: encoder is null");
        }

        // Handler 등록
        handlers_[static_cast<size_t>(CommandType::SIGN_MESSAGE)] = HandleSignMessage;
        handlers_[static_cast<size_t>(CommandType::SIGN_PERSONAL_MESSAGE)] = HandleSignPersonalMessage;
        handlers_[static_cast<size_t>(CommandType::SIGN_TRANSACTION)] = HandleSignTransaction;
    }

    void CommandDispatcher::SetSigner(std::weak_ptr<signer::IWalletSigner> signer)
    {
        signer_ = std::move(signer);
    }

    bool CommandDispatcher::HasSigner() const
    {
        return !signer_.expired();
    }

    DispatchResult CommandDispatcher::Dispatch(const ParseResult& parsed)
    {
        if (!parsed.IsHandled()) {
            return DispatchResult{};
        }

        std::shared_ptr<signer::IWalletSigner> active_signer = signer_.lock();
        if (!active_signer) {
            LOG_WARNF("CommandDispatcher", "%s: no signer attached, ignoring", CommandTypeToHost(parsed.type));
            return DispatchResult{};
        }

        if (parsed.status == ParseStatus::INVALID_REQUEST) {
            if (parsed.callback) {
                encoder_->SendFailure(*parsed.callback, WalletError::INVALID_REQUEST);
            } else {
                LOG_INFOF("CommandDispatcher", "%s: invalid request without callback", CommandTypeToHost(parsed.type));
            }
            return DispatchResult{ true, WalletError::INVALID_REQUEST };
        }

        size_t index = static_cast<size_t>(parsed.type);

        // PARSED면 command와 핸들러가 항상 존재
        if (!parsed.command || index >= handlers_.size() || !handlers_[index]) {
            LOG_ERRORF("CommandDispatcher", "No handler for command type: %s", CommandTypeToString(parsed.type));
            return DispatchResult{};
        }

        LOG_DEBUGF("CommandDispatcher", "Dispatching %s", CommandToLogString(*parsed.command).c_str());

        signer::SigningCompletion on_complete = MakeCompletion(parsed.type, parsed.callback);

        try {
            handlers_[index](*active_signer, *parsed.command, on_complete);
        } catch (const std::exception& e) {
            LOG_ERRORF("CommandDispatcher", "%s: signer threw: %s", CommandTypeToHost(parsed.type), e.what());
            on_complete(SigningOutcome::Failure(WalletError::SIGNING_FAILED));
        }

        return DispatchResult{ true, WalletError::NONE };
    }

    signer::SigningCompletion CommandDispatcher::MakeCompletion(CommandType type, const std::optional<std::string>& callback) const
    {
        std::shared_ptr<ResultEncoder> encoder = encoder_;
        const char* host = CommandTypeToHost(type);

        auto deliver = [encoder, callback, host](const SigningOutcome& outcome) {
            if (!callback) {
                LOG_INFOF("CommandDispatcher", "%s: completed (%s), no callback",
                    host, outcome.IsSuccess() ? "success" : WalletErrorToString(outcome.Error()));
                return;
            }
            encoder->SendOutcome(*callback, outcome);
        };

        return MakeOneShotCompletion(std::move(deliver), host);
    }

    void CommandDispatcher::HandleSignMessage(signer::IWalletSigner& wallet_signer, const Command& command, signer::SigningCompletion on_complete)
    {
        const auto& sign = std::get<SignMessageCommand>(command);
        wallet_signer.SignMessage(sign.message, sign.address, std::move(on_complete));
    }

    void CommandDispatcher::HandleSignPersonalMessage(signer::IWalletSigner& wallet_signer, const Command& command, signer::SigningCompletion on_complete)
    {
        const auto& sign = std::get<SignPersonalMessageCommand>(command);
        wallet_signer.SignPersonalMessage(sign.message, sign.address, std::move(on_complete));
    }

    void CommandDispatcher::HandleSignTransaction(signer::IWalletSigner& wallet_signer, const Command& command, signer::SigningCompletion on_complete)
    {
        const auto& sign = std::get<SignTransactionCommand>(command);
        wallet_signer.SignTransaction(sign.transaction, std::move(on_complete));
    }

} // namespace wallet_link::engine
