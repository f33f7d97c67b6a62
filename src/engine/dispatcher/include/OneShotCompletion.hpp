// src/engine/dispatcher/include/OneShotCompletion.hpp
#pragma once
#include "signer/include/IWalletSigner.hpp"
#include "common/utils/logger/Logger.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <utility>

namespace wallet_link::engine
{
    /**
     * @brief 최대 한 번만 전달되는 완료 핸들러
     *
     * 복사본끼리 플래그를 공유하므로 어느 복사본이 먼저 호출되든
     * 첫 호출만 inner로 전달되고 이후 호출은 로그 후 버려짐.
     * 호출 스레드는 제한하지 않음.
     */
    inline signer::SigningCompletion MakeOneShotCompletion(signer::SigningCompletion inner, std::string label)
    {
        auto fired = std::make_shared<std::atomic<bool>>(false);

        return [fired, inner = std::move(inner), label = std::move(label)](const protocol::SigningOutcome& outcome) {
            if (fired->exchange(true)) {
                LOG_WARNF("CommandDispatcher", "%s: completion already delivered, ignoring repeat", label.c_str());
                return;
            }
            inner(outcome);
        };
    }

} // namespace wallet_link::engine
