// src/engine/encoder/src/ResultEncoder.cpp
#include "engine/encoder/include/ResultEncoder.hpp"
#include "common/url/include/UrlComponents.hpp"
#include "common/utils/encoding/Base64.hpp"
#include "common/utils/logger/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace wallet_link::engine
{
    std::optional<ErrorCodeFormat> ErrorCodeFormatFromString(const std::string& str)
    {
        std::string lower = str;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return std::tolower(c); });

        if (lower == "symbolic") return ErrorCodeFormat::SYMBOLIC;
        if (lower == "numeric") return ErrorCodeFormat::NUMERIC;
        return std::nullopt;
    }

    ResultEncoder::ResultEncoder(std::shared_ptr<launcher::IUrlLauncher> launcher, ErrorCodeFormat error_format)
        : launcher_(std::move(launcher))
        , error_format_(error_format)
    {
        if (!launcher_) {
            throw std::invalid_argument("ResultEncoder: launcher is null");
        }
    }

    std::optional<std::string> ResultEncoder::BuildSuccessUrl(const std::string& callback, const Bytes& signed_payload) const
    {
        return BuildUrl(callback, params::RESULT, utils::Base64Encode(signed_payload));
    }

    std::optional<std::string> ResultEncoder::BuildFailureUrl(const std::string& callback, WalletError error) const
    {
        return BuildUrl(callback, params::ERROR, EncodeError(error));
    }

    void ResultEncoder::SendSuccess(const std::string& callback, const Bytes& signed_payload) const
    {
        std::optional<std::string> url = BuildSuccessUrl(callback, signed_payload);
        if (!url) {
            return;
        }

        LOG_INFOF("ResultEncoder", "Delivering result (%zu bytes)", signed_payload.size());
        Launch(*url);
    }

    void ResultEncoder::SendFailure(const std::string& callback, WalletError error) const
    {
        std::optional<std::string> url = BuildFailureUrl(callback, error);
        if (!url) {
            return;
        }

        LOG_INFOF("ResultEncoder", "Delivering error: %s", WalletErrorToString(error));
        Launch(*url);
    }

    void ResultEncoder::SendOutcome(const std::string& callback, const protocol::SigningOutcome& outcome) const
    {
        if (outcome.IsSuccess()) {
            SendSuccess(callback, outcome.SignedPayload());
        } else {
            SendFailure(callback, outcome.Error());
        }
    }

    std::optional<std::string> ResultEncoder::BuildUrl(const std::string& callback, const char* name, const std::string& value) const
    {
        std::optional<url::UrlComponents> components = url::UrlComponents::Parse(callback);
        if (!components) {
            LOG_WARNF("ResultEncoder", "Cannot parse callback URL, dropping %s: %s", name, callback.c_str());
            return std::nullopt;
        }

        components->AppendQueryItem(name, value);
        return components->ToString();
    }

    std::string ResultEncoder::EncodeError(WalletError error) const
    {
        // NONE은 콜백 값이 아님
        if (error == WalletError::NONE) {
            error = WalletError::UNKNOWN;
        }

        if (error_format_ == ErrorCodeFormat::NUMERIC) {
            return std::to_string(WalletErrorToCode(error));
        }
        return WalletErrorToString(error);
    }

    void ResultEncoder::Launch(const std::string& url) const
    {
        try {
            launcher_->Open(url);
        } catch (const std::exception& e) {
            LOG_ERRORF("ResultEncoder", "Launcher '%s' failed: %s", launcher_->GetName().c_str(), e.what());
        }
    }

} // namespace wallet_link::engine
