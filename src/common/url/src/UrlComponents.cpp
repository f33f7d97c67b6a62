// src/common/url/src/UrlComponents.cpp
#include "common/url/include/UrlComponents.hpp"
#include <cctype>

namespace wallet_link::url
{
    namespace
    {
        bool IsUnreserved(unsigned char c)
        {
            return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~';
        }

        // unreserved + gen-delims + sub-delims + '%'
        bool IsAllowedUrlChar(unsigned char c)
        {
            if (c >= 0x80) {
                return false;
            }
            if (IsUnreserved(c)) {
                return true;
            }
            switch (c) {
                case ':': case '/': case '?': case '#': case '[': case ']': case '@':
                case '!': case '$': case '&': case '\'': case '(': case ')':
                case '*': case '+': case ',': case ';': case '=': case '%':
                    return true;
                default:
                    return false;
            }
        }

        // 쿼리 값에서 인코딩하지 않는 문자
        bool IsQueryValueSafe(unsigned char c)
        {
            if (c >= 0x80) {
                return false;
            }
            if (IsUnreserved(c)) {
                return true;
            }
            switch (c) {
                case '!': case '$': case '\'': case '(': case ')': case '*':
                case ',': case ';': case ':': case '@': case '/': case '?': case '=':
                    return true;
                default:
                    return false;
            }
        }

        int HexValue(char c)
        {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

        bool IsValidScheme(const std::string& scheme)
        {
            if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme[0]))) {
                return false;
            }
            for (unsigned char c : scheme) {
                if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') {
                    return false;
                }
            }
            return true;
        }

        bool HasValidEscapes(const std::string& str)
        {
            for (size_t i = 0; i < str.size(); ++i) {
                if (str[i] != '%') {
                    continue;
                }
                if (i + 2 >= str.size() || HexValue(str[i + 1]) < 0 || HexValue(str[i + 2]) < 0) {
                    return false;
                }
                i += 2;
            }
            return true;
        }
    }

    std::optional<UrlComponents> UrlComponents::Parse(const std::string& url)
    {
        if (url.empty()) {
            return std::nullopt;
        }

        for (unsigned char c : url) {
            if (!IsAllowedUrlChar(c)) {
                return std::nullopt;
            }
        }

        if (!HasValidEscapes(url)) {
            return std::nullopt;
        }

        UrlComponents components;
        size_t pos = 0;

        // RFC 3986 Appendix B 순서: scheme, authority, path, query, fragment
        size_t delimiter = url.find_first_of(":/?#");
        if (delimiter != std::string::npos && delimiter > 0 && url[delimiter] == ':') {
            components.scheme_ = url.substr(0, delimiter);
            if (!IsValidScheme(components.scheme_)) {
                return std::nullopt;
            }
            pos = delimiter + 1;
        }

        if (url.compare(pos, 2, "//") == 0) {
            size_t authority_end = url.find_first_of("/?#", pos + 2);
            if (authority_end == std::string::npos) {
                authority_end = url.size();
            }
            std::string authority = url.substr(pos + 2, authority_end - pos - 2);
            pos = authority_end;
            components.authority_ = authority;

            // userinfo 제거
            size_t at = authority.rfind('@');
            std::string host_port = (at == std::string::npos) ? authority : authority.substr(at + 1);

            std::string host;
            std::string port_part;

            if (!host_port.empty() && host_port[0] == '[') {
                // IPv6 literal
                size_t close = host_port.find(']');
                if (close == std::string::npos) {
                    return std::nullopt;
                }
                host = host_port.substr(0, close + 1);
                port_part = host_port.substr(close + 1);
            } else {
                size_t colon = host_port.rfind(':');
                if (colon == std::string::npos) {
                    host = host_port;
                } else {
                    host = host_port.substr(0, colon);
                    port_part = host_port.substr(colon);
                }
            }

            if (!port_part.empty()) {
                if (port_part[0] != ':') {
                    return std::nullopt;
                }

                std::string digits = port_part.substr(1);
                if (!digits.empty()) {
                    if (digits.size() > 5) {
                        return std::nullopt;
                    }
                    for (unsigned char c : digits) {
                        if (!std::isdigit(c)) {
                            return std::nullopt;
                        }
                    }
                    unsigned long port = std::stoul(digits);
                    if (port > 65535) {
                        return std::nullopt;
                    }
                    components.port_ = static_cast<uint16_t>(port);
                }
            }

            std::optional<std::string> decoded_host = PercentDecode(host);
            if (!decoded_host) {
                return std::nullopt;
            }
            components.host_ = *decoded_host;
        }

        size_t path_end = url.find_first_of("?#", pos);
        if (path_end == std::string::npos) {
            path_end = url.size();
        }
        components.path_ = url.substr(pos, path_end - pos);
        pos = path_end;

        if (pos < url.size() && url[pos] == '?') {
            size_t query_end = url.find('#', pos + 1);
            if (query_end == std::string::npos) {
                query_end = url.size();
            }
            components.query_ = url.substr(pos + 1, query_end - pos - 1);
            pos = query_end;
        }

        if (pos < url.size() && url[pos] == '#') {
            std::string fragment = url.substr(pos + 1);
            if (fragment.find('#') != std::string::npos) {
                return std::nullopt;
            }
            components.fragment_ = fragment;
        }

        return components;
    }

    std::vector<QueryItem> UrlComponents::QueryItems() const
    {
        std::vector<QueryItem> items;
        if (!query_) {
            return items;
        }

        const std::string& query = *query_;
        size_t start = 0;

        while (start <= query.size()) {
            size_t end = query.find('&', start);
            if (end == std::string::npos) {
                end = query.size();
            }

            std::string piece = query.substr(start, end - start);
            if (!piece.empty()) {
                QueryItem item;
                size_t eq = piece.find('=');

                std::string raw_name = (eq == std::string::npos) ? piece : piece.substr(0, eq);
                item.name = PercentDecode(raw_name).value_or(raw_name);

                if (eq != std::string::npos) {
                    std::string raw_value = piece.substr(eq + 1);
                    item.value = PercentDecode(raw_value).value_or(raw_value);
                }

                items.push_back(std::move(item));
            }

            start = end + 1;
        }

        return items;
    }

    std::optional<std::string> UrlComponents::QueryValue(const std::string& name) const
    {
        for (const QueryItem& item : QueryItems()) {
            if (item.name == name) {
                return item.value;
            }
        }
        return std::nullopt;
    }

    void UrlComponents::AppendQueryItem(const std::string& name, const std::string& value)
    {
        std::string encoded = PercentEncodeQueryValue(name) + "=" + PercentEncodeQueryValue(value);

        if (!query_ || query_->empty()) {
            query_ = encoded;
        } else {
            query_ = *query_ + "&" + encoded;
        }
    }

    std::string UrlComponents::ToString() const
    {
        std::string out;

        if (!scheme_.empty()) {
            out += scheme_;
            out += ':';
        }
        if (authority_) {
            out += "//";
            out += *authority_;
        }
        out += path_;
        if (query_) {
            out += '?';
            out += *query_;
        }
        if (fragment_) {
            out += '#';
            out += *fragment_;
        }

        return out;
    }

    std::string PercentEncodeQueryValue(const std::string& value)
    {
        static constexpr char DIGITS[] = "0123456789ABCDEF";

        std::string out;
        out.reserve(value.size());

        for (unsigned char c : value) {
            if (IsQueryValueSafe(c)) {
                out.push_back(static_cast<char>(c));
            } else {
                out.push_back('%');
                out.push_back(DIGITS[c >> 4]);
                out.push_back(DIGITS[c & 0x0f]);
            }
        }

        return out;
    }

    std::optional<std::string> PercentDecode(const std::string& encoded)
    {
        std::string out;
        out.reserve(encoded.size());

        for (size_t i = 0; i < encoded.size(); ++i) {
            if (encoded[i] != '%') {
                out.push_back(encoded[i]);
                continue;
            }

            if (i + 2 >= encoded.size()) {
                return std::nullopt;
            }

            int hi = HexValue(encoded[i + 1]);
            int lo = HexValue(encoded[i + 2]);
            if (hi < 0 || lo < 0) {
                return std::nullopt;
            }

            out.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        }

        return out;
    }

} // namespace wallet_link::url
