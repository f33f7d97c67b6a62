// src/common/url/include/UrlComponents.hpp
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace wallet_link::url
{
    struct QueryItem
    {
        std::string name;                  // percent-decoding 된 이름
        std::optional<std::string> value;  // '='가 없으면 nullopt
    };

    /**
     * @brief RFC 3986 기반 URL 분해/재조립
     *
     * - scheme://authority/path?query#fragment 로 분해
     * - 쿼리는 원본 인코딩 그대로 보존하고, 항목 조회 시에만 디코딩
     * - '+'는 공백으로 해석하지 않음
     * - AppendQueryItem 후 ToString은 기존 쿼리 뒤에 "&name=value"를 붙인 결과
     */
    class UrlComponents
    {
    public:
        /**
         * @brief URL 문자열 분해
         *
         * 다음 경우 실패 (std::nullopt):
         *   - 빈 문자열
         *   - URL에 허용되지 않는 문자 (공백, 제어문자, 비ASCII, "<>\^`{|} 등)
         *   - 잘못된 percent-escape ("%G1", 끝의 "%")
         *   - 잘못된 scheme 또는 포트
         */
        static std::optional<UrlComponents> Parse(const std::string& url);

        const std::string& Scheme() const { return scheme_; }
        const std::optional<std::string>& Host() const { return host_; }
        const std::optional<uint16_t>& Port() const { return port_; }
        const std::string& Path() const { return path_; }
        const std::optional<std::string>& PercentEncodedQuery() const { return query_; }
        const std::optional<std::string>& Fragment() const { return fragment_; }

        bool IsAbsolute() const { return !scheme_.empty(); }

        std::vector<QueryItem> QueryItems() const;

        /**
         * @brief 이름이 일치하는 첫 번째 항목의 값 (first-match-wins)
         * @return 항목이 없거나 값이 없으면 std::nullopt
         */
        std::optional<std::string> QueryValue(const std::string& name) const;

        void AppendQueryItem(const std::string& name, const std::string& value);

        std::string ToString() const;

        bool operator==(const UrlComponents& other) const { return ToString() == other.ToString(); }
        bool operator!=(const UrlComponents& other) const { return !(*this == other); }

    private:
        UrlComponents() = default;

        std::string scheme_;
        std::optional<std::string> authority_;
        std::optional<std::string> host_;
        std::optional<uint16_t> port_;
        std::string path_;
        std::optional<std::string> query_;
        std::optional<std::string> fragment_;
    };

    /**
     * @brief 쿼리 값 percent-encoding
     *
     * unreserved 문자와 "!$'()*,;:@/?=" 는 그대로, 나머지('&', '+', '#', '%', 공백,
     * 비ASCII 등)는 %XX (대문자 hex).
     */
    std::string PercentEncodeQueryValue(const std::string& value);

    // 잘못된 escape가 있으면 std::nullopt
    std::optional<std::string> PercentDecode(const std::string& encoded);

} // namespace wallet_link::url
