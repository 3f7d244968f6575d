#include "market_data/odds_api_client.hpp"
#include "common/errors.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace betarb {

namespace {
    // CURL write callback
    size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* output) {
        size_t total_size = size * nmemb;
        output->append(static_cast<char*>(contents), total_size);
        return total_size;
    }

    // CURL header callback, collects lowercased "name: value" pairs
    size_t header_callback(char* buffer, size_t size, size_t nitems,
                           std::map<std::string, std::string>* headers) {
        size_t total_size = size * nitems;
        std::string line(buffer, total_size);

        auto colon = line.find(':');
        if (colon != std::string::npos) {
            std::string name = line.substr(0, colon);
            std::string value = line.substr(colon + 1);
            std::transform(name.begin(), name.end(), name.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            auto first = value.find_first_not_of(" \t");
            auto last = value.find_last_not_of(" \t\r\n");
            value = first == std::string::npos ? "" : value.substr(first, last - first + 1);
            (*headers)[name] = value;
        }
        return total_size;
    }

    std::optional<int64_t> header_int(const std::map<std::string, std::string>& headers,
                                      const std::string& name) {
        auto it = headers.find(name);
        if (it == headers.end() || it->second.empty()) return std::nullopt;
        char* end = nullptr;
        long long value = std::strtoll(it->second.c_str(), &end, 10);
        if (end == it->second.c_str()) return std::nullopt;
        return static_cast<int64_t>(value);
    }

    std::string join(const std::vector<std::string>& items, const char* sep) {
        std::string out;
        for (size_t i = 0; i < items.size(); i++) {
            if (i > 0) out += sep;
            out += items[i];
        }
        return out;
    }
}

OddsApiClient::OddsApiClient(const std::string& base_url, long timeout_seconds)
    : base_url_(base_url)
    , timeout_seconds_(timeout_seconds)
{
    curl_global_init(CURL_GLOBAL_ALL);
    spdlog::debug("OddsApiClient initialized: {}", base_url_);
}

OddsApiClient::~OddsApiClient() {
    curl_global_cleanup();
}

std::string OddsApiClient::url_escape(const std::string& s) const {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw UpstreamError("Failed to initialize CURL");
    }
    char* escaped = curl_easy_escape(curl, s.c_str(), static_cast<int>(s.size()));
    std::string result = escaped ? escaped : "";
    curl_free(escaped);
    curl_easy_cleanup(curl);
    return result;
}

std::string OddsApiClient::build_odds_url(const std::string& api_key,
                                          const OddsRequest& request) const {
    std::string url = fmt::format("{}/sports/{}/odds?apiKey={}&regions={}&markets={}&oddsFormat=decimal",
                                  base_url_,
                                  url_escape(request.sport),
                                  url_escape(api_key),
                                  url_escape(request.regions),
                                  url_escape(join(request.markets, ",")));
    if (!request.bookmakers.empty()) {
        url += "&bookmakers=" + url_escape(join(request.bookmakers, ","));
    }
    return url;
}

ProviderResponse OddsApiClient::fetch_sports(const std::string& api_key) {
    return http_get(fmt::format("{}/sports?apiKey={}", base_url_, url_escape(api_key)));
}

ProviderResponse OddsApiClient::fetch_odds(const std::string& api_key, const OddsRequest& request) {
    return http_get(build_odds_url(api_key, request));
}

ProviderResponse OddsApiClient::http_get(const std::string& url) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw UpstreamError("Failed to initialize CURL");
    }

    std::string response;
    std::map<std::string, std::string> headers_in;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &headers_in);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);

    // Add headers
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Accept: application/json");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    CURLcode res = curl_easy_perform(curl);

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        throw UpstreamError(std::string("CURL request failed: ") + curl_easy_strerror(res));
    }

    ProviderResponse result;
    result.requests_remaining = header_int(headers_in, "x-requests-remaining");
    result.requests_used = header_int(headers_in, "x-requests-used");

    if (status != 200) {
        UpstreamError error(fmt::format("HTTP {}: {}", status, response.substr(0, 200)), status);
        error.requests_remaining = result.requests_remaining;
        error.requests_used = result.requests_used;
        throw error;
    }

    try {
        result.body = nlohmann::json::parse(response);
    } catch (const nlohmann::json::parse_error& e) {
        throw UpstreamError(std::string("Unparseable response body: ") + e.what(), status);
    }

    return result;
}

} // namespace betarb
