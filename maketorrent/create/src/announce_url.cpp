#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <memory>
#include <string>
#include "../include/announce_url.hpp"


namespace maketorrent::create {

    namespace {

        struct UrlDeleter { void operator()(CURLU* u) const { curl_url_cleanup(u); } };
        struct PartDeleter { void operator()(char* p) const { curl_free(p); } };

        using UrlHandle = std::unique_ptr<CURLU, UrlDeleter>;
        using UrlPart = std::unique_ptr<char, PartDeleter>;

        Expected<std::string> getPart(CURLU* u, CURLUPart what) {
            char* raw = nullptr;
            CURLUcode rc = curl_url_get(u, what, &raw, 0);
            UrlPart part(raw);
            if (rc != CURLUE_OK || !part) {
                return Expected<std::string>::failure(curl_url_strerror(rc));
            }
            return Expected<std::string>::success(std::string(part.get()));
        }

    } // anonymous namespace


    Expected<void> validateAnnounceUrl(const std::string& url) {
        if (url.empty()) {
            return Expected<void>::failure("empty announce URL");
        }

        UrlHandle u(curl_url());
        if (!u) {
            return Expected<void>::failure("curl_url() failed");
        }

        CURLUcode rc = curl_url_set(u.get(), CURLUPART_URL, url.c_str(), CURLU_NON_SUPPORT_SCHEME);
        if (rc != CURLUE_OK) {
            return Expected<void>::failure("invalid announce URL '" + url + "': " + curl_url_strerror(rc));
        }

        auto scheme = getPart(u.get(), CURLUPART_SCHEME);
        if (!scheme.has_value()) {
            return Expected<void>::failure("announce URL '" + url + "' has no scheme");
        }
        std::string s = scheme.get();
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (s != "http" && s != "https" && s != "udp") {
            return Expected<void>::failure("unsupported announce URL scheme '" + s + "' in '" + url + "'");
        }

        auto host = getPart(u.get(), CURLUPART_HOST);
        if (!host.has_value() || host.get().empty()) {
            return Expected<void>::failure("announce URL '" + url + "' has no host");
        }

        return Expected<void>::success();
    }

} // namespace maketorrent::create
