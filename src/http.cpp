#include "starsim/http.h"
#include "starsim/types.h"
#include <cctype>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <curl/curl.h>

namespace starsim {
namespace catalog {
namespace http {

namespace {

size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

void ensureCurlInitialized() {
    static std::once_flag curl_initialized;
    std::call_once(curl_initialized, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string perform(const std::string& url, const std::string* post_data, int timeout_seconds) {
    ensureCurlInitialized();

    CURL* curl = curl_easy_init();
    if (!curl) {
        throw CatalogException(ErrorCode::NETWORK_ERROR, "Failed to initialize CURL");
    }

    std::string response;
    struct curl_slist* headers = nullptr;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    if (post_data) {
        headers = curl_slist_append(headers, "Content-Type: application/x-www-form-urlencoded");
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, post_data->c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    }
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        throw CatalogException(ErrorCode::NETWORK_ERROR,
                               std::string("CURL error: ") + curl_easy_strerror(res));
    }
    if (http_code != 200) {
        throw CatalogException(ErrorCode::NETWORK_ERROR,
                               "HTTP error " + std::to_string(http_code) + " from " + url);
    }

    return response;
}

} // anonymous namespace

std::string get(const std::string& url, int timeout_seconds) {
    return perform(url, nullptr, timeout_seconds);
}

std::string post(const std::string& url, const std::string& data, int timeout_seconds) {
    return perform(url, &data, timeout_seconds);
}

std::string urlEncode(const std::string& str) {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex;

    for (char c : str) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else if (c == ' ') {
            escaped << '+';
        } else {
            escaped << '%' << std::setw(2) << int(static_cast<unsigned char>(c));
        }
    }

    return escaped.str();
}

} // namespace http
} // namespace catalog
} // namespace starsim
