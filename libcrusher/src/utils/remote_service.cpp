#include "../../include/remote_service.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace crusher {

    namespace {

    std::size_t write_callback(char* ptr, const std::size_t size, const std::size_t nmemb, void* userdata) {
        auto* body = static_cast<std::string*>(userdata);
        const std::size_t total = size * nmemb;
        body->append(ptr, total);
        return total;
    }

    void ensure_curl_initialized() {
        static std::once_flag once;
        std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    }

    struct CurlDeleter {
        void operator()(CURL* curl) const noexcept { curl_easy_cleanup(curl); }
    };

    std::string encode_form(CURL* curl, const FormFields& fields) {
        std::string body;
        for (const auto& [key, value] : fields) {
            if (!body.empty()) body += '&';
            std::unique_ptr<char, decltype(&curl_free)> k(
                curl_easy_escape(curl, key.data(), static_cast<int>(key.size())), &curl_free);
            std::unique_ptr<char, decltype(&curl_free)> v(
                curl_easy_escape(curl, value.data(), static_cast<int>(value.size())), &curl_free);
            if (!k || !v) {
                throw CrushError(ErrorKind::RemoteServiceFailed, "Failed to encode form field " + key);
            }
            body += k.get();
            body += '=';
            body += v.get();
        }
        return body;
    }

    } // namespace

    RemoteService::RemoteService(std::string url, const std::chrono::milliseconds timeout)
        : url_(std::move(url)), timeout_(timeout) {}

    std::string RemoteService::post_form(const FormFields& fields) const {
        ensure_curl_initialized();

        std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
        if (!curl) {
            throw CrushError(ErrorKind::RemoteServiceFailed, "Failed to create curl handle");
        }

        const std::string payload = encode_form(curl.get(), fields);
        std::string body;

        curl_easy_setopt(curl.get(), CURLOPT_URL, url_.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload.data());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);

        Logger::log(LogLevel::Debug, "POST " + url_, "remote");

        const CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK) {
            throw CrushError(ErrorKind::RemoteServiceFailed,
                             url_ + ": " + curl_easy_strerror(res));
        }

        long status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
        if (status >= 400) {
            throw CrushError(ErrorKind::RemoteServiceFailed,
                             url_ + " answered HTTP " + std::to_string(status));
        }
        if (body.empty()) {
            throw CrushError(ErrorKind::RemoteServiceFailed, url_ + " returned an empty body");
        }
        return body;
    }

} // namespace crusher
