/**
 * @file remote_service.hpp
 * @brief Minimal HTTP form client for remote-service-backed crushers.
 */

#ifndef CRUSHER_REMOTE_SERVICE_HPP
#define CRUSHER_REMOTE_SERVICE_HPP

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace crusher {

    /// Ordered form fields, url-encoded on the wire.
    using FormFields = std::vector<std::pair<std::string, std::string>>;

    /**
     * @brief Posts `application/x-www-form-urlencoded` requests with libcurl.
     *
     * One easy handle per request; the object only holds the endpoint and the
     * timeout, so it may be shared between threads.
     */
    class RemoteService {
    public:
        RemoteService(std::string url, std::chrono::milliseconds timeout);

        /**
         * @brief POST the fields and return the response body.
         * @throws CrushError (ErrorKind::RemoteServiceFailed) on transport errors,
         *         HTTP status >= 400 or an empty body.
         */
        [[nodiscard]] std::string post_form(const FormFields& fields) const;

        [[nodiscard]] const std::string& url() const noexcept { return url_; }

    private:
        std::string url_;
        std::chrono::milliseconds timeout_;
    };

} // namespace crusher

#endif // CRUSHER_REMOTE_SERVICE_HPP
