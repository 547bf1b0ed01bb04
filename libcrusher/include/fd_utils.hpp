/**
 * @file fd_utils.hpp
 * @brief RAII ownership of POSIX file descriptors.
 */

#ifndef CRUSHER_FD_UTILS_HPP
#define CRUSHER_FD_UTILS_HPP

#include <unistd.h>
#include <utility>

namespace crusher {

    /**
     * @brief Move-only owner of a file descriptor; closes it on destruction.
     */
    class UniqueFd {
    public:
        UniqueFd() noexcept = default;
        explicit UniqueFd(const int fd) noexcept : fd_(fd) {}
        ~UniqueFd() { reset(); }

        UniqueFd(const UniqueFd&) = delete;
        UniqueFd& operator=(const UniqueFd&) = delete;

        UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
        UniqueFd& operator=(UniqueFd&& other) noexcept {
            if (this != &other) reset(other.release());
            return *this;
        }

        [[nodiscard]] int get() const noexcept { return fd_; }
        [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }
        explicit operator bool() const noexcept { return valid(); }

        int release() noexcept { return std::exchange(fd_, -1); }

        void reset(const int fd = -1) noexcept {
            if (fd_ >= 0) ::close(fd_);
            fd_ = fd;
        }

    private:
        int fd_ = -1;
    };

} // namespace crusher

#endif // CRUSHER_FD_UTILS_HPP
