/**
 * @file file_utils.hpp
 * @brief Whole-file text IO used by the front-end.
 */

#ifndef CRUSHER_FILE_UTILS_HPP
#define CRUSHER_FILE_UTILS_HPP

#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>

namespace crusher {

    /**
     * @brief Read a whole file.
     * @throws std::runtime_error if the file cannot be opened or read.
     */
    std::string read_file(const std::filesystem::path& path);

    /**
     * @brief Read a stream to its end.
     */
    std::string read_stream(std::istream& in);

    /**
     * @brief Replace a file with new content.
     *
     * The content is written to a uniquely named temporary file in the
     * target directory, which is then renamed over the target, so readers
     * see either the old or the new file. Parent directories are created.
     *
     * @throws std::runtime_error if writing or renaming fails; the target is left untouched.
     */
    void write_file_atomic(const std::filesystem::path& path, std::string_view content);

} // namespace crusher

#endif // CRUSHER_FILE_UTILS_HPP
