/**
 * @file gzip_size.hpp
 * @brief Measure the gzipped size of a buffer without keeping the output.
 */

#ifndef CRUSHER_GZIP_SIZE_HPP
#define CRUSHER_GZIP_SIZE_HPP

#include <cstdint>
#include <string_view>

namespace crusher {

    /**
     * @brief Compute the size in bytes of content after gzip compression.
     *
     * Uses zlib's default compression level and a gzip wrapper, matching what
     * a web server sends. The compressed bytes are streamed through a small
     * scratch buffer and discarded.
     *
     * @throws CrushError (ErrorKind::GzipFailed) if zlib reports an error.
     */
    std::uint64_t gzip_size(std::string_view content);

} // namespace crusher

#endif // CRUSHER_GZIP_SIZE_HPP
