#include "../../include/gzip_size.hpp"
#include "../../include/errors.hpp"
#include <zlib.h>
#include <algorithm>
#include <array>
#include <string>

namespace crusher {

    namespace {

    // releases the deflate state on every exit path
    struct DeflateGuard {
        z_stream& strm;
        ~DeflateGuard() { deflateEnd(&strm); }
    };

    constexpr std::size_t kInputChunk = 1u << 20;

    } // namespace

    std::uint64_t gzip_size(const std::string_view content) {
        z_stream strm{};
        // 15 window bits + 16 selects the gzip wrapper
        if (deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
            throw CrushError(ErrorKind::GzipFailed, "deflateInit2 failed");
        }
        DeflateGuard guard{strm};

        std::array<unsigned char, 16384> scratch{};
        std::size_t offset = 0;
        int flush = Z_NO_FLUSH;

        do {
            const std::size_t chunk = std::min(kInputChunk, content.size() - offset);
            strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(content.data() + offset));
            strm.avail_in = static_cast<uInt>(chunk);
            offset += chunk;
            flush = offset == content.size() ? Z_FINISH : Z_NO_FLUSH;

            do {
                strm.next_out = scratch.data();
                strm.avail_out = static_cast<uInt>(scratch.size());
                const int ret = deflate(&strm, flush);
                if (ret == Z_STREAM_ERROR) {
                    throw CrushError(ErrorKind::GzipFailed,
                                     std::string("deflate failed: ") + (strm.msg ? strm.msg : "stream error"));
                }
            } while (strm.avail_out == 0);
        } while (flush != Z_FINISH);

        return static_cast<std::uint64_t>(strm.total_out);
    }

} // namespace crusher
