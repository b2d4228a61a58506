#ifndef LOKISHIP_GZIP_HPP
#define LOKISHIP_GZIP_HPP

#include <zlib.h>
#include <string>
#include <cstring>
#include <stdexcept>

namespace lokiship {
namespace detail {

    /// RAII owner for a z_stream, ending it with the matching *End call.
    struct ZStreamGuard {
        z_stream zs;
        bool deflating;
        bool active;

        explicit ZStreamGuard(bool deflate_) : deflating(deflate_), active(false) {
            std::memset(&zs, 0, sizeof(zs));
        }
        ~ZStreamGuard() {
            if (!active) return;
            if (deflating) deflateEnd(&zs);
            else inflateEnd(&zs);
        }
        ZStreamGuard(const ZStreamGuard&) = delete;
        ZStreamGuard& operator=(const ZStreamGuard&) = delete;
    };

    /// Wrap `input` in a single gzip member (RFC 1952).
    inline std::string gzipCompress(const std::string& input, int level = Z_DEFAULT_COMPRESSION) {
        ZStreamGuard guard(true);
        // windowBits 15 + 16 selects the gzip wrapper instead of zlib.
        if (deflateInit2(&guard.zs, level, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
            throw std::runtime_error("gzip: deflateInit2 failed");
        }
        guard.active = true;

        std::string out;
        out.resize(deflateBound(&guard.zs, static_cast<uLong>(input.size())));
        guard.zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
        guard.zs.avail_in = static_cast<uInt>(input.size());
        guard.zs.next_out = reinterpret_cast<Bytef*>(&out[0]);
        guard.zs.avail_out = static_cast<uInt>(out.size());

        int rc = deflate(&guard.zs, Z_FINISH);
        if (rc != Z_STREAM_END) {
            throw std::runtime_error("gzip: deflate did not finish (rc=" + std::to_string(rc) + ")");
        }
        out.resize(guard.zs.total_out);
        return out;
    }

    inline std::string gzipDecompress(const std::string& input) {
        ZStreamGuard guard(false);
        if (inflateInit2(&guard.zs, 15 + 16) != Z_OK) {
            throw std::runtime_error("gzip: inflateInit2 failed");
        }
        guard.active = true;

        guard.zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
        guard.zs.avail_in = static_cast<uInt>(input.size());

        std::string out;
        char chunk[16384];
        int rc = Z_OK;
        while (rc != Z_STREAM_END) {
            guard.zs.next_out = reinterpret_cast<Bytef*>(chunk);
            guard.zs.avail_out = sizeof(chunk);
            rc = inflate(&guard.zs, Z_NO_FLUSH);
            if (rc != Z_OK && rc != Z_STREAM_END) {
                throw std::runtime_error("gzip: inflate failed (rc=" + std::to_string(rc) + ")");
            }
            out.append(chunk, sizeof(chunk) - guard.zs.avail_out);
            if (rc == Z_OK && guard.zs.avail_in == 0 && guard.zs.avail_out != 0) {
                throw std::runtime_error("gzip: truncated input");
            }
        }
        return out;
    }

} // namespace detail
} // namespace lokiship

#endif // LOKISHIP_GZIP_HPP
