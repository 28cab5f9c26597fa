#include "imgkit/gzip.hpp"

#include <cstring>
#include <fstream>
#include <vector>

#include <zlib.h>

namespace imgkit {

namespace {

constexpr size_t CHUNK = 64 * 1024;

GzipResult gzip_error(ErrorKind kind, const std::string& message) {
    GzipResult result;
    result.kind = kind;
    result.error = message;
    return result;
}

// RAII for a deflate/inflate z_stream
class ZStream {
public:
    explicit ZStream(bool deflating) : deflating_(deflating) {
        std::memset(&strm_, 0, sizeof(strm_));
    }
    ~ZStream() {
        if (!initialized_) return;
        if (deflating_) {
            deflateEnd(&strm_);
        } else {
            inflateEnd(&strm_);
        }
    }

    ZStream(const ZStream&) = delete;
    ZStream& operator=(const ZStream&) = delete;

    bool init() {
        int ret;
        if (deflating_) {
            // Raw deflate; the gzip framing is written by hand for determinism
            ret = deflateInit2(&strm_, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -15, 8, Z_DEFAULT_STRATEGY);
        } else {
            // 16 + MAX_WBITS tells zlib to handle gzip format
            ret = inflateInit2(&strm_, 16 + MAX_WBITS);
        }
        initialized_ = ret == Z_OK;
        return initialized_;
    }

    z_stream* get() { return &strm_; }

private:
    z_stream strm_;
    bool deflating_;
    bool initialized_ = false;
};

void put_le32(std::ostream& out, uint32_t value) {
    char bytes[4] = {
        static_cast<char>(value & 0xff),
        static_cast<char>((value >> 8) & 0xff),
        static_cast<char>((value >> 16) & 0xff),
        static_cast<char>((value >> 24) & 0xff),
    };
    out.write(bytes, 4);
}

} // namespace

GzipResult gzip_compress(std::istream& in, std::ostream& out) {
    GzipResult result;

    static const unsigned char header[10] = {
        0x1f, 0x8b,             // Magic
        0x08,                   // Compression method: deflate
        0x00,                   // Flags: none (no name, no comment, etc.)
        0x00, 0x00, 0x00, 0x00, // mtime = 0
        0x00,                   // Extra flags
        0xff                    // OS = 255 (unknown)
    };
    out.write(reinterpret_cast<const char*>(header), sizeof(header));
    result.bytes_out += sizeof(header);

    ZStream strm(true);
    if (!strm.init()) {
        return gzip_error(ErrorKind::Io, "deflate initialization failed");
    }

    std::vector<unsigned char> in_buf(CHUNK);
    std::vector<unsigned char> out_buf(CHUNK);
    uLong crc = crc32(0L, Z_NULL, 0);

    int flush = Z_NO_FLUSH;
    do {
        in.read(reinterpret_cast<char*>(in_buf.data()), static_cast<std::streamsize>(in_buf.size()));
        auto got = static_cast<uInt>(in.gcount());
        if (in.bad()) {
            return gzip_error(ErrorKind::Io, "failed to read compression input");
        }
        flush = in.eof() ? Z_FINISH : Z_NO_FLUSH;

        crc = crc32(crc, in_buf.data(), got);
        result.bytes_in += got;

        strm.get()->next_in = in_buf.data();
        strm.get()->avail_in = got;

        do {
            strm.get()->next_out = out_buf.data();
            strm.get()->avail_out = static_cast<uInt>(out_buf.size());
            int ret = deflate(strm.get(), flush);
            if (ret == Z_STREAM_ERROR) {
                return gzip_error(ErrorKind::Io, "deflate failed");
            }
            size_t have = out_buf.size() - strm.get()->avail_out;
            out.write(reinterpret_cast<const char*>(out_buf.data()), static_cast<std::streamsize>(have));
            if (!out) {
                return gzip_error(ErrorKind::Io, "failed to write compressed output");
            }
            result.bytes_out += have;
        } while (strm.get()->avail_out == 0);
    } while (flush != Z_FINISH);

    // Trailer: CRC32 + original size (mod 2^32)
    put_le32(out, static_cast<uint32_t>(crc));
    put_le32(out, static_cast<uint32_t>(result.bytes_in & 0xffffffffu));
    result.bytes_out += 8;

    out.flush();
    if (!out) {
        return gzip_error(ErrorKind::Io, "failed to write compressed output");
    }

    result.ok = true;
    return result;
}

GzipResult gzip_decompress(std::istream& in, std::ostream& out) {
    GzipResult result;

    ZStream strm(false);
    if (!strm.init()) {
        return gzip_error(ErrorKind::Io, "inflate initialization failed");
    }

    std::vector<unsigned char> in_buf(CHUNK);
    std::vector<unsigned char> out_buf(CHUNK);
    int ret = Z_OK;

    for (;;) {
        in.read(reinterpret_cast<char*>(in_buf.data()), static_cast<std::streamsize>(in_buf.size()));
        auto got = static_cast<uInt>(in.gcount());
        if (in.bad()) {
            return gzip_error(ErrorKind::Io, "failed to read compressed input");
        }
        if (got == 0) break;
        result.bytes_in += got;

        strm.get()->next_in = in_buf.data();
        strm.get()->avail_in = got;

        while (strm.get()->avail_in > 0) {
            if (ret == Z_STREAM_END) {
                // Next concatenated member
                inflateReset(strm.get());
            }

            strm.get()->next_out = out_buf.data();
            strm.get()->avail_out = static_cast<uInt>(out_buf.size());

            ret = inflate(strm.get(), Z_NO_FLUSH);
            if (ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR || ret == Z_STREAM_ERROR) {
                return gzip_error(ErrorKind::Structural, "corrupt gzip stream");
            }

            size_t have = out_buf.size() - strm.get()->avail_out;
            out.write(reinterpret_cast<const char*>(out_buf.data()), static_cast<std::streamsize>(have));
            if (!out) {
                return gzip_error(ErrorKind::Io, "failed to write decompressed output");
            }
            result.bytes_out += have;

            if (ret == Z_BUF_ERROR && have == 0) break;
        }
    }

    if (ret != Z_STREAM_END) {
        return gzip_error(ErrorKind::Structural, "truncated gzip stream");
    }

    out.flush();
    result.ok = true;
    return result;
}

GzipResult gzip_compress_file(const std::string& src_path, const std::string& dst_path) {
    std::ifstream in(src_path, std::ios::binary);
    if (!in) {
        return gzip_error(ErrorKind::Io, "failed to open " + src_path);
    }
    std::ofstream out(dst_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return gzip_error(ErrorKind::Io, "failed to create " + dst_path);
    }
    auto result = gzip_compress(in, out);
    if (!result.ok) {
        result.error += ": " + src_path;
    }
    return result;
}

GzipResult gzip_decompress_file(const std::string& src_path, const std::string& dst_path) {
    std::ifstream in(src_path, std::ios::binary);
    if (!in) {
        return gzip_error(ErrorKind::Io, "failed to open " + src_path);
    }
    std::ofstream out(dst_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return gzip_error(ErrorKind::Io, "failed to create " + dst_path);
    }
    auto result = gzip_decompress(in, out);
    if (!result.ok) {
        result.error += ": " + src_path;
    }
    return result;
}

bool has_gzip_magic(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    unsigned char magic[2] = {0, 0};
    in.read(reinterpret_cast<char*>(magic), 2);
    return in.gcount() == 2 && magic[0] == 0x1f && magic[1] == 0x8b;
}

} // namespace imgkit
