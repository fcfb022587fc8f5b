#include "git/Zlib.hpp"

#include <stdexcept>
#include <vector>

#include <zlib.h>

namespace gitv {
namespace Zlib {

std::vector<uint8_t> compress(const std::string& data) {
    z_stream stream{};
    stream.zalloc = Z_NULL;
    stream.zfree = Z_NULL;
    stream.opaque = Z_NULL;

    if (deflateInit(&stream, Z_DEFAULT_COMPRESSION) != Z_OK) {
        throw std::runtime_error("zlib deflateInit failed");
    }

    stream.avail_in = static_cast<uInt>(data.size());
    // Some zlib versions have non-const next_in
    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data.data()));

    std::vector<uint8_t> compressed(deflateBound(&stream, static_cast<uLong>(data.size())));
    stream.avail_out = static_cast<uInt>(compressed.size());
    stream.next_out = compressed.data();

    if (deflate(&stream, Z_FINISH) != Z_STREAM_END) {
        deflateEnd(&stream);
        throw std::runtime_error("zlib deflate failed");
    }

    compressed.resize(stream.total_out);
    deflateEnd(&stream);
    return compressed;
}

std::string decompress(const std::vector<uint8_t>& compressed) {
    z_stream stream{};
    stream.zalloc = Z_NULL;
    stream.zfree = Z_NULL;
    stream.opaque = Z_NULL;

    if (inflateInit(&stream) != Z_OK) {
        throw std::runtime_error("zlib inflateInit failed");
    }

    stream.avail_in = static_cast<uInt>(compressed.size());
    stream.next_in = const_cast<Bytef*>(compressed.data());

    std::string decompressed;
    std::vector<uint8_t> buffer(4096);

    int ret;
    do {
        stream.avail_out = static_cast<uInt>(buffer.size());
        stream.next_out = buffer.data();

        ret = inflate(&stream, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&stream);
            throw std::runtime_error("zlib inflate failed");
        }

        size_t have = buffer.size() - stream.avail_out;
        decompressed.append(reinterpret_cast<char*>(buffer.data()), have);
    } while (ret != Z_STREAM_END);

    inflateEnd(&stream);
    return decompressed;
}

std::string decompressFrom(std::istream& in, size_t expectedSize) {
    z_stream stream{};
    stream.zalloc = Z_NULL;
    stream.zfree = Z_NULL;
    stream.opaque = Z_NULL;

    if (inflateInit(&stream) != Z_OK) {
        throw std::runtime_error("zlib inflateInit failed");
    }

    // Output grows with what actually inflates; the announced size is only checked
    std::string out;
    std::vector<char> input(8192);
    std::vector<uint8_t> buffer(4096);
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        if (stream.avail_in == 0) {
            in.read(input.data(), static_cast<std::streamsize>(input.size()));
            std::streamsize got = in.gcount();
            if (got <= 0) {
                inflateEnd(&stream);
                throw std::runtime_error("pack entry truncated");
            }
            stream.next_in = reinterpret_cast<Bytef*>(input.data());
            stream.avail_in = static_cast<uInt>(got);
        }
        stream.next_out = buffer.data();
        stream.avail_out = static_cast<uInt>(buffer.size());
        ret = inflate(&stream, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&stream);
            throw std::runtime_error("zlib inflate failed");
        }
        if (stream.total_out > expectedSize) {
            inflateEnd(&stream);
            throw std::runtime_error("pack entry larger than announced");
        }
        out.append(reinterpret_cast<const char*>(buffer.data()), buffer.size() - stream.avail_out);
    }

    inflateEnd(&stream);
    if (out.size() != expectedSize) {
        throw std::runtime_error("pack entry size mismatch");
    }
    in.clear();  // a short final read leaves eof set
    return out;
}

}
}
