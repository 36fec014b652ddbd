#include "psync/sync/hash.hpp"

#include <openssl/evp.h>

#include <cerrno>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace psync::sync {
namespace {

const EVP_MD* evp_for(StrongDigest digest) {
    switch (digest) {
        case StrongDigest::Md5: return EVP_md5();
        case StrongDigest::Sha256: return EVP_sha256();
    }
    return EVP_sha256();
}

struct EvpContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using EvpContext = std::unique_ptr<EVP_MD_CTX, EvpContextDeleter>;

class EvpStrongHasher final : public StrongHasher {
public:
    explicit EvpStrongHasher(const EVP_MD* md) : ctx_(EVP_MD_CTX_new()) {
        if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), md, nullptr) != 1) {
            throw std::runtime_error("EVP_DigestInit_ex failed");
        }
    }

    void update(const std::uint8_t* data, std::size_t length) override {
        if (length > 0 && EVP_DigestUpdate(ctx_.get(), data, length) != 1) {
            throw std::runtime_error("EVP_DigestUpdate failed");
        }
    }

    Digest finish() override {
        unsigned char out[EVP_MAX_MD_SIZE];
        unsigned int out_length = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), out, &out_length) != 1) {
            throw std::runtime_error("EVP_DigestFinal_ex failed");
        }
        return Digest(reinterpret_cast<const char*>(out), out_length);
    }

private:
    EvpContext ctx_;
};

} // namespace

WeakSum HashProvider::weak_init(const std::uint8_t* data, std::size_t length) const {
    WeakSum sum;
    sum.window = length;
    for (std::size_t i = 0; i < length; ++i) {
        sum.a += data[i];
        sum.b += static_cast<std::uint32_t>(length - i) * data[i];
    }
    return sum;
}

WeakSum HashProvider::weak_roll(WeakSum current, std::uint8_t outgoing, std::uint8_t incoming) const {
    current.a = current.a - outgoing + incoming;
    current.b = current.b - static_cast<std::uint32_t>(current.window) * outgoing + current.a;
    return current;
}

WeakSum HashProvider::weak_shrink(WeakSum current, std::uint8_t outgoing) const {
    current.a -= outgoing;
    current.b -= static_cast<std::uint32_t>(current.window) * outgoing;
    --current.window;
    return current;
}

OpenSslHashProvider::OpenSslHashProvider(StrongDigest digest) : digest_(digest) {}

Digest OpenSslHashProvider::strong(const std::uint8_t* data, std::size_t length) const {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_length = 0;
    if (EVP_Digest(data, length, out, &out_length, evp_for(digest_), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest failed");
    }
    return Digest(reinterpret_cast<const char*>(out), out_length);
}

std::unique_ptr<StrongHasher> OpenSslHashProvider::strong_stream() const {
    return std::make_unique<EvpStrongHasher>(evp_for(digest_));
}

Result<Digest> hash_file(const HashProvider& hashes, const std::filesystem::path& path, std::size_t buffer_size) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<Digest>(io_error("Failed to open file for hashing: " + path.string(),
                                    std::error_code(errno, std::generic_category())));
    }

    auto hasher = hashes.strong_stream();
    std::vector<char> buffer(buffer_size == 0 ? 4096 : buffer_size);
    while (input.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || input.gcount() > 0) {
        hasher->update(reinterpret_cast<const std::uint8_t*>(buffer.data()),
                       static_cast<std::size_t>(input.gcount()));
    }
    if (input.bad()) {
        return Err<Digest>(io_error("Failed to read file for hashing: " + path.string(),
                                    std::error_code(EIO, std::generic_category())));
    }
    return Ok(hasher->finish());
}

std::string to_hex(const Digest& digest) {
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(digest.size() * 2);
    for (unsigned char byte : digest) {
        out += hex[(byte >> 4) & 0xF];
        out += hex[byte & 0xF];
    }
    return out;
}

} // namespace psync::sync
