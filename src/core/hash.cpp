#include <ccpm/core/hash.hpp>

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>

namespace ccpm {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

Error MakeHashError(const std::string& path, const std::string& message) {
    return Error{"Hash", path, message, std::nullopt, ErrorCategory::Internal};
}

Result<MdCtxPtr, Error> NewSha256Context(const std::string& path) {
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return Result<MdCtxPtr, Error>::Err(
            MakeHashError(path, "Failed to allocate digest context"));
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return Result<MdCtxPtr, Error>::Err(
            MakeHashError(path, "Failed to initialize SHA-256 digest"));
    }
    return Result<MdCtxPtr, Error>::Ok(std::move(ctx));
}

std::string ToHex(const unsigned char* bytes, std::size_t len) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < len; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

Result<std::string, Error> Finish(EVP_MD_CTX* ctx, const std::string& path) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx, digest, &digest_len) != 1) {
        return Result<std::string, Error>::Err(
            MakeHashError(path, "Failed to finalize SHA-256 digest"));
    }
    return Result<std::string, Error>::Ok(ToHex(digest, digest_len));
}

} // anonymous namespace

Result<std::string, Error> HashFile(const std::filesystem::path& path) {
    const auto path_str = path.string();

    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        return Result<std::string, Error>::Err(Error::FromErrno("Hash", path_str));
    }

    auto ctx = NewSha256Context(path_str);
    if (ctx.IsErr()) {
        return Result<std::string, Error>::Err(std::move(ctx).Error());
    }

    char buffer[8192];
    while (ifs.read(buffer, sizeof(buffer)) || ifs.gcount() > 0) {
        if (EVP_DigestUpdate(ctx.Value().get(), buffer,
                             static_cast<std::size_t>(ifs.gcount())) != 1) {
            return Result<std::string, Error>::Err(
                MakeHashError(path_str, "Failed to update SHA-256 digest"));
        }
    }
    if (ifs.bad()) {
        return Result<std::string, Error>::Err(
            Error{"Hash", path_str, "Read error while hashing file",
                  std::nullopt, ErrorCategory::Io});
    }

    return Finish(ctx.Value().get(), path_str);
}

Result<std::string, Error> HashBytes(std::string_view data) {
    auto ctx = NewSha256Context("");
    if (ctx.IsErr()) {
        return Result<std::string, Error>::Err(std::move(ctx).Error());
    }
    if (EVP_DigestUpdate(ctx.Value().get(), data.data(), data.size()) != 1) {
        return Result<std::string, Error>::Err(
            MakeHashError("", "Failed to update SHA-256 digest"));
    }
    return Finish(ctx.Value().get(), "");
}

Result<std::string, Error> RandomHex(std::size_t num_bytes) {
    std::vector<unsigned char> bytes(num_bytes);
    if (num_bytes > 0 && RAND_bytes(bytes.data(), static_cast<int>(num_bytes)) != 1) {
        return Result<std::string, Error>::Err(
            MakeHashError("", "Failed to generate random bytes"));
    }
    return Result<std::string, Error>::Ok(ToHex(bytes.data(), bytes.size()));
}

bool FilesIdentical(const std::filesystem::path& a,
                    const std::filesystem::path& b) {
    auto ha = HashFile(a);
    if (ha.IsErr()) {
        return false;
    }
    auto hb = HashFile(b);
    if (hb.IsErr()) {
        return false;
    }
    return ha.Value() == hb.Value();
}

} // namespace ccpm
