#include "utils.hpp"
#include <openssl/evp.h>
#include <fstream>
#include <memory>
#include <random>
#include <stdexcept>

namespace {

constexpr std::size_t kDigestReadChunk = 64 * 1024;

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestContext new_sha256_context() {
    DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if(!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("sha256: failed to initialise digest context");
    }
    return ctx;
}

std::vector<unsigned char> finish(DigestContext& ctx) {
    std::vector<unsigned char> out(EVP_MAX_MD_SIZE);
    unsigned int length = 0;
    if(EVP_DigestFinal_ex(ctx.get(), out.data(), &length) != 1) {
        throw std::runtime_error("sha256: failed to finalise digest");
    }
    out.resize(length);
    return out;
}

} // namespace

std::string base64_from_bytes(const std::vector<unsigned char>& b){
    if(b.empty()) return "";
    std::string out(4 * ((b.size() + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), b.data(), static_cast<int>(b.size()));
    out.resize(static_cast<std::size_t>(written));
    return out;
}

std::vector<unsigned char> sha256_bytes(const std::vector<char>& data){
    auto ctx = new_sha256_context();
    if(!data.empty() && EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("sha256: digest update failed");
    }
    return finish(ctx);
}

std::vector<unsigned char> sha256_file(const std::filesystem::path& path){
    std::ifstream in(path, std::ios::binary);
    if(!in) {
        throw std::runtime_error("file_open_failed: cannot read " + path.string());
    }
    auto ctx = new_sha256_context();
    std::vector<char> buffer(kDigestReadChunk);
    while(in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = in.gcount();
        if(got <= 0) break;
        if(EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(got)) != 1) {
            throw std::runtime_error("sha256: digest update failed");
        }
    }
    if(in.bad()) {
        throw std::runtime_error("file_read_failed: error while reading " + path.string());
    }
    return finish(ctx);
}

std::string random_token(std::size_t length){
    static const char alphabet[] = "abcdefghijklmnopqrstuvwxyz0123456789";
    thread_local std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<std::size_t> pick(0, sizeof(alphabet) - 2);
    std::string out;
    out.reserve(length);
    for(std::size_t i = 0; i < length; ++i) out.push_back(alphabet[pick(rng)]);
    return out;
}
