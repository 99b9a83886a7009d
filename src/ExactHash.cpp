#include "ExactHash.h"
#include "DedupeErrors.h"

#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include <array>
#include <fstream>
#include <istream>

namespace {
std::string to_hex(unsigned char const* md, unsigned int len)
{
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(static_cast<std::size_t>(len) * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out.push_back(kDigits[md[i] >> 4]);
        out.push_back(kDigits[md[i] & 0x0F]);
    }
    return out;
}
} // namespace

void Sha256Digest::CtxDeleter::operator()(evp_md_ctx_st* p) const noexcept
{
    EVP_MD_CTX_free(p);
}

Sha256Digest::Sha256Digest()
    : m_ctx(EVP_MD_CTX_new())
{
    if (!m_ctx)
        throw DedupeError("EVP_MD_CTX_new failed");
    if (EVP_DigestInit_ex(m_ctx.get(), EVP_sha256(), nullptr) != 1)
        throw DedupeError("EVP_DigestInit_ex(sha256) failed");
}

Sha256Digest::~Sha256Digest() = default;

void Sha256Digest::update(void const* data, std::size_t len)
{
    if (m_finished)
        throw DedupeError("Sha256Digest::update after hexdigest");
    if (len == 0)
        return;
    if (EVP_DigestUpdate(m_ctx.get(), data, len) != 1)
        throw DedupeError("EVP_DigestUpdate failed");
}

std::string Sha256Digest::hexdigest()
{
    if (m_finished)
        throw DedupeError("Sha256Digest::hexdigest called twice");

    std::array<unsigned char, EVP_MAX_MD_SIZE> md {};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(m_ctx.get(), md.data(), &len) != 1)
        throw DedupeError("EVP_DigestFinal_ex failed");
    m_finished = true;
    return to_hex(md.data(), len);
}

std::string sha256_hex(std::uint8_t const* data, std::size_t len)
{
    Sha256Digest d;
    d.update(data, len);
    return d.hexdigest();
}

std::string sha256_hex(std::vector<std::uint8_t> const& data)
{
    return sha256_hex(data.data(), data.size());
}

std::string sha256_hex_stream(std::istream& in)
{
    Sha256Digest d;
    std::array<char, kHashChunkBytes> buf;

    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        auto got = in.gcount();
        if (got > 0)
            d.update(buf.data(), static_cast<std::size_t>(got));
    }
    // read() sets failbit at end of input; badbit means the source failed
    if (in.bad() || !in.eof())
        throw IOError("read error while hashing stream");

    return d.hexdigest();
}

std::string sha256_hex_file(std::string const& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw IOError("cannot open '" + path + "'");

    try {
        return sha256_hex_stream(in);
    } catch (IOError const&) {
        spdlog::warn("[exact] read error on '{}'", path);
        throw IOError("read error on '" + path + "'");
    }
}
