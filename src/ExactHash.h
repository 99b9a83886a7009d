#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

struct evp_md_ctx_st;

// Incremental SHA-256. Feed bytes with update(), read the lowercase hex
// digest with hexdigest(). The object is single-use.
class Sha256Digest {
public:
    Sha256Digest();
    ~Sha256Digest();

    Sha256Digest(Sha256Digest const&) = delete;
    Sha256Digest& operator=(Sha256Digest const&) = delete;

    void update(void const* data, std::size_t len);
    std::string hexdigest();

private:
    struct CtxDeleter {
        void operator()(evp_md_ctx_st* p) const noexcept;
    };
    std::unique_ptr<evp_md_ctx_st, CtxDeleter> m_ctx;
    bool m_finished = false;
};

inline constexpr std::size_t kHashChunkBytes = 64 * 1024;

std::string sha256_hex(std::uint8_t const* data, std::size_t len);
std::string sha256_hex(std::vector<std::uint8_t> const& data);

// Reads `in` to the end in fixed-size chunks. Throws IOError if the stream
// reports a read error before end of input.
std::string sha256_hex_stream(std::istream& in);

// Throws IOError if the file cannot be opened or read.
std::string sha256_hex_file(std::string const& path);
