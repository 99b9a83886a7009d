#include "BatchJson.h"
#include "DedupeErrors.h"
#include "MediaType.h"

#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <fstream>

static constexpr std::size_t kSniffBytes = 16;

namespace {

// Standard alphabet, padded, no embedded whitespace.
std::vector<std::uint8_t> decode_base64(std::string const& in, std::string const& id)
{
    if (in.size() % 4 != 0)
        throw InvalidBatchError(fmt::format("file '{}': contentBase64 length {} is not a multiple of 4", id, in.size()));
    std::vector<std::uint8_t> out(in.size() / 4 * 3);
    if (in.empty())
        return out;

    int n = EVP_DecodeBlock(out.data(), reinterpret_cast<unsigned char const*>(in.data()), static_cast<int>(in.size()));
    if (n < 0)
        throw InvalidBatchError(fmt::format("file '{}': contentBase64 is not valid base64", id));

    // EVP_DecodeBlock counts padding as decoded zero bytes
    std::size_t pad = 0;
    if (in[in.size() - 1] == '=')
        ++pad;
    if (in[in.size() - 2] == '=')
        ++pad;
    out.resize(static_cast<std::size_t>(n) - pad);
    return out;
}

std::vector<std::uint8_t> sniffHead(FileDescriptor const& f)
{
    if (f.content) {
        auto n = std::min(f.content->size(), kSniffBytes);
        return { f.content->begin(), f.content->begin() + static_cast<std::ptrdiff_t>(n) };
    }
    std::vector<std::uint8_t> head;
    if (!f.path)
        return head;
    std::ifstream in(*f.path, std::ios::binary);
    if (!in)
        return head;
    head.resize(kSniffBytes);
    in.read(reinterpret_cast<char*>(head.data()), static_cast<std::streamsize>(head.size()));
    head.resize(static_cast<std::size_t>(in.gcount()));
    return head;
}

FileDescriptor parseFile(nlohmann::json const& jf, std::size_t index)
{
    if (!jf.is_object())
        throw InvalidBatchError(fmt::format("files[{}] is not an object", index));

    FileDescriptor f;
    jf.at("id").get_to(f.id);

    // "content" is UTF-8 text taken verbatim; arbitrary bytes go in "contentBase64"
    if (jf.contains("content") && jf.contains("contentBase64"))
        throw InvalidBatchError(fmt::format("file '{}' has both content and contentBase64", f.id));
    if (jf.contains("content")) {
        auto const& s = jf.at("content").get_ref<std::string const&>();
        f.content.emplace(s.begin(), s.end());
    } else if (jf.contains("contentBase64")) {
        f.content = decode_base64(jf.at("contentBase64").get_ref<std::string const&>(), f.id);
    }
    if (jf.contains("path"))
        f.path = jf.at("path").get<std::string>();

    if (jf.contains("size")) {
        if (!jf.at("size").is_number_unsigned())
            throw InvalidBatchError(fmt::format("file '{}': size must be a non-negative integer", f.id));
        jf.at("size").get_to(f.size);
    } else if (f.content) {
        f.size = f.content->size();
    } else if (f.path) {
        std::error_code ec;
        auto sz = std::filesystem::file_size(*f.path, ec);
        if (!ec)
            f.size = sz;
        else
            spdlog::warn("[json] '{}': cannot stat '{}': {}", f.id, *f.path, ec.message());
    }

    if (jf.contains("mediaType") && jf["mediaType"].get<std::string>() != "auto") {
        auto s = jf.at("mediaType").get<std::string>();
        auto t = media_type_from_string(s);
        if (!t)
            throw InvalidBatchError(fmt::format("file '{}': unknown mediaType '{}'", f.id, s));
        f.mediaType = *t;
    } else {
        f.mediaType = detect_media_type(sniffHead(f), f.path.value_or(f.id));
    }

    if (jf.contains("perceptualHash"))
        f.perceptualHash = jf.at("perceptualHash").get<std::string>();
    if (jf.contains("embedding"))
        f.embedding = jf.at("embedding").get<Embedding>();
    return f;
}

} // namespace

BatchRequest parseBatchRequest(nlohmann::json const& j)
{
    try {
        BatchRequest req;
        req.batchId = j.value("batchId", std::string {});
        if (j.contains("threshold") && !j["threshold"].is_null())
            req.threshold = j.at("threshold").get<double>();

        auto const& files = j.at("files");
        if (!files.is_array())
            throw InvalidBatchError("\"files\" must be an array");
        req.files.reserve(files.size());
        for (std::size_t i = 0; i < files.size(); ++i)
            req.files.push_back(parseFile(files[i], i));
        return req;
    } catch (nlohmann::json::exception const& e) {
        throw InvalidBatchError(std::string("malformed batch request: ") + e.what());
    }
}

BatchRequest loadBatchRequest(std::string const& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw IOError("cannot open request '" + path + "'");

    nlohmann::json j;
    try {
        in >> j;
    } catch (nlohmann::json::exception const& e) {
        throw InvalidBatchError("'" + path + "' is not valid JSON: " + e.what());
    }
    return parseBatchRequest(j);
}

nlohmann::json toJson(DedupeResult const& r)
{
    nlohmann::json groups = nlohmann::json::array();
    for (auto const& g : r.groups) {
        nlohmann::json edges = nlohmann::json::array();
        for (auto const& e : g.edges) {
            nlohmann::json je = { { "first", e.first },
                { "second", e.second },
                { "combined", e.combined },
                { "reason", e.reason } };
            if (e.exact)
                je["exact"] = *e.exact;
            if (e.perceptual)
                je["perceptual"] = *e.perceptual;
            if (e.embedding)
                je["embedding"] = *e.embedding;
            edges.push_back(std::move(je));
        }
        groups.push_back({ { "primary", g.primary },
            { "confidence", g.confidence },
            { "members", g.members },
            { "reclaimableBytes", g.reclaimableBytes },
            { "edges", std::move(edges) } });
    }

    return { { "batchId", r.batchId },
        { "groups", std::move(groups) },
        { "ungrouped", r.ungrouped },
        { "totals", { { "totalFiles", r.totals.totalFiles },
                        { "filesKept", r.totals.filesKept },
                        { "filesRemovable", r.totals.filesRemovable },
                        { "bytesReclaimable", r.totals.bytesReclaimable } } },
        { "stats", { { "filesFingerprinted", r.stats.filesFingerprinted },
                       { "pairsScored", r.stats.pairsScored },
                       { "pairsIncomparable", r.stats.pairsIncomparable },
                       { "pairsFailed", r.stats.pairsFailed },
                       { "embeddingBatchesFailed", r.stats.embeddingBatchesFailed } } } };
}
