#pragma once

#include "DedupeResult.h"
#include "FileDescriptor.h"

#include <nlohmann/json.hpp>
#include <string>

// Request: {"batchId", "threshold"?, "files": [{"id", "size"?, "mediaType"?,
// "content"? | "contentBase64"? | "path"?, "perceptualHash"?, "embedding"?}]}.
// "content" is UTF-8 text; binary samples are sent base64-encoded.
// A missing size is taken from the content or the file on disk; a missing
// mediaType is detected from magic bytes and extension.
// Throws InvalidBatchError on malformed JSON structure.
BatchRequest parseBatchRequest(nlohmann::json const& j);
BatchRequest loadBatchRequest(std::string const& path);

nlohmann::json toJson(DedupeResult const& r);
