#pragma once

#include "alignment_document.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace tmx_align {

enum class ParseErrorCode {
    ReadFailed,
    MalformedXml,
    NotTmx,
    MissingHeader,
    MissingBody,
    TooFewLanguages
};

const char* parse_error_name(ParseErrorCode code);

struct ParseError {
    ParseErrorCode code = ParseErrorCode::MalformedXml;
    std::string message;
};

// What the two-language reduction left behind.
struct TmxLoadReport {
    std::size_t units_total = 0;
    std::size_t units_skipped = 0;
    std::vector<std::string> dropped_langs;
};

bool parse_tmx(
    std::string_view bytes,
    AlignmentDocument& out_doc,
    ParseError& error,
    TmxLoadReport* report = nullptr
);

// Sets the document's origin path on success.
bool read_tmx_file(
    const std::filesystem::path& path,
    AlignmentDocument& out_doc,
    ParseError& error,
    TmxLoadReport* report = nullptr
);

// TMX 1.4b, UTF-8, one <tu> per row with a source and a target <tuv>.
std::string serialize_tmx(const AlignmentDocument& doc);

}  // namespace tmx_align
