#include "tmx_codec.hpp"

#include "text_utils.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <utility>

#include <pugixml.hpp>

namespace tmx_align {

namespace {

constexpr const char* kCreationTool = "tmx_align";
constexpr const char* kCreationToolVersion = "0.1.0";
constexpr const char* kTargetLangProp = "x-targetlang";

struct string_writer : pugi::xml_writer {
    std::string result;

    void write(const void* data, std::size_t size) override {
        result.append(static_cast<const char*>(data), size);
    }
};

std::string local_name(const char* raw_name) {
    if (raw_name == nullptr) {
        return {};
    }
    std::string name(raw_name);
    const auto pos = name.find(':');
    if (pos == std::string::npos) {
        return name;
    }
    return name.substr(pos + 1);
}

pugi::xml_node find_child(const pugi::xml_node& parent, const std::string& name) {
    for (const auto& child : parent.children()) {
        if (child.type() == pugi::node_element && local_name(child.name()) == name) {
            return child;
        }
    }
    return {};
}

std::string tuv_lang(const pugi::xml_node& tuv) {
    if (const auto attr = tuv.attribute("xml:lang")) {
        return normalize_lang(attr.value());
    }
    // TMX 1.1 spelling.
    if (const auto attr = tuv.attribute("lang")) {
        return normalize_lang(attr.value());
    }
    return {};
}

// Character data decoded, inline elements kept as their raw markup.
std::string render_content(const pugi::xml_node& parent) {
    std::string out;
    for (const auto& child : parent.children()) {
        if (child.type() == pugi::node_pcdata || child.type() == pugi::node_cdata) {
            out.append(child.value());
        } else if (child.type() == pugi::node_element) {
            string_writer writer;
            child.print(writer, "", pugi::format_raw, pugi::encoding_utf8);
            out.append(writer.result);
        }
    }
    return out;
}

std::string segment_text(const pugi::xml_node& tuv) {
    const auto seg = find_child(tuv, "seg");
    if (!seg) {
        return {};
    }
    return render_content(seg);
}

// Inline markup goes back out as XML only when it reads back unchanged.
void write_segment_content(pugi::xml_node seg, const std::string& text) {
    if (text.find('<') != std::string::npos) {
        pugi::xml_document fragment;
        const auto parsed = fragment.load_buffer(
            text.data(),
            text.size(),
            pugi::parse_default | pugi::parse_ws_pcdata | pugi::parse_fragment,
            pugi::encoding_utf8
        );
        if (parsed && render_content(fragment) == text) {
            for (const auto& child : fragment.children()) {
                seg.append_copy(child);
            }
            return;
        }
    }
    if (!text.empty()) {
        seg.append_child(pugi::node_pcdata).set_value(text.c_str());
    }
}

void append_break(pugi::xml_node parent, int depth) {
    const std::string ws = "\n" + std::string(static_cast<std::size_t>(depth) * 2, ' ');
    parent.append_child(pugi::node_pcdata).set_value(ws.c_str());
}

// pugixml writes CR in character data as-is, and a reader folds it into LF.
std::string escape_carriage_returns(const std::string& xml) {
    std::string out;
    out.reserve(xml.size());
    for (const char ch : xml) {
        if (ch == '\r') {
            out += "&#13;";
        } else {
            out.push_back(ch);
        }
    }
    return out;
}

// srclang, then the target language recorded in a header <prop>.
std::vector<std::string> declared_languages(const pugi::xml_node& header) {
    std::vector<std::string> out;
    const std::string srclang = normalize_lang(header.attribute("srclang").value());
    if (!srclang.empty() && srclang != "*all*") {
        out.push_back(srclang);
    }
    for (const auto& prop : header.children()) {
        if (prop.type() != pugi::node_element || local_name(prop.name()) != "prop" ||
            std::string(prop.attribute("type").value()) != kTargetLangProp) {
            continue;
        }
        const std::string lang = normalize_lang(prop.text().get());
        if (!lang.empty() && std::find(out.begin(), out.end(), lang) == out.end()) {
            out.push_back(lang);
        }
    }
    return out;
}

struct UnitSegments {
    std::vector<std::pair<std::string, std::string>> variants;
};

struct LangCount {
    std::string lang;
    std::size_t units = 0;
};

void count_languages(const std::vector<UnitSegments>& units, std::vector<LangCount>& counts) {
    for (const auto& unit : units) {
        std::vector<std::string> seen;
        for (const auto& variant : unit.variants) {
            const std::string& lang = variant.first;
            if (lang.empty() || std::find(seen.begin(), seen.end(), lang) != seen.end()) {
                continue;
            }
            seen.push_back(lang);

            auto it = std::find_if(counts.begin(), counts.end(), [&](const LangCount& c) { return c.lang == lang; });
            if (it == counts.end()) {
                counts.push_back(LangCount{lang, 1});
            } else {
                ++it->units;
            }
        }
    }

    // Stable: ties keep first-encountered order.
    std::stable_sort(counts.begin(), counts.end(), [](const LangCount& a, const LangCount& b) {
        return a.units > b.units;
    });
}

const std::string* first_variant(const UnitSegments& unit, const std::string& lang) {
    for (const auto& variant : unit.variants) {
        if (variant.first == lang) {
            return &variant.second;
        }
    }
    return nullptr;
}

}  // namespace

const char* parse_error_name(ParseErrorCode code) {
    switch (code) {
        case ParseErrorCode::ReadFailed:
            return "ReadFailed";
        case ParseErrorCode::MalformedXml:
            return "MalformedXml";
        case ParseErrorCode::NotTmx:
            return "NotTmx";
        case ParseErrorCode::MissingHeader:
            return "MissingHeader";
        case ParseErrorCode::MissingBody:
            return "MissingBody";
        case ParseErrorCode::TooFewLanguages:
            return "TooFewLanguages";
    }
    return "Unknown";
}

bool parse_tmx(std::string_view bytes, AlignmentDocument& out_doc, ParseError& error, TmxLoadReport* report) {
    pugi::xml_document xml;
    const pugi::xml_parse_result parse = xml.load_buffer(
        bytes.data(),
        bytes.size(),
        pugi::parse_default | pugi::parse_ws_pcdata,
        pugi::encoding_auto
    );
    if (!parse) {
        error.code = ParseErrorCode::MalformedXml;
        error.message = std::string("Malformed XML at offset ") + std::to_string(parse.offset) + ": " +
            parse.description();
        return false;
    }

    const auto root = xml.document_element();
    if (!root || ascii_lower(local_name(root.name())) != "tmx") {
        error.code = ParseErrorCode::NotTmx;
        error.message = std::string("Root element is <") + (root ? root.name() : "") + ">, expected <tmx>";
        return false;
    }

    const auto header = find_child(root, "header");
    if (!header) {
        error.code = ParseErrorCode::MissingHeader;
        error.message = "TMX file has no <header> element";
        return false;
    }

    const auto body = find_child(root, "body");
    if (!body) {
        error.code = ParseErrorCode::MissingBody;
        error.message = "TMX file has no <body> element";
        return false;
    }

    std::vector<UnitSegments> units;
    for (const auto& tu : body.children()) {
        if (tu.type() != pugi::node_element || local_name(tu.name()) != "tu") {
            continue;
        }
        UnitSegments unit;
        for (const auto& tuv : tu.children()) {
            if (tuv.type() != pugi::node_element || local_name(tuv.name()) != "tuv") {
                continue;
            }
            unit.variants.emplace_back(tuv_lang(tuv), segment_text(tuv));
        }
        units.push_back(std::move(unit));
    }

    std::vector<LangCount> counts;
    count_languages(units, counts);
    if (counts.size() < 2) {
        // Units alone do not name a pair (an empty document, say); fall back to the header.
        for (const auto& lang : declared_languages(header)) {
            const bool known = std::any_of(counts.begin(), counts.end(), [&](const LangCount& c) {
                return c.lang == lang;
            });
            if (!known) {
                counts.push_back(LangCount{lang, 0});
            }
        }
    }
    if (counts.size() < 2) {
        error.code = ParseErrorCode::TooFewLanguages;
        error.message = "TMX file declares " + std::to_string(counts.size()) +
            " language(s) across its header and translation units; at least two are required";
        return false;
    }

    std::string source_lang = counts[0].lang;
    std::string target_lang = counts[1].lang;
    const std::string declared_src = normalize_lang(header.attribute("srclang").value());
    if (declared_src == target_lang) {
        std::swap(source_lang, target_lang);
    }

    std::vector<RowText> rows;
    rows.reserve(units.size());
    std::size_t skipped = 0;
    for (const auto& unit : units) {
        const std::string* source = first_variant(unit, source_lang);
        const std::string* target = first_variant(unit, target_lang);
        if (source == nullptr && target == nullptr) {
            ++skipped;
            continue;
        }
        rows.push_back(RowText{source ? *source : std::string{}, target ? *target : std::string{}});
    }

    if (report != nullptr) {
        report->units_total = units.size();
        report->units_skipped = skipped;
        report->dropped_langs.clear();
        for (std::size_t i = 2; i < counts.size(); ++i) {
            report->dropped_langs.push_back(counts[i].lang);
        }
    }

    out_doc = AlignmentDocument(std::move(source_lang), std::move(target_lang), std::move(rows));
    return true;
}

bool read_tmx_file(
    const std::filesystem::path& path,
    AlignmentDocument& out_doc,
    ParseError& error,
    TmxLoadReport* report
) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error.code = ParseErrorCode::ReadFailed;
        error.message = "Failed to open " + path.string();
        return false;
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        error.code = ParseErrorCode::ReadFailed;
        error.message = "Failed to read " + path.string();
        return false;
    }

    AlignmentDocument doc;
    if (!parse_tmx(buffer.str(), doc, error, report)) {
        error.message = path.string() + ": " + error.message;
        return false;
    }

    doc.set_origin_path(path);
    out_doc = std::move(doc);
    return true;
}

std::string serialize_tmx(const AlignmentDocument& doc) {
    pugi::xml_document xml;

    auto decl = xml.append_child(pugi::node_declaration);
    decl.append_attribute("version") = "1.0";
    decl.append_attribute("encoding") = "UTF-8";

    auto tmx = xml.append_child("tmx");
    tmx.append_attribute("version") = "1.4";

    append_break(tmx, 1);
    auto header = tmx.append_child("header");
    header.append_attribute("creationtool") = kCreationTool;
    header.append_attribute("creationtoolversion") = kCreationToolVersion;
    header.append_attribute("segtype") = "sentence";
    header.append_attribute("o-tmf") = kCreationTool;
    header.append_attribute("adminlang") = "en";
    header.append_attribute("srclang") = doc.source_lang().c_str();
    header.append_attribute("datatype") = "plaintext";
    append_break(header, 2);
    auto target_prop = header.append_child("prop");
    target_prop.append_attribute("type") = kTargetLangProp;
    target_prop.text().set(doc.target_lang().c_str());
    append_break(header, 1);

    append_break(tmx, 1);
    auto body = tmx.append_child("body");

    for (const auto& row : doc.rows()) {
        append_break(body, 2);
        auto tu = body.append_child("tu");
        for (const Column column : {Column::Source, Column::Target}) {
            append_break(tu, 3);
            auto tuv = tu.append_child("tuv");
            tuv.append_attribute("xml:lang") = doc.lang(column).c_str();
            auto seg = tuv.append_child("seg");
            write_segment_content(seg, row.text(column));
        }
        append_break(tu, 2);
    }
    append_break(body, 1);
    append_break(tmx, 0);

    string_writer writer;
    xml.save(writer, "", pugi::format_raw | pugi::format_no_empty_element_tags, pugi::encoding_utf8);
    writer.result.push_back('\n');
    return escape_carriage_returns(writer.result);
}

}  // namespace tmx_align
