#include "content_reader.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <cctype>
#include <memory>
#include <mutex>
#include <poppler-document.h>
#include <poppler-global.h>
#include <poppler-page.h>

namespace {

std::string StripBom(const std::string& text) {
    if (text.size() >= 3 && text.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        return text.substr(3);
    }
    return text;
}

nlohmann::json ParseJsonText(const std::string& text, const std::string& what) {
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw UnsupportedContentError(what + " is not valid JSON: " + e.what());
    }
}

nlohmann::json DecodeJsonLines(const std::string& text, const std::string& key) {
    nlohmann::json rows = nlohmann::json::array();
    std::size_t start = 0;
    std::size_t line_number = 0;
    while (start < text.size()) {
        std::size_t end = text.find('\n', start);
        if (end == std::string::npos) end = text.size();
        std::string line = text.substr(start, end - start);
        start = end + 1;
        line_number++;

        bool blank = true;
        for (char c : line) {
            if (!std::isspace(static_cast<unsigned char>(c))) {
                blank = false;
                break;
            }
        }
        if (blank) continue;

        rows.push_back(ParseJsonText(line, key + " line " + std::to_string(line_number)));
    }
    return rows;
}

nlohmann::json DecodeCsv(const std::string& text) {
    auto records = ParseCsv(text);
    nlohmann::json rows = nlohmann::json::array();
    if (records.empty()) {
        return rows;
    }

    const std::vector<std::string>& header = records.front();
    for (std::size_t r = 1; r < records.size(); ++r) {
        const auto& record = records[r];
        nlohmann::json row = nlohmann::json::object();
        for (std::size_t c = 0; c < header.size(); ++c) {
            if (c < record.size()) {
                row[header[c]] = record[c];
            } else {
                row[header[c]] = nullptr;
            }
        }
        if (record.size() > header.size()) {
            nlohmann::json extra = nlohmann::json::array();
            for (std::size_t c = header.size(); c < record.size(); ++c) {
                extra.push_back(record[c]);
            }
            row["_extra"] = extra;
        }
        rows.push_back(row);
    }
    return rows;
}

void PopplerDebug(const std::string& message, void*) {
    Logger::Debug(message, "Poppler");
}

} // namespace

std::string ContentExtension(const std::string& key) {
    std::size_t slash = key.rfind('/');
    std::size_t dot = key.rfind('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return "";
    }
    std::string ext = key.substr(dot + 1);
    for (auto& c : ext) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return ext;
}

bool IsDecodableKey(const std::string& key) {
    std::string ext = ContentExtension(key);
    return ext == "txt" || ext == "md" || ext == "json" || ext == "jsonl" || ext == "csv" || ext == "pdf";
}

bool IsValidUtf8(const std::string& text) {
    const auto* s = reinterpret_cast<const unsigned char*>(text.data());
    std::size_t n = text.size();
    std::size_t i = 0;
    while (i < n) {
        unsigned char c = s[i];
        std::size_t len;
        unsigned int cp;
        if (c < 0x80) {
            i++;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + len > n) return false;
        for (std::size_t k = 1; k < len; ++k) {
            if ((s[i + k] & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (s[i + k] & 0x3F);
        }
        // Overlong forms, surrogates and values past U+10FFFF.
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += len;
    }
    return true;
}

std::vector<std::vector<std::string>> ParseCsv(const std::string& text) {
    std::vector<std::vector<std::string>> records;
    std::vector<std::string> record;
    std::string field;
    bool in_quotes = false;
    bool field_started = false;

    auto end_record = [&]() {
        record.push_back(field);
        field.clear();
        field_started = false;
        // A line holding nothing is not a record.
        if (!(record.size() == 1 && record[0].empty())) {
            records.push_back(record);
        }
        record.clear();
    };

    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field += c;
            }
            continue;
        }

        if (c == '"' && !field_started) {
            in_quotes = true;
            field_started = true;
        } else if (c == ',') {
            record.push_back(field);
            field.clear();
            field_started = false;
        } else if (c == '\r') {
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
            end_record();
        } else if (c == '\n') {
            end_record();
        } else {
            field += c;
            field_started = true;
        }
    }

    if (in_quotes) {
        throw UnsupportedContentError("CSV content ends inside a quoted field");
    }
    if (field_started || !field.empty() || !record.empty()) {
        end_record();
    }
    return records;
}

std::vector<std::string> ExtractPdfPages(const std::string& bytes) {
    // poppler prints parser warnings to stderr unless told otherwise.
    static std::once_flag debug_hook;
    std::call_once(debug_hook, []() { poppler::set_debug_error_function(PopplerDebug, nullptr); });

    std::unique_ptr<poppler::document> doc(
        poppler::document::load_from_raw_data(bytes.data(), static_cast<int>(bytes.size())));
    if (!doc) {
        throw UnsupportedContentError("Content is not a readable PDF document");
    }
    if (doc->is_locked()) {
        throw UnsupportedContentError("PDF document is password protected");
    }

    std::vector<std::string> pages;
    const int count = doc->pages();
    pages.reserve(count > 0 ? count : 0);
    for (int i = 0; i < count; ++i) {
        std::unique_ptr<poppler::page> page(doc->create_page(i));
        if (!page) {
            pages.emplace_back();
            continue;
        }
        poppler::byte_array utf8 = page->text().to_utf8();
        pages.emplace_back(utf8.begin(), utf8.end());
    }
    return pages;
}

DecodedContent DecodeContent(const std::string& key, const std::string& bytes) {
    std::string ext = ContentExtension(key);
    if (!IsDecodableKey(key)) {
        throw UnsupportedContentError("Unsupported file type '" + (ext.empty() ? std::string("<none>") : ext) +
                                      "' for " + key);
    }

    DecodedContent result;
    if (ext == "pdf") {
        std::vector<std::string> pages;
        try {
            pages = ExtractPdfPages(bytes);
        } catch (const UnsupportedContentError& e) {
            throw UnsupportedContentError(key + ": " + e.what());
        }
        result.format = "pdf";
        result.data = pages;
        return result;
    }

    if (!IsValidUtf8(bytes)) {
        throw UnsupportedContentError(key + " is not valid UTF-8 text");
    }
    std::string text = StripBom(bytes);

    if (ext == "txt" || ext == "md") {
        result.format = "text";
        result.data = text;
    } else if (ext == "json") {
        result.format = "json";
        result.data = ParseJsonText(text, key);
    } else if (ext == "jsonl") {
        result.format = "jsonl";
        result.data = DecodeJsonLines(text, key);
    } else {
        result.format = "csv";
        result.data = DecodeCsv(text);
    }
    return result;
}
