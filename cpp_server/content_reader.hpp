#ifndef CONTENT_READER_HPP
#define CONTENT_READER_HPP

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Decoded form of an object read inline.
struct DecodedContent {
    std::string format; // "text", "json", "jsonl", "csv" or "pdf"
    nlohmann::json data;
};

// Lowercased extension after the last '.', empty when there is none.
std::string ContentExtension(const std::string& key);

// True when `key` has an extension DecodeContent understands.
bool IsDecodableKey(const std::string& key);

// Decodes by extension:
//   txt, md  -> string
//   json     -> parsed value
//   jsonl    -> array of parsed lines, blank lines skipped
//   csv      -> array of objects keyed by the header row
//   pdf      -> array of page texts, one string per page
// Throws UnsupportedContentError for other extensions and for bytes that are
// not valid UTF-8 (text formats) or do not parse.
DecodedContent DecodeContent(const std::string& key, const std::string& bytes);

bool IsValidUtf8(const std::string& text);

// Text of every page, in page order. Throws UnsupportedContentError for bytes
// poppler cannot open and for password-protected documents.
std::vector<std::string> ExtractPdfPages(const std::string& bytes);

// RFC 4180 records. Quoted fields may hold separators, doubled quotes and line
// breaks. Throws UnsupportedContentError on an unterminated quote.
std::vector<std::vector<std::string>> ParseCsv(const std::string& text);

#endif // CONTENT_READER_HPP
