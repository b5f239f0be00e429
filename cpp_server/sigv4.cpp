#include "sigv4.hpp"
#include <openssl/hmac.h>
#include <openssl/sha.h>
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace {

const char kUnsignedPayload[] = "UNSIGNED-PAYLOAD";
const char kAlgorithm[] = "AWS4-HMAC-SHA256";

std::string TrimHeaderValue(const std::string& value) {
    auto begin = std::find_if_not(value.begin(), value.end(),
                                  [](unsigned char c) { return std::isspace(c) != 0; });
    auto end = std::find_if_not(value.rbegin(), value.rend(),
                                [](unsigned char c) { return std::isspace(c) != 0; }).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

} // namespace

std::string HmacSha256(const std::string& key, const std::string& msg) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    unsigned int hash_len = 0;
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.length()),
         reinterpret_cast<const unsigned char*>(msg.data()), msg.length(),
         hash, &hash_len);
    return std::string(reinterpret_cast<char*>(hash), hash_len);
}

std::string HexEncode(const unsigned char* data, size_t len) {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        ss << std::setw(2) << static_cast<int>(data[i]);
    }
    return ss.str();
}

std::string Sha256Hex(const std::string& str) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(str.data()), str.length(), hash);
    return HexEncode(hash, SHA256_DIGEST_LENGTH);
}

std::string UriEncode(const std::string& value, bool encode_slash) {
    std::ostringstream out;
    out << std::uppercase << std::hex << std::setfill('0');
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out << c;
        } else if (c == '/' && !encode_slash) {
            out << c;
        } else {
            out << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return out.str();
}

std::string CanonicalQueryString(const QueryParams& params) {
    std::vector<std::string> encoded;
    encoded.reserve(params.size());
    for (const auto& param : params) {
        encoded.push_back(UriEncode(param.first, true) + "=" + UriEncode(param.second, true));
    }
    std::sort(encoded.begin(), encoded.end());

    std::string result;
    for (const auto& item : encoded) {
        if (!result.empty()) {
            result += "&";
        }
        result += item;
    }
    return result;
}

std::string AmzDateNow() {
    time_t now = time(nullptr);
    tm gmt{};
    gmtime_r(&now, &gmt);
    char date_iso[20];
    strftime(date_iso, sizeof(date_iso), "%Y%m%dT%H%M%SZ", &gmt);
    return date_iso;
}

SigV4Signer::SigV4Signer(AwsCredentials credentials, std::string region, std::string service)
    : credentials_(std::move(credentials)), region_(std::move(region)), service_(std::move(service)) {}

std::string SigV4Signer::Scope(const std::string& date_ymd) const {
    return date_ymd + "/" + region_ + "/" + service_ + "/aws4_request";
}

std::string SigV4Signer::SigningKey(const std::string& date_ymd) const {
    std::string k_date = HmacSha256("AWS4" + credentials_.secret_key, date_ymd);
    std::string k_region = HmacSha256(k_date, region_);
    std::string k_service = HmacSha256(k_region, service_);
    return HmacSha256(k_service, "aws4_request");
}

void SigV4Signer::SignHeaders(const std::string& method, const std::string& canonical_uri,
                              const QueryParams& query, HeaderMap& headers,
                              const std::string& amz_date) const {
    const std::string date_ymd = amz_date.substr(0, 8);

    headers["x-amz-content-sha256"] = kUnsignedPayload;
    headers["x-amz-date"] = amz_date;
    if (!credentials_.session_token.empty()) {
        headers["x-amz-security-token"] = credentials_.session_token;
    }
    headers.erase("authorization");

    // 1. Canonical Request
    std::string canonical_headers;
    std::string signed_headers;
    for (const auto& header : headers) {
        canonical_headers += header.first + ":" + TrimHeaderValue(header.second) + "\n";
        if (!signed_headers.empty()) {
            signed_headers += ";";
        }
        signed_headers += header.first;
    }

    std::stringstream canonical_req;
    canonical_req << method << "\n"
                  << UriEncode(canonical_uri, false) << "\n"
                  << CanonicalQueryString(query) << "\n"
                  << canonical_headers << "\n"
                  << signed_headers << "\n"
                  << kUnsignedPayload;

    // 2. String to Sign
    std::string scope = Scope(date_ymd);
    std::stringstream string_to_sign;
    string_to_sign << kAlgorithm << "\n"
                   << amz_date << "\n"
                   << scope << "\n"
                   << Sha256Hex(canonical_req.str());

    // 3. Signature
    std::string raw_signature = HmacSha256(SigningKey(date_ymd), string_to_sign.str());
    std::string signature = HexEncode(reinterpret_cast<const unsigned char*>(raw_signature.data()),
                                      raw_signature.size());

    // 4. Header
    std::stringstream auth_header;
    auth_header << kAlgorithm << " Credential=" << credentials_.access_key << "/" << scope
                << ", SignedHeaders=" << signed_headers << ", Signature=" << signature;
    headers["authorization"] = auth_header.str();
}

std::string SigV4Signer::PresignQuery(const std::string& method, const std::string& host,
                                      const std::string& canonical_uri, QueryParams query,
                                      int expires_in_seconds, const std::string& amz_date) const {
    const std::string date_ymd = amz_date.substr(0, 8);
    const std::string scope = Scope(date_ymd);

    query.emplace_back("X-Amz-Algorithm", kAlgorithm);
    query.emplace_back("X-Amz-Credential", credentials_.access_key + "/" + scope);
    query.emplace_back("X-Amz-Date", amz_date);
    query.emplace_back("X-Amz-Expires", std::to_string(expires_in_seconds));
    if (!credentials_.session_token.empty()) {
        query.emplace_back("X-Amz-Security-Token", credentials_.session_token);
    }
    query.emplace_back("X-Amz-SignedHeaders", "host");

    const std::string canonical_query = CanonicalQueryString(query);

    std::stringstream canonical_req;
    canonical_req << method << "\n"
                  << UriEncode(canonical_uri, false) << "\n"
                  << canonical_query << "\n"
                  << "host:" << host << "\n\n"
                  << "host\n"
                  << kUnsignedPayload;

    std::stringstream string_to_sign;
    string_to_sign << kAlgorithm << "\n"
                   << amz_date << "\n"
                   << scope << "\n"
                   << Sha256Hex(canonical_req.str());

    std::string raw_signature = HmacSha256(SigningKey(date_ymd), string_to_sign.str());
    std::string signature = HexEncode(reinterpret_cast<const unsigned char*>(raw_signature.data()),
                                      raw_signature.size());

    return canonical_query + "&X-Amz-Signature=" + signature;
}
