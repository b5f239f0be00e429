#include "checksum.hpp"
#include "errors.hpp"
#include "sigv4.hpp"
#include <cctype>
#include <fstream>

Md5Hasher::Md5Hasher() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) throw InternalError("Failed to create digest context");
    if (EVP_DigestInit_ex(ctx_, EVP_md5(), NULL) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw InternalError("MD5 DigestInit failed");
    }
}

Md5Hasher::~Md5Hasher() {
    EVP_MD_CTX_free(ctx_);
}

void Md5Hasher::Update(const char* data, size_t len) {
    if (len == 0) return;
    if (EVP_DigestUpdate(ctx_, data, len) != 1) {
        throw InternalError("MD5 DigestUpdate failed");
    }
}

std::string Md5Hasher::FinalHex() {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx_, digest, &digest_len) != 1) {
        throw InternalError("MD5 DigestFinal failed");
    }
    return HexEncode(digest, digest_len);
}

std::string Md5Hex(const std::string& data) {
    Md5Hasher hasher;
    hasher.Update(data);
    return hasher.FinalHex();
}

std::string Md5HexOfFile(const std::string& path) {
    std::ifstream infile(path, std::ios::binary);
    if (!infile) throw InternalError("Cannot open " + path + " for verification");

    Md5Hasher hasher;
    char buffer[1024 * 64];
    while (infile.read(buffer, sizeof(buffer))) {
        hasher.Update(buffer, infile.gcount());
    }
    // Handle last block
    if (infile.gcount() > 0) {
        hasher.Update(buffer, infile.gcount());
    }
    if (infile.bad()) throw InternalError("Read error while verifying " + path);
    return hasher.FinalHex();
}

bool IsVerifiableEtag(const std::string& etag) {
    if (etag.size() != 32) return false;
    for (unsigned char c : etag) {
        if (!std::isxdigit(c)) return false;
    }
    return true;
}

bool IsChecksumVerifiable(const ObjectDescriptor& object) {
    if (!object.etag || !IsVerifiableEtag(*object.etag)) return false;
    return object.encryption.empty() || object.encryption == "AES256";
}

bool ChecksumEquals(const std::string& expected, const std::string& actual) {
    if (expected.size() != actual.size()) return false;
    for (size_t i = 0; i < expected.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(expected[i])) !=
            std::tolower(static_cast<unsigned char>(actual[i]))) {
            return false;
        }
    }
    return true;
}
