#pragma once

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace roiwatch {

inline bool readFileBytes(const std::string& path,
                          std::vector<unsigned char>& out, std::string* err) {
    std::FILE* file = std::fopen(path.c_str(), "rb");
    if (!file) {
        if (err) {
            *err = "failed to open file: " + path;
        }
        return false;
    }
    std::fseek(file, 0, SEEK_END);
    long size = std::ftell(file);
    if (size < 0) {
        std::fclose(file);
        if (err) {
            *err = "failed to stat file: " + path;
        }
        return false;
    }
    std::fseek(file, 0, SEEK_SET);
    out.resize(static_cast<size_t>(size));
    if (size > 0 && std::fread(out.data(), 1, static_cast<size_t>(size),
                               file) != static_cast<size_t>(size)) {
        std::fclose(file);
        if (err) {
            *err = "failed to read file: " + path;
        }
        return false;
    }
    std::fclose(file);
    return true;
}

inline bool writeFileBytes(const std::string& path,
                           const std::vector<unsigned char>& data,
                           std::string* err) {
    std::FILE* file = std::fopen(path.c_str(), "wb");
    if (!file) {
        if (err) {
            *err = "failed to open file for writing: " + path;
        }
        return false;
    }
    if (!data.empty() &&
        std::fwrite(data.data(), 1, data.size(), file) != data.size()) {
        std::fclose(file);
        if (err) {
            *err = "failed to write file: " + path;
        }
        return false;
    }
    if (std::fclose(file) != 0) {
        if (err) {
            *err = "failed to close file: " + path;
        }
        return false;
    }
    return true;
}

inline std::string readTextFile(const std::string& path) {
    std::vector<unsigned char> bytes;
    if (!readFileBytes(path, bytes, nullptr)) {
        return {};
    }
    return std::string(bytes.begin(), bytes.end());
}

inline int base64Value(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return 26 + (c - 'a');
    if (c >= '0' && c <= '9') return 52 + (c - '0');
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

// Whitespace is skipped; decoding stops at the first '='.
inline bool base64Decode(const std::string& in,
                         std::vector<unsigned char>& out) {
    out.clear();
    out.reserve(in.size() / 4 * 3);
    std::uint32_t acc = 0;
    int bits = 0;
    for (char c : in) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            continue;
        }
        if (c == '=') {
            break;
        }
        int v = base64Value(c);
        if (v < 0) {
            return false;
        }
        acc = (acc << 6) | static_cast<std::uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<unsigned char>((acc >> bits) & 0xFFu));
        }
    }
    return !out.empty();
}

inline int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
    return -1;
}

inline std::string urlDecode(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        char c = in[i];
        if (c == '%' && i + 2 < in.size()) {
            int hi = hexValue(in[i + 1]);
            int lo = hexValue(in[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        if (c == '+') {
            out.push_back(' ');
        } else {
            out.push_back(c);
        }
    }
    return out;
}

inline std::string fileUrlToPath(const std::string& uri) {
    const std::string prefix = "file://";
    if (uri.rfind(prefix, 0) == 0) {
        std::string path = uri.substr(prefix.size());
        const std::string localhost = "localhost";
        if (path.rfind(localhost, 0) == 0) {
            path = path.substr(localhost.size());
        }
        if (!path.empty() && path[0] != '/') {
            path.insert(path.begin(), '/');
        }
        return urlDecode(path);
    }
    return uri;
}

}  // namespace roiwatch
