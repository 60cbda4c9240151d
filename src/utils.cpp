#include "utils.hpp"
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <fmt/format.h>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::vector<unsigned char> sha256_bytes(const std::string &data){
    std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
    SHA256((const unsigned char*)data.data(), data.size(), out.data());
    return out;
}

std::string sha256_hex(const std::string &data){
    return hex_from_bytes(sha256_bytes(data));
}

std::string sha256_file_hex(const std::string &path){
    std::ifstream in(path, std::ios::binary);
    if(!in) throw std::runtime_error("Cannot open '" + path + "' for hashing");

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if(!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 initialisation failed");
    }
    std::vector<char> buffer(1 << 16);
    while(in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto got = in.gcount();
        if(got > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(got)) != 1) {
            throw std::runtime_error("SHA-256 update failed");
        }
    }
    if(in.bad()) throw std::runtime_error("Read error while hashing '" + path + "'");

    std::vector<unsigned char> digest(EVP_MAX_MD_SIZE);
    unsigned int digest_len = 0;
    if(EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != 1) {
        throw std::runtime_error("SHA-256 finalisation failed");
    }
    digest.resize(digest_len);
    return hex_from_bytes(digest);
}

std::string shell_quote(const std::string &text){
    std::string out = "'";
    for(char c : text) {
        if(c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

std::string posix_basename(const std::string &path){
    auto pos = path.find_last_of('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

std::string posix_join(const std::string &dir, const std::string &name){
    if(dir.empty()) return name;
    if(dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

std::string local_basename(const std::string &path){
    auto pos = path.find_last_of("/\\");
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

std::string format_bytes(uint64_t bytes){
    const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while(value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    if(unit == 0) return fmt::format("{} B", bytes);
    return fmt::format("{:.2f} {}", value, units[unit]);
}
