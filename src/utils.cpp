#include "utils.hpp"
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <ifaddrs.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <array>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <system_error>

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

std::string random_uuid_v4(){
    std::vector<unsigned char> raw(16);
    if(RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1){
        throw std::runtime_error("RAND_bytes failed while generating device id");
    }
    raw[6] = static_cast<unsigned char>((raw[6] & 0x0f) | 0x40);
    raw[8] = static_cast<unsigned char>((raw[8] & 0x3f) | 0x80);
    auto hex = hex_from_bytes(raw);
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

std::string host_name(){
    std::array<char, 256> buf{};
    if(gethostname(buf.data(), buf.size() - 1) != 0) return "";
    return std::string(buf.data());
}

std::string detect_local_ipv4(){
    ifaddrs* list = nullptr;
    if(getifaddrs(&list) != 0) return "127.0.0.1";
    std::string found;
    for(ifaddrs* it = list; it != nullptr; it = it->ifa_next){
        if(!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) continue;
        auto* in = reinterpret_cast<sockaddr_in*>(it->ifa_addr);
        if((ntohl(in->sin_addr.s_addr) >> 24) == 127) continue;
        char text[INET_ADDRSTRLEN] = {0};
        if(inet_ntop(AF_INET, &in->sin_addr, text, sizeof(text))){
            found = text;
            break;
        }
    }
    freeifaddrs(list);
    return found.empty() ? "127.0.0.1" : found;
}

std::string read_file_bytes(const std::filesystem::path& path){
    std::ifstream in(path, std::ios::binary);
    if(!in) throw std::runtime_error("cannot open " + path.string());
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if(in.bad()) throw std::runtime_error("read error on " + path.string());
    return bytes;
}

void write_file_bytes(const std::filesystem::path& path, const std::string& bytes){
    if(path.has_parent_path()){
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if(ec) throw std::runtime_error("cannot create " + path.parent_path().string() + ": " + ec.message());
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if(!out) throw std::runtime_error("cannot create " + path.string());
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if(!out) throw std::runtime_error("write error on " + path.string());
}
