#pragma once
#include <filesystem>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::vector<unsigned char> sha256_bytes(const std::string &data);
std::string sha256_hex(const std::string &data);

// Random RFC 4122 version 4 identifier, e.g. "1b4e28ba-2fa1-4d2b-883f-0016d3cca427".
std::string random_uuid_v4();

// Host name of this machine, or an empty string when it cannot be read.
std::string host_name();

// First non-loopback IPv4 interface address, "127.0.0.1" when none is up.
std::string detect_local_ipv4();

// Whole file as a byte string; throws std::runtime_error on open/read failure.
std::string read_file_bytes(const std::filesystem::path& path);
// Creates missing parent directories.
void write_file_bytes(const std::filesystem::path& path, const std::string& bytes);
