#pragma once
#include <string>
#include <vector>

// Hex / base64 helpers on top of libsodium's constant-time codecs.
namespace encoding {

std::string toHex(const unsigned char* data, std::size_t len);
std::string toHex(const std::vector<unsigned char>& data);

// Returns false if hex is not valid hex. out is resized to the decoded length.
bool fromHex(const std::string& hex, std::vector<unsigned char>& out);

// URL-safe base64, padding optional on input.
bool fromBase64Url(const std::string& b64, std::vector<unsigned char>& out);
std::string toBase64Url(const std::vector<unsigned char>& data);

}
