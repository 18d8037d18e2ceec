#include "CryptoHelpers.hpp"
#include <cryptopp/osrng.h>
#include <cryptopp/sha.h>
#include <cryptopp/hmac.h>
#include <cryptopp/filters.h>
#include <cryptopp/secblock.h>
#include <cryptopp/base64.h>
#include <cryptopp/hex.h>
#include <string>
#include <vector>

using namespace CryptoPP;

namespace CryptoHelpers {

std::vector<uint8_t> hmacSha256(const std::string& key, const std::string& message){
    HMAC<SHA256> hmac(reinterpret_cast<const byte*>(key.data()), key.size());
    std::string mac;
    StringSource ss(message, true, new HashFilter(hmac, new StringSink(mac)));
    return std::vector<uint8_t>(mac.begin(), mac.end());
}

std::string base64Encode(const std::vector<uint8_t>& data){
    std::string out;
    StringSource ss(data.data(), data.size(), true,
        new Base64Encoder(new StringSink(out), false /* do not insert newlines */));
    return out;
}

std::vector<uint8_t> base64Decode(const std::string& b64){
    std::string decoded;
    StringSource ss(b64, true, new Base64Decoder(new StringSink(decoded)));
    return std::vector<uint8_t>(decoded.begin(), decoded.end());
}

std::string base64UrlEncode(const std::vector<uint8_t>& data){
    std::string out = base64Encode(data);
    for(auto &c : out){
        if(c == '+') c = '-';
        else if(c == '/') c = '_';
    }
    while(!out.empty() && out.back() == '=') out.pop_back();
    return out;
}

std::string base64UrlEncode(const std::string& data){
    return base64UrlEncode(std::vector<uint8_t>(data.begin(), data.end()));
}

bool base64UrlDecode(const std::string& b64url, std::string& out){
    std::string b64;
    b64.reserve(b64url.size() + 3);
    for(char c : b64url){
        if((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) b64.push_back(c);
        else if(c == '-') b64.push_back('+');
        else if(c == '_') b64.push_back('/');
        else return false;
    }
    if(b64.size() % 4 == 1) return false;
    while(b64.size() % 4) b64.push_back('=');
    auto bytes = base64Decode(b64);
    out.assign(bytes.begin(), bytes.end());
    return true;
}

bool constTimeEqual(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b){
    if(a.size() != b.size()) return false;
    volatile uint8_t result = 0;
    for(size_t i=0;i<a.size();++i) result |= (a[i] ^ b[i]);
    return result == 0;
}

std::string randomHex(size_t n){
    AutoSeededRandomPool prng;
    SecByteBlock block(n);
    prng.GenerateBlock(block, block.size());
    std::string out;
    StringSource ss(block.data(), block.size(), true, new HexEncoder(new StringSink(out), false));
    return out;
}

} // namespace CryptoHelpers
