#include "softmock/core/util/Digest.h"
#include <openssl/evp.h>
#include <memory>

namespace softmock::core::util {
std::string sha256_hex(std::string_view data){
    unsigned char md[EVP_MAX_MD_SIZE]; unsigned int n=0;
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if(!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr)!=1
       || EVP_DigestUpdate(ctx.get(), data.data(), data.size())!=1
       || EVP_DigestFinal_ex(ctx.get(), md, &n)!=1) return {};
    static const char* hex="0123456789abcdef";
    std::string out; out.reserve(n*2);
    for(unsigned i=0;i<n;++i){ out.push_back(hex[md[i]>>4]); out.push_back(hex[md[i]&0xF]); }
    return out;
}

std::string hex_colon(const unsigned char* data, unsigned int len){
    static const char* hex="0123456789ABCDEF";
    std::string out; out.reserve(len*3);
    for(unsigned i=0;i<len;++i){ unsigned char b=data[i]; out.push_back(hex[b>>4]); out.push_back(hex[b&0xF]); if(i+1<len) out.push_back(':'); }
    return out;
}
}
