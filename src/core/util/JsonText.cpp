#include "softmock/core/util/JsonText.h"
#include <cctype>
#include <cstdio>
#include <cstdlib>

namespace softmock::core::util {
static const char* B64="ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string b64_encode(std::string_view in) {
    std::string out; out.reserve((in.size()*4)/3+4);
    unsigned val=0; int valb=-6;
    for(unsigned char c: in){ val=(val<<8)+c; valb+=8; while(valb>=0){ out.push_back(B64[(val>>valb)&0x3F]); valb-=6; } }
    if(valb>-6) out.push_back(B64[((val<<8)>>(valb+8))&0x3F]);
    while(out.size()%4) out.push_back('=');
    return out;
}

std::optional<std::string> b64_decode(std::string_view in) {
    auto value_of = [](char c) -> int {
        if(c>='A'&&c<='Z') return c-'A';
        if(c>='a'&&c<='z') return c-'a'+26;
        if(c>='0'&&c<='9') return c-'0'+52;
        if(c=='+') return 62;
        if(c=='/') return 63;
        return -1;
    };
    std::string out; out.reserve(in.size()*3/4);
    unsigned val=0; int valb=-8; bool padding=false;
    for(char c: in){
        if(c=='='){ padding=true; continue; }
        if(padding) return std::nullopt;
        int d = value_of(c);
        if(d<0) return std::nullopt;
        val=(val<<6)+unsigned(d); valb+=6;
        if(valb>=0){ out.push_back(char((val>>valb)&0xFF)); valb-=8; }
    }
    return out;
}

std::string escape_json(std::string_view in){
    std::string o; o.reserve(in.size()+8);
    for(char c: in){
        switch(c){
            case '"': o+="\\\""; break;
            case '\\': o+="\\\\"; break;
            case '\n': o+="\\n"; break;
            case '\r': o+="\\r"; break;
            case '\t': o+="\\t"; break;
            default:
                if((unsigned char)c<0x20){ char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04x", (unsigned char)c); o+=buf; }
                else o+=c;
        }
    }
    return o;
}

uint64_t JsonScalar::as_u64() const { return std::strtoull(text.c_str(), nullptr, 10); }
int64_t JsonScalar::as_i64() const { return std::strtoll(text.c_str(), nullptr, 10); }

namespace {
struct Cursor {
    std::string_view s; size_t i{0};
    void skip_ws(){ while(i<s.size() && std::isspace((unsigned char)s[i])) ++i; }
    bool eat(char c){ skip_ws(); if(i<s.size() && s[i]==c){ ++i; return true; } return false; }
    bool at_end() const { return i>=s.size(); }
};

void append_utf8(std::string& out, unsigned cp){
    if(cp<0x80) out.push_back(char(cp));
    else if(cp<0x800){ out.push_back(char(0xC0|(cp>>6))); out.push_back(char(0x80|(cp&0x3F))); }
    else { out.push_back(char(0xE0|(cp>>12))); out.push_back(char(0x80|((cp>>6)&0x3F))); out.push_back(char(0x80|(cp&0x3F))); }
}

std::optional<std::string> read_string(Cursor& c){
    if(!c.eat('"')) return std::nullopt;
    std::string out;
    while(!c.at_end()){
        char ch = c.s[c.i++];
        if(ch=='"') return out;
        if(ch!='\\'){ out.push_back(ch); continue; }
        if(c.at_end()) return std::nullopt;
        char e = c.s[c.i++];
        switch(e){
            case '"': out.push_back('"'); break;
            case '\\': out.push_back('\\'); break;
            case '/': out.push_back('/'); break;
            case 'b': out.push_back('\b'); break;
            case 'f': out.push_back('\f'); break;
            case 'n': out.push_back('\n'); break;
            case 'r': out.push_back('\r'); break;
            case 't': out.push_back('\t'); break;
            case 'u': {
                if(c.i+4>c.s.size()) return std::nullopt;
                unsigned cp=0;
                for(int k=0;k<4;++k){
                    char h=c.s[c.i++]; cp<<=4;
                    if(h>='0'&&h<='9') cp|=unsigned(h-'0');
                    else if(h>='a'&&h<='f') cp|=unsigned(10+h-'a');
                    else if(h>='A'&&h<='F') cp|=unsigned(10+h-'A');
                    else return std::nullopt;
                }
                append_utf8(out, cp);
                break; }
            default: return std::nullopt;
        }
    }
    return std::nullopt;
}
}

std::optional<std::map<std::string, JsonScalar>> parse_flat_json_object(std::string_view json){
    Cursor c{json};
    std::map<std::string, JsonScalar> out;
    if(!c.eat('{')) return std::nullopt;
    if(c.eat('}')) { c.skip_ws(); if(!c.at_end()) return std::nullopt; return out; }
    while(true){
        c.skip_ws();
        auto key = read_string(c);
        if(!key || !c.eat(':')) return std::nullopt;
        c.skip_ws();
        if(c.at_end()) return std::nullopt;
        JsonScalar v;
        char ch = c.s[c.i];
        if(ch=='"'){
            auto str = read_string(c); if(!str) return std::nullopt;
            v.type = JsonScalar::Type::string; v.text = std::move(*str);
        } else if(ch=='t' && c.s.substr(c.i,4)=="true"){ v.type=JsonScalar::Type::boolean; v.flag=true; c.i+=4; }
        else if(ch=='f' && c.s.substr(c.i,5)=="false"){ v.type=JsonScalar::Type::boolean; v.flag=false; c.i+=5; }
        else if(ch=='n' && c.s.substr(c.i,4)=="null"){ v.type=JsonScalar::Type::null; c.i+=4; }
        else {
            size_t start=c.i;
            while(c.i<c.s.size() && (std::isdigit((unsigned char)c.s[c.i])||c.s[c.i]=='-'||c.s[c.i]=='+'||c.s[c.i]=='.'||c.s[c.i]=='e'||c.s[c.i]=='E')) ++c.i;
            if(start==c.i) return std::nullopt;
            v.type=JsonScalar::Type::number; v.text=std::string(c.s.substr(start,c.i-start));
        }
        out[std::move(*key)] = std::move(v);
        if(c.eat(',')) continue;
        if(c.eat('}')) break;
        return std::nullopt;
    }
    c.skip_ws();
    if(!c.at_end()) return std::nullopt;
    return out;
}
}
