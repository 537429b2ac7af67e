#include "softmock/core/http/ChunkedDecoder.h"
#include <algorithm>

using namespace softmock::core::http;

static constexpr size_t kMaxLine = 4096;

static bool hex_to_size(const std::string& line, size_t& out){
    size_t v = 0; bool any=false; int digits=0;
    for(char c: line){
        if(c==';' || c==' ' || c=='\t') break;
        int d=-1; if(c>='0'&&c<='9') d=c-'0'; else if(c>='a'&&c<='f') d=10+(c-'a'); else if(c>='A'&&c<='F') d=10+(c-'A'); else return false;
        if(++digits > 15) return false;
        v=(v<<4)|(unsigned)d; any=true;
    }
    if(!any) return false; out=v; return true;
}

size_t ChunkedDecoder::feed(const char* data, size_t len){
    size_t off=0; while(off < len && state_ != State::Done && state_ != State::Error){
        switch(state_){
            case State::SizeLine:{
                char c = data[off++]; line_.push_back(c);
                if(line_.size() > kMaxLine){ state_=State::Error; break; }
                if(line_.size()>=2 && line_[line_.size()-2]=='\r' && line_.back()=='\n'){
                    std::string core = line_.substr(0,line_.size()-2); line_.clear(); size_t sz=0; if(!hex_to_size(core, sz)){ state_=State::Error; break; }
                    if(sz==0){ state_=State::Trailer; break; }
                    remaining_=sz; state_=State::Data;
                }
                break; }
            case State::Data:{
                size_t avail = len - off; size_t take = std::min(avail, remaining_);
                decoded_.append(data+off, take); off += take; remaining_ -= take; if(remaining_==0) state_=State::CRLF; break; }
            case State::CRLF:{
                // consumed one byte at a time so a CRLF split across feeds is handled
                char c = data[off++];
                if(line_.empty()){ if(c=='\r') line_.push_back(c); else state_=State::Error; }
                else { line_.clear(); if(c=='\n') state_=State::SizeLine; else state_=State::Error; }
                break; }
            case State::Trailer:{
                char c = data[off++]; line_.push_back(c);
                if(line_.size() > kMaxLine){ state_=State::Error; break; }
                if(line_.size()>=2 && line_[line_.size()-2]=='\r' && line_.back()=='\n'){
                    bool blank = line_.size()==2; line_.clear();
                    if(blank) state_=State::Done;
                }
                break; }
            case State::Done: case State::Error: break;
        }
    }
    return off;
}

std::string ChunkedDecoder::take_decoded(){
    std::string out; out.swap(decoded_); return out;
}
