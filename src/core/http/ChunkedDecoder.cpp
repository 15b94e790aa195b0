#include "eventtap/core/http/ChunkedDecoder.h"
#include <algorithm>
#include <cstdint>

using namespace eventtap::core::http;

static constexpr size_t kMaxLine = 4096;

static bool hex_to_size(const std::string& line, size_t& out){
    size_t v = 0; bool any=false; for(char c: line){ if(c==';') break; if(c==' '||c=='\t') break; int d=-1; if(c>='0'&&c<='9') d=c-'0'; else if(c>='a'&&c<='f') d=10+(c-'a'); else if(c>='A'&&c<='F') d=10+(c-'A'); else return false; if(v > (SIZE_MAX >> 4)) return false; v=(v<<4)|(unsigned)d; any=true; }
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
                decoded_.append(data+off, take); off += take; remaining_ -= take; if(remaining_==0) state_=State::DataCR; break; }
            case State::DataCR:{
                if(data[off++]=='\r') state_=State::DataLF; else state_=State::Error;
                break; }
            case State::DataLF:{
                if(data[off++]=='\n') state_=State::SizeLine; else state_=State::Error;
                break; }
            case State::Trailer:{
                // trailer fields are dropped; an empty line ends the message
                char c = data[off++]; line_.push_back(c);
                if(line_.size() > kMaxLine){ state_=State::Error; break; }
                if(line_.size()>=2 && line_[line_.size()-2]=='\r' && line_.back()=='\n'){
                    bool empty = line_.size()==2; line_.clear();
                    if(empty) state_=State::Done;
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
