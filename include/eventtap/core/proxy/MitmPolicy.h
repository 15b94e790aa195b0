#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <atomic>
#include <mutex>
#include <chrono>
#include <unordered_map>

namespace eventtap::core::proxy {
// Runtime policy for TLS interception: enable toggle, host allow/deny globs,
// and hosts remembered as pinned (their clients reject the local CA).
class MitmPolicy {
public:
    static constexpr std::chrono::minutes kPinTtl{30};

    void set_enabled(bool v){ enabled.store(v, std::memory_order_relaxed); }
    bool is_enabled() const { return enabled.load(std::memory_order_relaxed); }
    void set_lists(std::vector<std::string> allow, std::vector<std::string> deny){ std::lock_guard<std::mutex> lk(mu); allow_list = std::move(allow); deny_list = std::move(deny); }
    bool should_intercept(const std::string& host) const {
        if(!is_enabled()) return false;
        std::lock_guard<std::mutex> lk(mu);
        for(auto &p: deny_list){ if(glob_match(p, host)) return false; }
        if(allow_list.empty()) return true;
        for(auto &p: allow_list){ if(glob_match(p, host)) return true; }
        return false;
    }

    void mark_pinned(const std::string& host){
        std::lock_guard<std::mutex> lk(mu);
        auto& e = pinned[host];
        if(e.failures==0) e.first = std::chrono::steady_clock::now();
        ++e.failures;
    }
    bool is_pinned(const std::string& host){
        std::lock_guard<std::mutex> lk(mu);
        auto it = pinned.find(host);
        if(it==pinned.end()) return false;
        if(std::chrono::steady_clock::now() - it->second.first > kPinTtl){ pinned.erase(it); return false; }
        return true;
    }

    // '*' matches any sequence, '?' a single char, case-insensitive
    static bool glob_match(const std::string& pat, const std::string& text){
        return glob_match_ci(pat.c_str(), 0, pat.size(), text.c_str(), 0, text.size());
    }
    static bool is_glob(std::string_view pat){ return pat.find_first_of("*?") != std::string_view::npos; }
    // "a.com, *.b.com" -> {"a.com", "*.b.com"}
    static std::vector<std::string> split_list(std::string_view csv){
        std::vector<std::string> out;
        size_t pos = 0;
        while(pos <= csv.size()){
            auto comma = csv.find(',', pos);
            auto item = csv.substr(pos, comma==std::string_view::npos ? std::string_view::npos : comma-pos);
            while(!item.empty() && item.front()==' ') item.remove_prefix(1);
            while(!item.empty() && item.back()==' ') item.remove_suffix(1);
            if(!item.empty()) out.emplace_back(item);
            if(comma==std::string_view::npos) break;
            pos = comma + 1;
        }
        return out;
    }
private:
    struct PinnedInfo {
        std::chrono::steady_clock::time_point first;
        unsigned failures{0};
    };
    static char lower(char c){ return (c>='A'&&c<='Z')? char(c-'A'+'a'):c; }
    static bool glob_match_ci(const char* p, size_t pi, size_t pn, const char* t, size_t ti, size_t tn){
        while(true){
            if(pi==pn) return ti==tn;
            char pc = p[pi];
            if(pc=='*'){
                while(pi<pn && p[pi]=='*') ++pi;
                if(pi==pn) return true;
                for(size_t skip=0; ti+skip<=tn; ++skip){ if(glob_match_ci(p, pi, pn, t, ti+skip, tn)) return true; }
                return false;
            } else if(pc=='?') {
                if(ti==tn) return false;
                ++pi; ++ti;
            } else {
                if(ti==tn) return false;
                if(lower(pc)!=lower(t[ti])) return false;
                ++pi; ++ti;
            }
        }
    }
    std::atomic<bool> enabled { true };
    mutable std::mutex mu;
    std::vector<std::string> allow_list;
    std::vector<std::string> deny_list;
    std::unordered_map<std::string, PinnedInfo> pinned;
};
}
