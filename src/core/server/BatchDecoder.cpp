#include "eventtap/core/server/BatchDecoder.h"

namespace eventtap::core::server {
using nlohmann::json;

namespace {
const json* at_path(const json& root, const std::string& path) {
    const json* cur = &root;
    size_t pos = 0;
    while (pos <= path.size()) {
        auto dot = path.find('.', pos);
        auto key = path.substr(pos, dot == std::string::npos ? std::string::npos : dot - pos);
        if (!cur->is_object()) return nullptr;
        auto it = cur->find(key);
        if (it == cur->end()) return nullptr;
        cur = &(*it);
        if (dot == std::string::npos) break;
        pos = dot + 1;
    }
    return cur;
}

std::string name_from(const json* v) {
    if (!v) return {};
    if (v->is_string()) return v->get<std::string>();
    if (v->is_number()) return v->dump();
    return {};
}
}

BatchDecoder::BatchDecoder(DecoderOptions options) : opts(std::move(options)) {}

std::string BatchDecoder::extract_name(const json& payload) const {
    if (!payload.is_object()) return "unknown";
    if (!opts.name_field.empty()) {
        auto it = payload.find(opts.name_field);
        if (it != payload.end()) {
            auto n = name_from(&(*it));
            if (!n.empty()) return n;
        }
    }
    if (!opts.name_fallback_path.empty()) {
        auto n = name_from(at_path(payload, opts.name_fallback_path));
        if (!n.empty()) return n;
    }
    return "unknown";
}

void BatchDecoder::add_element(DecodeResult& out, const json& element) const {
    std::size_t index = out.elements++;
    if (element.is_object()) {
        out.events.push_back(DecodedEvent{ extract_name(element), element });
        return;
    }
    if (element.is_string()) {
        auto parsed = json::parse(element.get_ref<const std::string&>(), nullptr, false);
        if (parsed.is_discarded()) {
            out.issues.push_back(DecodeIssue{ index, "string element is not valid JSON" });
            return;
        }
        if (!parsed.is_object()) {
            out.issues.push_back(DecodeIssue{ index, "string element does not hold a JSON object" });
            return;
        }
        out.events.push_back(DecodedEvent{ extract_name(parsed), std::move(parsed) });
        return;
    }
    out.issues.push_back(DecodeIssue{ index, std::string("element is a JSON ") + element.type_name() + ", expected object" });
}

DecodeResult BatchDecoder::decode(std::string_view body) const {
    DecodeResult out;
    auto doc = json::parse(body.begin(), body.end(), nullptr, false);
    if (!doc.is_discarded()) {
        if (doc.is_array()) {
            for (const auto& e : doc) add_element(out, e);
        } else if (doc.is_object()) {
            auto env = opts.envelope_field.empty() ? doc.end() : doc.find(opts.envelope_field);
            if (env != doc.end() && env->is_array()) {
                for (const auto& e : *env) add_element(out, e);
            } else {
                add_element(out, doc);
            }
        } else if (doc.is_string()) {
            add_element(out, doc);
        } else {
            out.error = std::string("body is a JSON ") + doc.type_name() + ", expected object or array";
            return out;
        }
    } else {
        out.error = "body is not valid JSON";
    }
    return out;
}
}
