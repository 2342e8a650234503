#include "blobgate/facade/xml.hpp"

#include <string_view>

namespace blobgate::xml {

namespace {

struct Entity {
    char ch;
    const char* text;
};

constexpr Entity kEntities[] = {
    {'<', "&lt;"}, {'>', "&gt;"}, {'&', "&amp;"}, {'"', "&quot;"}, {'\'', "&apos;"},
};

}  // namespace

std::string escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        const char* replacement = nullptr;
        for (const auto& e : kEntities) {
            if (e.ch == c) replacement = e.text;
        }
        if (replacement) {
            out += replacement;
        } else {
            out += c;
        }
    }
    return out;
}

std::string decode_entities(const std::string& s) {
    std::string out;
    out.reserve(s.size());

    for (size_t i = 0; i < s.size();) {
        bool matched = false;
        if (s[i] == '&') {
            for (const auto& e : kEntities) {
                std::string_view text(e.text);
                if (s.compare(i, text.size(), text) == 0) {
                    out += e.ch;
                    i += text.size();
                    matched = true;
                    break;
                }
            }
        }
        // Unknown entities pass through untouched
        if (!matched) out += s[i++];
    }
    return out;
}

std::string get_element(const std::string& xml, const std::string& tag, size_t start_pos) {
    const std::string open_tag = "<" + tag + ">";
    auto begin = xml.find(open_tag, start_pos);
    if (begin == std::string::npos) return {};
    begin += open_tag.size();

    auto end = xml.find("</" + tag + ">", begin);
    return end == std::string::npos ? std::string{} : xml.substr(begin, end - begin);
}

std::vector<ElementRange> find_elements(const std::string& xml, const std::string& tag) {
    std::vector<ElementRange> found;
    const std::string open_tag = "<" + tag + ">";
    const std::string close_tag = "</" + tag + ">";

    size_t pos = 0;
    for (;;) {
        auto open_at = xml.find(open_tag, pos);
        if (open_at == std::string::npos) break;
        auto close_at = xml.find(close_tag, open_at + open_tag.size());
        if (close_at == std::string::npos) break;

        found.push_back({open_at + open_tag.size(), close_at, close_at + close_tag.size()});
        pos = found.back().element_end;
    }
    return found;
}

// ============================================================================
// Writer
// ============================================================================

Writer::Writer(bool declaration) {
    if (declaration) {
        out_ = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    }
}

Writer& Writer::open(const std::string& tag, const std::string& attributes) {
    out_ += "<" + tag;
    if (!attributes.empty()) out_ += " " + attributes;
    out_ += ">";
    stack_.push_back(tag);
    return *this;
}

Writer& Writer::close() {
    if (!stack_.empty()) {
        out_ += "</" + stack_.back() + ">";
        stack_.pop_back();
    }
    return *this;
}

Writer& Writer::element(const std::string& tag, const std::string& text) {
    out_ += "<" + tag + ">" + escape(text) + "</" + tag + ">";
    return *this;
}

Writer& Writer::empty(const std::string& tag) {
    out_ += "<" + tag + "/>";
    return *this;
}

std::string Writer::str() {
    while (!stack_.empty()) close();
    return out_;
}

}  // namespace blobgate::xml
