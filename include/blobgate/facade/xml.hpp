#pragma once

#include <string>
#include <vector>

namespace blobgate::xml {

// Escape text for element content and attribute values
std::string escape(const std::string& s);

// Decode XML entities (basic set)
std::string decode_entities(const std::string& s);

// Find the value between <tag>value</tag>, returns empty string if not found
std::string get_element(const std::string& xml, const std::string& tag, size_t start_pos = 0);

// Positions of every <tag>...</tag> occurrence
struct ElementRange {
    size_t content_start = 0;
    size_t content_end = 0;
    size_t element_end = 0;  // Position after closing tag
};

std::vector<ElementRange> find_elements(const std::string& xml, const std::string& tag);

// Minimal forward-only XML builder
class Writer {
public:
    explicit Writer(bool declaration = true);

    Writer& open(const std::string& tag, const std::string& attributes = "");
    Writer& close();
    Writer& element(const std::string& tag, const std::string& text);
    Writer& empty(const std::string& tag);

    // Closes every open element and returns the document
    std::string str();

private:
    std::string out_;
    std::vector<std::string> stack_;
};

}  // namespace blobgate::xml
