#include "snapbucket/net/xml.hpp"

namespace snapbucket::xml {

std::string get_element(const std::string& xml, const std::string& tag, size_t start_pos) {
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    size_t start = xml.find(open_tag, start_pos);
    if (start == std::string::npos) return "";
    start += open_tag.length();

    size_t end = xml.find(close_tag, start);
    if (end == std::string::npos) return "";

    return xml.substr(start, end - start);
}

std::vector<ElementRange> find_elements(const std::string& xml, const std::string& tag) {
    std::vector<ElementRange> results;
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    size_t pos = 0;
    while (pos < xml.size()) {
        size_t start = xml.find(open_tag, pos);
        if (start == std::string::npos) break;

        size_t content_start = start + open_tag.length();
        size_t scan = content_start;
        int depth = 1;
        size_t end = std::string::npos;
        while (depth > 0) {
            size_t next_close = xml.find(close_tag, scan);
            if (next_close == std::string::npos) break;
            size_t next_open = xml.find(open_tag, scan);
            if (next_open != std::string::npos && next_open < next_close) {
                ++depth;
                scan = next_open + open_tag.length();
            } else {
                --depth;
                if (depth == 0) {
                    end = next_close;
                }
                scan = next_close + close_tag.length();
            }
        }
        if (end == std::string::npos) break;

        ElementRange range;
        range.content_start = content_start;
        range.content_end = end;
        range.element_end = end + close_tag.length();
        results.push_back(range);

        pos = range.element_end;
    }

    return results;
}

std::string content(const std::string& xml, const ElementRange& range) {
    return xml.substr(range.content_start, range.content_end - range.content_start);
}

std::string remove_element(const std::string& xml, const std::string& tag) {
    std::string open_tag = "<" + tag + ">";
    std::string result;
    size_t pos = 0;
    for (const auto& range : find_elements(xml, tag)) {
        size_t element_start = range.content_start - open_tag.length();
        result.append(xml, pos, element_start - pos);
        pos = range.element_end;
    }
    result.append(xml, pos, std::string::npos);
    return result;
}

std::string decode_entities(const std::string& s) {
    std::string result;
    result.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        if (s[i] == '&') {
            if (s.compare(i, 4, "&lt;") == 0) { result += '<'; i += 4; }
            else if (s.compare(i, 4, "&gt;") == 0) { result += '>'; i += 4; }
            else if (s.compare(i, 5, "&amp;") == 0) { result += '&'; i += 5; }
            else if (s.compare(i, 6, "&quot;") == 0) { result += '"'; i += 6; }
            else if (s.compare(i, 6, "&apos;") == 0) { result += '\''; i += 6; }
            else { result += s[i++]; }
        } else {
            result += s[i++];
        }
    }

    return result;
}

std::string escape(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': result += "&amp;"; break;
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            case '"': result += "&quot;"; break;
            case '\'': result += "&apos;"; break;
            default: result += c;
        }
    }
    return result;
}

}  // namespace snapbucket::xml
