#pragma once

#include <string>
#include <vector>

// Minimal helpers for the flat XML documents returned by S3 and the EC2
// Query API. Tags are matched literally (no namespaces, no attributes on
// the elements being searched).
namespace snapbucket::xml {

// Value between the first <tag> and its matching </tag>, empty if absent
std::string get_element(const std::string& xml, const std::string& tag, size_t start_pos = 0);

struct ElementRange {
    size_t content_start = 0;
    size_t content_end = 0;
    size_t element_end = 0;  // Position after closing tag
};

// Outermost <tag>...</tag> elements in document order; nested elements of
// the same name (EC2 <item> inside <item>) stay inside their parent.
std::vector<ElementRange> find_elements(const std::string& xml, const std::string& tag);

std::string content(const std::string& xml, const ElementRange& range);

// Copy of `xml` with every <tag>...</tag> subtree removed
std::string remove_element(const std::string& xml, const std::string& tag);

std::string decode_entities(const std::string& s);
std::string escape(const std::string& s);

}  // namespace snapbucket::xml
