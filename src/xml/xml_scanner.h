#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace flowsim::xml {

enum class EventType : std::uint8_t {
    StartElement = 0,
    EndElement = 1,
    EndOfDocument = 2,
};

struct Attribute final {
    std::string name;
    std::string value;
};

struct Event final {
    EventType type = EventType::EndOfDocument;
    std::string name;
    std::vector<Attribute> attributes;
    int line = 0;

    const std::string* FindAttribute(std::string_view attribute_name) const;
};

// Pull scanner over element structure only: text, comments, processing
// instructions, doctype and CDATA are skipped. A self-closing element yields
// a StartElement followed by a matching EndElement.
class Scanner final {
public:
    explicit Scanner(std::string_view document);

    bool Next(Event& out_event, std::string& out_error);
    // Nesting level of the element just started, counting itself; the root
    // element is at depth 1.
    std::size_t Depth() const;

private:
    bool SkipMarkup(std::string_view terminator, std::string& out_error);
    bool ReadName(std::string& out_name);
    bool ReadAttributes(Event& out_event, bool& out_self_closing, std::string& out_error);
    void SkipWhitespace();
    std::string Located(std::string_view message) const;

    std::string_view document_;
    std::size_t offset_ = 0;
    int line_ = 1;
    std::vector<std::string> open_elements_;
    bool pending_end_ = false;
    std::string pending_end_name_;
    int pending_end_line_ = 0;
};

bool DecodeEntities(std::string_view raw, std::string& out_text);
bool ReadDocument(
    const std::filesystem::path& file_path,
    std::string& out_document,
    std::string& out_error);

}  // namespace flowsim::xml
