#include "xml/xml_scanner.h"

#include <cctype>
#include <charconv>
#include <fstream>
#include <sstream>

namespace flowsim::xml {
namespace {

bool IsNameChar(char ch) {
    const unsigned char value = static_cast<unsigned char>(ch);
    return std::isalnum(value) != 0 || ch == '_' || ch == ':' || ch == '-' || ch == '.' ||
        value >= 0x80;
}

void AppendUtf8(std::uint32_t code_point, std::string& out_text) {
    if (code_point < 0x80) {
        out_text.push_back(static_cast<char>(code_point));
    } else if (code_point < 0x800) {
        out_text.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
        out_text.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    } else if (code_point < 0x10000) {
        out_text.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
        out_text.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        out_text.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    } else {
        out_text.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
        out_text.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
        out_text.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        out_text.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    }
}

}  // namespace

const std::string* Event::FindAttribute(std::string_view attribute_name) const {
    for (const Attribute& attribute : attributes) {
        if (attribute.name == attribute_name) {
            return &attribute.value;
        }
    }
    return nullptr;
}

Scanner::Scanner(std::string_view document) : document_(document) {}

std::size_t Scanner::Depth() const {
    return open_elements_.size();
}

bool Scanner::Next(Event& out_event, std::string& out_error) {
    out_event = {};

    if (pending_end_) {
        pending_end_ = false;
        open_elements_.pop_back();
        out_event.type = EventType::EndElement;
        out_event.name = std::move(pending_end_name_);
        out_event.line = pending_end_line_;
        out_error.clear();
        return true;
    }

    while (true) {
        const std::size_t tag_start = document_.find('<', offset_);
        const std::size_t text_end = tag_start == std::string_view::npos ? document_.size() : tag_start;
        for (std::size_t index = offset_; index < text_end; ++index) {
            if (document_[index] == '\n') {
                ++line_;
            }
        }
        offset_ = text_end;

        if (tag_start == std::string_view::npos) {
            if (!open_elements_.empty()) {
                out_error = Located("unexpected end of document inside <" + open_elements_.back() + ">");
                return false;
            }
            out_event.type = EventType::EndOfDocument;
            out_event.line = line_;
            out_error.clear();
            return true;
        }

        const std::string_view rest = document_.substr(offset_);
        if (rest.starts_with("<?")) {
            if (!SkipMarkup("?>", out_error)) {
                return false;
            }
            continue;
        }
        if (rest.starts_with("<!--")) {
            if (!SkipMarkup("-->", out_error)) {
                return false;
            }
            continue;
        }
        if (rest.starts_with("<![CDATA[")) {
            if (!SkipMarkup("]]>", out_error)) {
                return false;
            }
            continue;
        }
        if (rest.starts_with("<!")) {
            if (!SkipMarkup(">", out_error)) {
                return false;
            }
            continue;
        }

        if (rest.starts_with("</")) {
            offset_ += 2;
            std::string name;
            if (!ReadName(name)) {
                out_error = Located("closing tag without name");
                return false;
            }
            SkipWhitespace();
            if (offset_ >= document_.size() || document_[offset_] != '>') {
                out_error = Located("unterminated closing tag </" + name + ">");
                return false;
            }
            ++offset_;

            if (open_elements_.empty() || open_elements_.back() != name) {
                out_error = Located("mismatched closing tag </" + name + ">");
                return false;
            }
            open_elements_.pop_back();

            out_event.type = EventType::EndElement;
            out_event.name = std::move(name);
            out_event.line = line_;
            out_error.clear();
            return true;
        }

        ++offset_;
        out_event.line = line_;
        if (!ReadName(out_event.name)) {
            out_error = Located("element without name");
            return false;
        }

        bool self_closing = false;
        if (!ReadAttributes(out_event, self_closing, out_error)) {
            return false;
        }

        out_event.type = EventType::StartElement;
        open_elements_.push_back(out_event.name);
        if (self_closing) {
            pending_end_ = true;
            pending_end_name_ = out_event.name;
            pending_end_line_ = line_;
        }
        out_error.clear();
        return true;
    }
}

bool Scanner::SkipMarkup(std::string_view terminator, std::string& out_error) {
    const std::size_t end = document_.find(terminator, offset_);
    if (end == std::string_view::npos) {
        out_error = Located("unterminated markup, expected '" + std::string(terminator) + "'");
        return false;
    }

    const std::size_t next_offset = end + terminator.size();
    for (std::size_t index = offset_; index < next_offset; ++index) {
        if (document_[index] == '\n') {
            ++line_;
        }
    }
    offset_ = next_offset;
    return true;
}

bool Scanner::ReadName(std::string& out_name) {
    const std::size_t start = offset_;
    while (offset_ < document_.size() && IsNameChar(document_[offset_])) {
        ++offset_;
    }
    out_name.assign(document_.substr(start, offset_ - start));
    return !out_name.empty();
}

bool Scanner::ReadAttributes(Event& out_event, bool& out_self_closing, std::string& out_error) {
    out_self_closing = false;
    while (true) {
        SkipWhitespace();
        if (offset_ >= document_.size()) {
            out_error = Located("unterminated start tag <" + out_event.name + ">");
            return false;
        }

        const char ch = document_[offset_];
        if (ch == '>') {
            ++offset_;
            return true;
        }
        if (ch == '/') {
            if (offset_ + 1 >= document_.size() || document_[offset_ + 1] != '>') {
                out_error = Located("malformed self-closing tag <" + out_event.name + ">");
                return false;
            }
            offset_ += 2;
            out_self_closing = true;
            return true;
        }

        Attribute attribute{};
        if (!ReadName(attribute.name)) {
            out_error = Located("malformed attribute in <" + out_event.name + ">");
            return false;
        }
        SkipWhitespace();
        if (offset_ >= document_.size() || document_[offset_] != '=') {
            out_error = Located("attribute '" + attribute.name + "' missing '='");
            return false;
        }
        ++offset_;
        SkipWhitespace();
        if (offset_ >= document_.size() || (document_[offset_] != '"' && document_[offset_] != '\'')) {
            out_error = Located("attribute '" + attribute.name + "' missing quoted value");
            return false;
        }

        const char quote = document_[offset_];
        const std::size_t value_end = document_.find(quote, offset_ + 1);
        if (value_end == std::string_view::npos) {
            out_error = Located("unterminated value for attribute '" + attribute.name + "'");
            return false;
        }

        const std::string_view raw_value = document_.substr(offset_ + 1, value_end - offset_ - 1);
        if (!DecodeEntities(raw_value, attribute.value)) {
            out_error = Located("invalid entity in attribute '" + attribute.name + "'");
            return false;
        }
        for (const char value_char : raw_value) {
            if (value_char == '\n') {
                ++line_;
            }
        }
        offset_ = value_end + 1;
        out_event.attributes.push_back(std::move(attribute));
    }
}

void Scanner::SkipWhitespace() {
    while (offset_ < document_.size() &&
           std::isspace(static_cast<unsigned char>(document_[offset_])) != 0) {
        if (document_[offset_] == '\n') {
            ++line_;
        }
        ++offset_;
    }
}

std::string Scanner::Located(std::string_view message) const {
    return std::string(message) + " (line " + std::to_string(line_) + ")";
}

bool DecodeEntities(std::string_view raw, std::string& out_text) {
    out_text.clear();
    out_text.reserve(raw.size());

    std::size_t offset = 0;
    while (offset < raw.size()) {
        const char ch = raw[offset];
        if (ch != '&') {
            out_text.push_back(ch);
            ++offset;
            continue;
        }

        const std::size_t end = raw.find(';', offset);
        if (end == std::string_view::npos) {
            return false;
        }

        const std::string_view entity = raw.substr(offset + 1, end - offset - 1);
        if (entity == "amp") {
            out_text.push_back('&');
        } else if (entity == "lt") {
            out_text.push_back('<');
        } else if (entity == "gt") {
            out_text.push_back('>');
        } else if (entity == "quot") {
            out_text.push_back('"');
        } else if (entity == "apos") {
            out_text.push_back('\'');
        } else if (entity.size() > 1 && entity.front() == '#') {
            const bool hex = entity.size() > 2 && (entity[1] == 'x' || entity[1] == 'X');
            const std::string_view digits = entity.substr(hex ? 2 : 1);
            std::uint32_t code_point = 0;
            const std::from_chars_result result = std::from_chars(
                digits.data(),
                digits.data() + digits.size(),
                code_point,
                hex ? 16 : 10);
            if (result.ec != std::errc() || result.ptr != digits.data() + digits.size() ||
                code_point > 0x10FFFF) {
                return false;
            }
            AppendUtf8(code_point, out_text);
        } else {
            return false;
        }

        offset = end + 1;
    }

    return true;
}

bool ReadDocument(
    const std::filesystem::path& file_path,
    std::string& out_document,
    std::string& out_error) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        out_error = "Cannot open XML file: " + file_path.string();
        return false;
    }

    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        out_error = "Failed to read XML file: " + file_path.string();
        return false;
    }

    out_document = content.str();
    out_error.clear();
    return true;
}

}  // namespace flowsim::xml
