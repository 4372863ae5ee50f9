#include "core/cfg_parser.h"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace flowsim::core::cfg {
namespace {

// '#' inside a quoted value is part of the value, not a comment.
std::string StripComment(std::string_view line) {
    bool in_quotes = false;
    for (std::size_t index = 0; index < line.size(); ++index) {
        const char ch = line[index];
        if (ch == '"') {
            in_quotes = !in_quotes;
            continue;
        }
        if (ch == '#' && !in_quotes) {
            return std::string(line.substr(0, index));
        }
    }
    return std::string(line);
}

bool ParseLine(
    std::string_view raw_line,
    int line_number,
    std::vector<KeyValueLine>& out_lines,
    std::string& out_error) {
    const std::string line = Trim(StripComment(raw_line));
    if (line.empty()) {
        return true;
    }

    if (line.front() == '[' && line.back() == ']') {
        return true;
    }

    const std::string::size_type equal_pos = line.find('=');
    if (equal_pos == std::string::npos) {
        out_error = "Invalid config line (missing '='): line " + std::to_string(line_number);
        return false;
    }

    KeyValueLine parsed{};
    parsed.key = Trim(std::string_view(line).substr(0, equal_pos));
    parsed.value = Trim(std::string_view(line).substr(equal_pos + 1));
    parsed.line_number = line_number;
    if (parsed.key.empty()) {
        out_error = "Invalid config line (empty key): line " + std::to_string(line_number);
        return false;
    }

    out_lines.push_back(std::move(parsed));
    return true;
}

}  // namespace

std::string Trim(std::string_view text) {
    std::size_t start = 0;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start])) != 0) {
        ++start;
    }

    std::size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
        --end;
    }

    return std::string(text.substr(start, end - start));
}

bool ParseText(
    std::string_view text,
    std::vector<KeyValueLine>& out_lines,
    std::string& out_error) {
    out_lines.clear();

    int line_number = 0;
    std::size_t offset = 0;
    while (offset <= text.size()) {
        const std::size_t newline = text.find('\n', offset);
        const std::size_t end = newline == std::string_view::npos ? text.size() : newline;
        ++line_number;
        if (!ParseLine(text.substr(offset, end - offset), line_number, out_lines, out_error)) {
            out_lines.clear();
            return false;
        }
        if (newline == std::string_view::npos) {
            break;
        }
        offset = newline + 1;
    }

    out_error.clear();
    return true;
}

bool ParseFile(
    const std::filesystem::path& file_path,
    std::vector<KeyValueLine>& out_lines,
    std::string& out_error) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        out_lines.clear();
        out_error = "Cannot open config file: " + file_path.string();
        return false;
    }

    std::ostringstream content;
    content << file.rdbuf();
    return ParseText(content.str(), out_lines, out_error);
}

bool ParseBool(std::string_view value, bool& out_value) {
    const std::string trimmed = Trim(value);
    if (trimmed == "true") {
        out_value = true;
        return true;
    }
    if (trimmed == "false") {
        out_value = false;
        return true;
    }
    return false;
}

bool ParseInt(std::string_view value, int& out_value) {
    const std::string trimmed = Trim(value);
    if (trimmed.empty()) {
        return false;
    }

    int parsed = 0;
    const char* begin = trimmed.data();
    const char* end = trimmed.data() + trimmed.size();
    const std::from_chars_result result = std::from_chars(begin, end, parsed);
    if (result.ec != std::errc() || result.ptr != end) {
        return false;
    }

    out_value = parsed;
    return true;
}

bool ParseDouble(std::string_view value, double& out_value) {
    const std::string trimmed = Trim(value);
    if (trimmed.empty()) {
        return false;
    }

    char* parse_end = nullptr;
    const double parsed = std::strtod(trimmed.c_str(), &parse_end);
    if (parse_end != trimmed.c_str() + trimmed.size() || !std::isfinite(parsed)) {
        return false;
    }

    out_value = parsed;
    return true;
}

bool ParseQuotedString(std::string_view value, std::string& out_text) {
    const std::string trimmed = Trim(value);
    if (trimmed.size() < 2 || trimmed.front() != '"' || trimmed.back() != '"') {
        return false;
    }
    out_text = trimmed.substr(1, trimmed.size() - 2);
    return true;
}

bool ParseQuotedStringArray(std::string_view value, std::vector<std::string>& out_items) {
    out_items.clear();

    const std::string trimmed = Trim(value);
    if (trimmed.size() < 2 || trimmed.front() != '[' || trimmed.back() != ']') {
        return false;
    }

    const std::string inner = Trim(std::string_view(trimmed).substr(1, trimmed.size() - 2));
    std::size_t offset = 0;
    while (offset < inner.size()) {
        if (inner[offset] != '"') {
            out_items.clear();
            return false;
        }

        const std::size_t end_quote = inner.find('"', offset + 1);
        if (end_quote == std::string::npos) {
            out_items.clear();
            return false;
        }
        out_items.push_back(inner.substr(offset + 1, end_quote - offset - 1));

        offset = end_quote + 1;
        while (offset < inner.size() && std::isspace(static_cast<unsigned char>(inner[offset])) != 0) {
            ++offset;
        }
        if (offset >= inner.size()) {
            break;
        }
        if (inner[offset] != ',') {
            out_items.clear();
            return false;
        }
        ++offset;
        while (offset < inner.size() && std::isspace(static_cast<unsigned char>(inner[offset])) != 0) {
            ++offset;
        }
    }

    return true;
}

}  // namespace flowsim::core::cfg
