#include "boardbuild/keyvalue.hpp"

#include "boardbuild/mmap.hpp"
#include "boardbuild/utility.hpp"

#include <cctype>
#include <exception>
#include <format>
#include <memory>
#include <string>
#include <string_view>

namespace boardbuild {

namespace {

bool is_key_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_key_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_blank(char c) {
    return c == ' ' || c == '\t';
}

std::string_view trim_left(std::string_view s) {
    while (!s.empty() && is_blank(s.front()))
        s.remove_prefix(1);
    return s;
}

Result<void> parse_assignment(std::string_view line, std::string_view origin, size_t line_no, KeyValues &out) {
    auto malformed = [&](std::string_view why) {
        return fail(ErrorKind::Artifact, std::format("{}:{}: {}", origin, line_no, why));
    };

    if (line.starts_with("export") && line.size() > 6 && is_blank(line[6])) {
        line = trim_left(line.substr(6));
    }

    if (line.empty() || !is_key_start(line.front())) {
        return malformed("expected an assignment");
    }
    size_t pos = 1;
    while (pos < line.size() && is_key_char(line[pos]))
        pos++;
    if (pos >= line.size() || line[pos] != '=') {
        return malformed("expected '=' after key");
    }
    std::string key(line.substr(0, pos));
    pos++;

    std::string value;
    while (pos < line.size()) {
        char c = line[pos];
        if (c == '\'') {
            size_t close = line.find('\'', pos + 1);
            if (close == std::string_view::npos) {
                return malformed("unterminated single quote");
            }
            value.append(line.substr(pos + 1, close - pos - 1));
            pos = close + 1;
        } else if (c == '"') {
            pos++;
            bool closed = false;
            while (pos < line.size()) {
                char q = line[pos];
                if (q == '"') {
                    closed = true;
                    pos++;
                    break;
                }
                if (q == '\\' && pos + 1 < line.size()) {
                    char next = line[pos + 1];
                    if (next == '"' || next == '\\' || next == '$' || next == '`') {
                        value += next;
                        pos += 2;
                        continue;
                    }
                }
                value += q;
                pos++;
            }
            if (!closed) {
                return malformed("unterminated double quote");
            }
        } else if (c == '\\') {
            if (pos + 1 < line.size()) {
                value += line[pos + 1];
            }
            pos += 2;
        } else if (is_blank(c)) {
            std::string_view rest = trim_left(line.substr(pos));
            if (!rest.empty() && !rest.starts_with("#")) {
                return malformed("unexpected text after value");
            }
            break;
        } else {
            value += c;
            pos++;
        }
    }

    out.insert_or_assign(std::move(key), std::move(value));
    return {};
}

} // namespace

Result<KeyValues> parse_key_values(std::string_view content, std::string_view origin) {
    KeyValues values;

    size_t start = 0;
    size_t line_no = 0;
    while (start < content.size()) {
        size_t end = content.find('\n', start);
        if (end == std::string_view::npos) {
            end = content.size();
        }
        line_no++;

        std::string_view line = content.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        line = trim_left(line);

        if (!line.empty() && !line.starts_with("#")) {
            if (auto res = parse_assignment(line, origin, line_no, values); !res)
                return std::unexpected(res.error());
        }

        start = end + 1;
    }
    return values;
}

Result<KeyValues> parse_key_value_file(const std::filesystem::path &path) {
    std::unique_ptr<MappedFile> file;
    try {
        file = std::make_unique<MappedFile>(path);
    } catch (const std::exception &err) {
        return fail(ErrorKind::Artifact, std::format("cannot read {}: {}", path.string(), err.what()));
    }
    return parse_key_values(file->content(), path.string());
}

} // namespace boardbuild
