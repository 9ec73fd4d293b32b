#include "Markdown.hpp"
#include <ctime>

namespace upnote_mcp {

namespace {
    std::string join_lines(const std::vector<std::string>& lines) {
        std::string out;
        for (size_t i = 0; i < lines.size(); ++i) {
            if (i > 0) {
                out += '\n';
            }
            out += lines[i];
        }
        return out;
    }

    std::string table_row(const std::vector<std::string>& cells) {
        std::string row = "|";
        for (const auto& cell : cells) {
            row += " " + cell + " |";
        }
        return row;
    }

    std::string format_now(const char* format) {
        std::time_t now = std::time(nullptr);
        std::tm local{};
        localtime_r(&now, &local);
        char buf[32];
        size_t len = std::strftime(buf, sizeof(buf), format, &local);
        return std::string(buf, len);
    }
}

std::string Markdown::checklist(const std::vector<std::string>& items) {
    std::vector<std::string> lines;
    for (const auto& item : items) {
        lines.push_back("- [ ] " + item);
    }
    return join_lines(lines);
}

std::string Markdown::numbered_list(const std::vector<std::string>& items) {
    std::vector<std::string> lines;
    for (size_t i = 0; i < items.size(); ++i) {
        lines.push_back(std::to_string(i + 1) + ". " + items[i]);
    }
    return join_lines(lines);
}

std::string Markdown::bullet_list(const std::vector<std::string>& items) {
    std::vector<std::string> lines;
    for (const auto& item : items) {
        lines.push_back("- " + item);
    }
    return join_lines(lines);
}

std::string Markdown::table(const std::vector<std::string>& headers,
                            const std::vector<std::vector<std::string>>& rows) {
    if (headers.empty() || rows.empty()) {
        return "";
    }

    std::vector<std::string> lines;
    lines.push_back(table_row(headers));
    lines.push_back(table_row(std::vector<std::string>(headers.size(), "---")));

    for (const auto& row : rows) {
        if (row.size() == headers.size()) {
            lines.push_back(table_row(row));
        }
    }

    return join_lines(lines);
}

std::string Markdown::with_timestamp(const std::string& content, const std::string& timestamp) {
    return "*Created: " + timestamp + "*\n\n" + content;
}

std::string Markdown::now_timestamp() {
    return format_now("%Y-%m-%d %H:%M:%S");
}

std::string Markdown::today() {
    return format_now("%Y-%m-%d");
}

} // namespace upnote_mcp
