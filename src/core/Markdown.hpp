#pragma once

#include <string>
#include <vector>

namespace upnote_mcp {

/**
 * @brief Markdown snippets used by the note templates
 */
class Markdown {
public:
    /// "- [ ] item" per line
    static std::string checklist(const std::vector<std::string>& items);

    /// "1. item" per line
    static std::string numbered_list(const std::vector<std::string>& items);

    /// "- item" per line
    static std::string bullet_list(const std::vector<std::string>& items);

    /**
     * @brief Build a pipe table
     *
     * Rows whose width differs from the header are skipped.
     * @return Table text, or empty if headers or rows are empty
     */
    static std::string table(const std::vector<std::string>& headers,
                             const std::vector<std::vector<std::string>>& rows);

    /// Prefix content with "*Created: <timestamp>*" and a blank line
    static std::string with_timestamp(const std::string& content, const std::string& timestamp);

    /// Current local time as "YYYY-MM-DD HH:MM:SS"
    static std::string now_timestamp();

    /// Current local date as "YYYY-MM-DD"
    static std::string today();
};

} // namespace upnote_mcp
