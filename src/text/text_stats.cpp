#include "text/text_stats.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace docgate::text {

namespace {

bool is_space(const char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_continuation_byte(const char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), is_space);
}

}  // namespace

std::size_t count_words(const std::string& text) {
    std::size_t words = 0;
    bool in_word = false;
    for (const char c : text) {
        if (is_space(c)) {
            in_word = false;
            continue;
        }
        if (!in_word) {
            ++words;
            in_word = true;
        }
    }
    return words;
}

std::size_t count_code_points(const std::string& text) {
    std::size_t count = 0;
    for (const char c : text) {
        if (!is_continuation_byte(c)) {
            ++count;
        }
    }
    return count;
}

std::size_t byte_offset_of(const std::string& text, const std::size_t code_point) {
    std::size_t seen = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (is_continuation_byte(text[i])) {
            continue;
        }
        if (seen == code_point) {
            return i;
        }
        ++seen;
    }
    return text.size();
}

protocol::TextContent make_text_content(std::string content) {
    protocol::TextContent result;
    result.word_count = count_words(content);
    result.char_count = count_code_points(content);
    result.content = std::move(content);
    return result;
}

TextStatistics compute_statistics(const std::string& text) {
    TextStatistics stats;
    stats.word_count = count_words(text);
    stats.char_count = count_code_points(text);

    stats.line_count = 1 + static_cast<std::size_t>(
                               std::count(text.begin(), text.end(), '\n'));

    std::size_t start = 0;
    while (start <= text.size()) {
        const auto split = text.find("\n\n", start);
        const auto end = split == std::string::npos ? text.size() : split;
        if (!is_blank(text.substr(start, end - start))) {
            ++stats.paragraph_count;
        }
        if (split == std::string::npos) {
            break;
        }
        start = split + 2;
    }

    std::string sentence;
    for (const char c : text) {
        if (c == '.' || c == '!' || c == '?') {
            if (!is_blank(sentence)) {
                ++stats.sentence_count;
            }
            sentence.clear();
            continue;
        }
        sentence.push_back(c);
    }
    if (!is_blank(sentence)) {
        ++stats.sentence_count;
    }

    stats.average_words_per_sentence =
        static_cast<double>(stats.word_count) /
        static_cast<double>(std::max<std::size_t>(stats.sentence_count, 1));
    stats.average_chars_per_word =
        static_cast<double>(stats.char_count) /
        static_cast<double>(std::max<std::size_t>(stats.word_count, 1));
    return stats;
}

bool contains_ignore_case(const std::string& haystack, const std::string& needle) {
    return lowercase(haystack).find(lowercase(needle)) != std::string::npos;
}

std::string match_context(const std::string& content, const std::string& query,
                          const std::size_t context_chars) {
    const auto match_pos = lowercase(content).find(lowercase(query));
    if (match_pos == std::string::npos) {
        return "";
    }

    const std::size_t half = context_chars / 2;
    const std::size_t start = match_pos > half ? match_pos - half : 0;
    const std::size_t end = std::min(content.size(), match_pos + query.size() + half);

    std::string context = content.substr(start, end - start);
    if (start > 0) {
        context = "..." + context;
    }
    if (end < content.size()) {
        context += "...";
    }
    return context;
}

}  // namespace docgate::text
