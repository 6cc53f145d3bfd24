#pragma once

#include <cstddef>
#include <string>
#include "protocol/document_contract.hpp"

namespace docgate::text {

struct TextStatistics {
    std::size_t word_count = 0;
    std::size_t char_count = 0;
    std::size_t line_count = 0;
    std::size_t paragraph_count = 0;
    std::size_t sentence_count = 0;
    double average_words_per_sentence = 0.0;
    double average_chars_per_word = 0.0;
};

// Whitespace-separated tokens.
std::size_t count_words(const std::string& text);

// Unicode code points in UTF-8 text. Invalid lead bytes count as one each.
std::size_t count_code_points(const std::string& text);

// Byte offset of the code point at index `code_point`, clamped to the text.
std::size_t byte_offset_of(const std::string& text, std::size_t code_point);

protocol::TextContent make_text_content(std::string content);

TextStatistics compute_statistics(const std::string& text);

// Up to `context_chars` bytes around the first case-insensitive match of
// `query`, with "..." where the excerpt is cut. Empty if there is no match.
std::string match_context(const std::string& content, const std::string& query,
                          std::size_t context_chars = 200);

bool contains_ignore_case(const std::string& haystack, const std::string& needle);

}  // namespace docgate::text
