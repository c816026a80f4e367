#pragma once
/*
 * Text utilities
 *
 * Purpose: UTF-8 decoding and code point classes shared by window/previewer/prompt.
 * Policy: one terminal column per code point; invalid bytes decode to U+FFFD.
 */
#include <cstdint>
#include <string>
#include <vector>

std::u32string utf8_decode(const std::string& s);
std::string utf8_encode(char32_t cp);
std::string utf8_encode(const std::u32string& s);

bool is_space_rune(char32_t cp);
bool is_print_rune(char32_t cp);

// 1023 -> "1023", 1536 -> "1.5K", 12582912 -> "12M"
std::string humanize(std::int64_t size);

std::string longest_common_prefix(const std::vector<std::string>& words);
