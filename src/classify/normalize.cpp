// ==============================================================================
// normalize.cpp - Нормализация и токенизация имён файлов
// ==============================================================================

#include "anirename/normalize.hpp"

#include <regex>

namespace anirename::classify {

namespace {

constexpr std::string_view WHITESPACE = " \t\n\r\f\v";

// Хэш релиза: ровно 8 алфавитно-цифровых символов в квадратных скобках
const std::regex& release_hash_regex() {
    static const std::regex re(R"(\[[a-zA-Z0-9]{8}\])");
    return re;
}

const std::regex& empty_brackets_regex() {
    static const std::regex re(R"(\[\s*\])");
    return re;
}

const std::regex& whitespace_run_regex() {
    static const std::regex re(R"(\s{2,})");
    return re;
}

bool is_technical(std::string_view segment, const std::vector<std::string>& keywords) {
    for (const auto& keyword : keywords) {
        if (!keyword.empty() && contains_icase(segment, keyword)) {
            return true;
        }
    }
    return false;
}

}  // namespace

// ----------------------------------------------------------------------------
// Строковые утилиты
// ----------------------------------------------------------------------------

std::string to_lower_ascii(std::string_view s) {
    std::string result(s);
    for (char& c : result) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return result;
}

std::string trim(std::string_view s) {
    auto begin = s.find_first_not_of(WHITESPACE);
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = s.find_last_not_of(WHITESPACE);
    return std::string(s.substr(begin, end - begin + 1));
}

bool contains_icase(std::string_view haystack, std::string_view needle) {
    return to_lower_ascii(haystack).find(to_lower_ascii(needle)) != std::string::npos;
}

std::string erase_all_icase(std::string_view text, std::string_view needle) {
    if (needle.empty()) {
        return std::string(text);
    }

    std::string lower_text = to_lower_ascii(text);
    std::string lower_needle = to_lower_ascii(needle);

    std::string result;
    result.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        size_t hit = lower_text.find(lower_needle, pos);
        if (hit == std::string::npos) {
            result.append(text.substr(pos));
            break;
        }
        result.append(text.substr(pos, hit - pos));
        pos = hit + lower_needle.size();
    }
    return result;
}

// ----------------------------------------------------------------------------
// normalize
// ----------------------------------------------------------------------------

std::string normalize(std::string_view raw, const std::vector<std::string>& keywords) {
    std::string text = std::regex_replace(std::string(raw), release_hash_regex(), "");

    for (const auto& keyword : keywords) {
        text = erase_all_icase(text, keyword);
    }

    // Пустые скобки после удаления меток остаются видимым разделителем
    text = std::regex_replace(text, empty_brackets_regex(), "[]");
    text = std::regex_replace(text, whitespace_run_regex(), " ");
    return trim(text);
}

// ----------------------------------------------------------------------------
// tokenize
// ----------------------------------------------------------------------------

Tokens tokenize(std::string_view cleaned, const std::vector<std::string>& keywords) {
    Tokens tokens;
    tokens.display = std::string(cleaned);
    for (char& c : tokens.display) {
        if (DELIMITERS.find(c) != std::string_view::npos) {
            c = SEGMENT_SEPARATOR;
        }
    }

    size_t start = 0;
    while (start <= tokens.display.size()) {
        size_t end = tokens.display.find(SEGMENT_SEPARATOR, start);
        if (end == std::string::npos) {
            end = tokens.display.size();
        }

        std::string piece = trim(std::string_view(tokens.display).substr(start, end - start));
        if (!piece.empty() && !is_technical(piece, keywords)) {
            tokens.segments.push_back(std::move(piece));
        }
        start = end + 1;
    }

    return tokens;
}

}  // namespace anirename::classify
