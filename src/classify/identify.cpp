// ==============================================================================
// identify.cpp - Эвристики идентификации группы, сезона, эпизода, названия
// ==============================================================================

#include "anirename/identify.hpp"

#include "anirename/normalize.hpp"
#include "anirename/vocabulary.hpp"

#include <cctype>
#include <cstddef>

namespace anirename::classify {

namespace {

// "Season 2" / "S02" (первая подходящая группа)
const std::regex& season_search_regex() {
    static const std::regex re(R"(season\s*(\d+)|s(\d+))", std::regex::icase);
    return re;
}

// Шаблоны для вырезания из сегментов названия; границы слова проверяет
// find_standalone, поэтому \b в шаблонах нет
const std::regex& season_strip_regex() {
    static const std::regex re(R"(season\s*\d{1,2}|s\d{1,2})", std::regex::icase);
    return re;
}

const std::regex& episode_strip_regex() {
    static const std::regex re(R"(ep?\d{1,2}|\d{1,2})", std::regex::icase);
    return re;
}

// ----------------------------------------------------------------------------
// Границы слова с учётом Unicode
// ----------------------------------------------------------------------------
//
// \b в std::regex видит только ASCII: "10月" для него отдельное число.
// Здесь буквы и цифры любого письма считаются частью слова, пунктуация и
// символы (★, 【】) нет.

char32_t decode_at(std::string_view text, size_t pos) {
    auto byte = [&](size_t i) { return static_cast<unsigned char>(text[i]); };
    unsigned char lead = byte(pos);
    size_t extra = 0;
    char32_t cp = 0;
    if (lead < 0x80) {
        return lead;
    } else if ((lead & 0xE0) == 0xC0) {
        extra = 1;
        cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        extra = 2;
        cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        extra = 3;
        cp = lead & 0x07;
    } else {
        return 0xFFFD;
    }
    if (pos + extra >= text.size()) {
        return 0xFFFD;
    }
    for (size_t i = 1; i <= extra; ++i) {
        if ((byte(pos + i) & 0xC0) != 0x80) {
            return 0xFFFD;
        }
        cp = (cp << 6) | (byte(pos + i) & 0x3F);
    }
    return cp;
}

bool is_word_code_point(char32_t cp) {
    if (cp < 0x80) {
        return std::isalnum(static_cast<int>(cp)) != 0 || cp == '_';
    }
    if (cp <= 0xBF) {
        // Latin-1: ª ² ³ µ ¹ º ¼ ½ ¾ - буквы и числа, остальное знаки
        return cp == 0xAA || cp == 0xB2 || cp == 0xB3 || cp == 0xB5 || cp == 0xB9 ||
               cp == 0xBA || (cp >= 0xBC && cp <= 0xBE);
    }
    if (cp == 0xD7 || cp == 0xF7) {
        return false;
    }
    // Общая пунктуация, стрелки, рамки, геометрия, ★ и прочие символы
    if (cp >= 0x2000 && cp <= 0x2BFF) {
        return false;
    }
    // 、。「」【】〜 и идеографический пробел
    if ((cp >= 0x3000 && cp <= 0x3004) || (cp >= 0x3008 && cp <= 0x3020) || cp == 0x3030) {
        return false;
    }
    if (cp >= 0xFE30 && cp <= 0xFE4F) {
        return false;
    }
    // Полноширинная пунктуация: ！（）［］｛｝ и т.п.
    if ((cp >= 0xFF01 && cp <= 0xFF0F) || (cp >= 0xFF1A && cp <= 0xFF20) ||
        (cp >= 0xFF3B && cp <= 0xFF40) || (cp >= 0xFF5B && cp <= 0xFF65)) {
        return false;
    }
    if (cp == 0xFFFD || cp >= 0x1F000) {
        return false;
    }
    return true;
}

/// Символ слова, заканчивающийся перед байтом pos
bool word_before(std::string_view text, size_t pos) {
    if (pos == 0) {
        return false;
    }
    size_t start = pos - 1;
    while (start > 0 && pos - start < 4 &&
           (static_cast<unsigned char>(text[start]) & 0xC0) == 0x80) {
        --start;
    }
    return is_word_code_point(decode_at(text, start));
}

bool word_at(std::string_view text, size_t pos) {
    return pos < text.size() && is_word_code_point(decode_at(text, pos));
}

/// Первое совпадение re в text начиная с from; при standalone совпадение
/// не должно примыкать к символам слова ни слева, ни справа
bool find_standalone(const std::string& text, const std::regex& re, size_t from, bool standalone,
                     std::smatch& m) {
    while (from <= text.size()) {
        auto flags = from > 0 ? std::regex_constants::match_prev_avail
                              : std::regex_constants::match_default;
        if (!std::regex_search(text.cbegin() + static_cast<std::ptrdiff_t>(from), text.cend(), m,
                               re, flags)) {
            return false;
        }
        size_t begin = static_cast<size_t>(m[0].first - text.cbegin());
        size_t end = static_cast<size_t>(m[0].second - text.cbegin());
        if (!standalone || (!word_before(text, begin) && !word_at(text, end))) {
            return true;
        }
        // Совпадение внутри слова: ищем дальше со следующего байта
        from = begin + 1;
    }
    return false;
}

/// Удаляет все отдельно стоящие совпадения re
std::string erase_standalone(const std::string& text, const std::regex& re) {
    std::string out;
    size_t pos = 0;
    std::smatch m;
    while (find_standalone(text, re, pos, true, m)) {
        size_t begin = static_cast<size_t>(m[0].first - text.cbegin());
        size_t end = static_cast<size_t>(m[0].second - text.cbegin());
        out.append(text, pos, begin - pos);
        pos = end;
    }
    if (pos < text.size()) {
        out.append(text, pos, std::string::npos);
    }
    return out;
}

/// Длина в кодовых точках UTF-8 (для сравнения длины названий)
size_t utf8_length(std::string_view s) {
    size_t count = 0;
    for (char c : s) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

bool mentions_group(std::string_view segment, const std::vector<std::string>& registry) {
    for (const auto& group : registry) {
        if (!group.empty() && contains_icase(segment, group)) {
            return true;
        }
    }
    return false;
}

}  // namespace

std::string pad2(std::string_view digits) {
    if (digits.size() >= 2) {
        return std::string(digits);
    }
    return std::string(2 - digits.size(), '0') + std::string(digits);
}

const std::vector<EpisodePattern>& episode_patterns() {
    static const std::vector<EpisodePattern> patterns = {
        {"marker", std::regex(R"(e(p)?(\d{1,2}))", std::regex::icase), 2, false},
        // 第NN话
        {"cjk", std::regex("\xe7\xac\xac(\\d{1,2})\xe8\xaf\x9d"), 1, false},
        {"range", std::regex(R"((\d{1,2})-(\d{1,2}))"), 1, true},
        {"bare", std::regex(R"((\d{1,2}))"), 1, true},
    };
    return patterns;
}

// ----------------------------------------------------------------------------
// Группа релиза
// ----------------------------------------------------------------------------

std::string identify_group(std::string_view cleaned, const std::vector<std::string>& segments,
                           const std::vector<std::string>& registry) {
    // 1. Реестр авторитетен; совместные релизы склеиваются через '&'
    std::string joined;
    for (const auto& group : registry) {
        if (group.empty() || !contains_icase(cleaned, group)) {
            continue;
        }
        if (!joined.empty()) {
            joined += '&';
        }
        joined += group;
    }
    if (!joined.empty()) {
        return joined;
    }

    // 2. Незарегистрированные группы часто называют себя "...Sub" / "...Studio"
    for (const auto& segment : segments) {
        if (contains_icase(segment, "sub") || contains_icase(segment, "studio")) {
            return trim(segment);
        }
    }

    // 3. Соглашение "[Group] Title": группа идёт первой
    if (!segments.empty()) {
        return segments.front();
    }

    return UNKNOWN_GROUP;
}

// ----------------------------------------------------------------------------
// Сезон
// ----------------------------------------------------------------------------

std::string identify_season(std::string_view cleaned) {
    const std::string text(cleaned);
    const std::sregex_iterator end;
    for (std::sregex_iterator it(text.begin(), text.end(), season_search_regex()); it != end;
         ++it) {
        const auto& m = *it;
        std::string digits = m[1].matched ? m[1].str() : m[2].str();
        // "S2024" и подобное - не номер сезона
        if (!digits.empty() && digits.size() <= 2) {
            return pad2(digits);
        }
    }
    return DEFAULT_SEASON;
}

// ----------------------------------------------------------------------------
// Эпизод
// ----------------------------------------------------------------------------

std::string identify_episode(std::string_view cleaned) {
    const std::string text(cleaned);
    std::smatch m;
    for (const auto& entry : episode_patterns()) {
        size_t pos = 0;
        while (find_standalone(text, entry.pattern, pos, entry.standalone, m)) {
            const auto& group = m[entry.group];
            if (group.matched && group.length() > 0 && group.length() <= 2) {
                return pad2(group.str());
            }
            pos = static_cast<size_t>(m[0].second - text.cbegin());
            if (m[0].length() == 0) {
                ++pos;
            }
        }
    }
    return DEFAULT_EPISODE;
}

// ----------------------------------------------------------------------------
// Название
// ----------------------------------------------------------------------------

std::string identify_title(const std::vector<std::string>& segments,
                           const std::vector<std::string>& registry) {
    std::string best;
    size_t best_length = 0;

    for (const auto& segment : segments) {
        if (mentions_group(segment, registry)) {
            continue;
        }

        std::string stripped = erase_standalone(segment, season_strip_regex());
        stripped = trim(erase_standalone(stripped, episode_strip_regex()));
        if (stripped.empty()) {
            continue;
        }

        // При равной длине побеждает первый сегмент
        size_t length = utf8_length(stripped);
        if (length > best_length) {
            best = std::move(stripped);
            best_length = length;
        }
    }

    return best.empty() ? std::string(UNKNOWN_TITLE) : best;
}

}  // namespace anirename::classify
