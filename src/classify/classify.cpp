// ==============================================================================
// classify.cpp - Полный конвейер классификации
// ==============================================================================

#include "anirename/classify.hpp"

#include "anirename/identify.hpp"
#include "anirename/normalize.hpp"

#include <regex>

namespace anirename::classify {

Classification classify_name(std::string_view base_name, const Vocabulary& vocabulary) {
    std::string cleaned = normalize(base_name, vocabulary.technical_keywords);
    Tokens tokens = tokenize(cleaned, vocabulary.technical_keywords);

    Classification c;
    c.release_group = identify_group(cleaned, tokens.segments, vocabulary.release_groups);
    c.season = identify_season(cleaned);
    c.title = identify_title(tokens.segments, vocabulary.release_groups);
    c.episode = identify_episode(cleaned);
    return c;
}

std::string canonical_name(const Classification& c, std::string_view extension) {
    std::string name = c.title;
    name += " - S";
    name += c.season;
    name += 'E';
    name += c.episode;
    name += " - ";
    name += c.release_group;
    name += extension;
    return name;
}

std::optional<Classification> parse_canonical_name(std::string_view base_name) {
    static const std::regex canonical(R"(^(.+) - S(\d{2})E(\d{2}) - (.+)$)");

    const std::string text(base_name);
    std::smatch m;
    if (!std::regex_match(text, m, canonical)) {
        return std::nullopt;
    }

    Classification c;
    c.title = m[1].str();
    c.season = m[2].str();
    c.episode = m[3].str();
    c.release_group = m[4].str();
    return c;
}

}  // namespace anirename::classify
