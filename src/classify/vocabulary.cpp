// ==============================================================================
// vocabulary.cpp - Встроенные словари классификатора
// ==============================================================================

#include "anirename/vocabulary.hpp"

#include <unordered_set>

namespace anirename::classify {

const Vocabulary& default_vocabulary() {
    static const Vocabulary vocabulary{
        // technical_keywords
        {"1080p", "720p", "2160p", "x265", "x264", "ac3", "flac", "hevc", "ma10p", "web-dl",
         "bdrip", "webrip", "big5", "hi10p", "aac", "avc", "web", "multisub", "multi-subs", "1080",
         "1920"},
        // release_groups
        {"VCB-Studio", "Kamigami", "FANSUB", "UHA-WINGS", "ReinForce", "DMG", "SweetSub",
         "Nekomoe kissaten", "Sakurato", "Airota", "LPSub", "KitaujiSub", "LoliHouse", "Haruhana",
         "KTXP", "Moozzi2", "THORA", "Fussoir", "LittleBakas", ".subbers project", "Lilith-Raws",
         "NC-Raws", "FLsnow", "DHR", "MakariHoshiyume", "TxxZ", "A.I.R.nesSub", "B-Global",
         "\xe6\x96\xb0Sub",  // 新Sub
         "XKsub", "SumiSora", "Mabors", "UCCUSS", "Skymoon-Raws"},
    };
    return vocabulary;
}

std::vector<std::string> dedupe_preserving_order(const std::vector<std::string>& items) {
    std::vector<std::string> result;
    std::unordered_set<std::string> seen;
    result.reserve(items.size());
    for (const auto& item : items) {
        if (seen.insert(item).second) {
            result.push_back(item);
        }
    }
    return result;
}

}  // namespace anirename::classify
