#include "utils/GlobPattern.h"
#include <stdexcept>
#include <utility>
#include <vector>

namespace {
    struct Token {
        enum Kind { Literal, AnyChar, Star, Class } kind = Literal;
        char literal = 0;
        bool negated = false;
        std::vector<std::pair<unsigned char, unsigned char>> ranges;

        bool matches(char c) const {
            switch (kind) {
                case Literal: return c == literal;
                case AnyChar: return true;
                case Class: {
                    auto u = static_cast<unsigned char>(c);
                    bool hit = false;
                    for (const auto& r : ranges) {
                        if (u >= r.first && u <= r.second) { hit = true; break; }
                    }
                    return hit != negated;
                }
                default: return false;
            }
        }
    };

    struct Segment {
        bool globstar = false;
        std::vector<Token> tokens;
    };

    std::vector<std::string> splitSegments(const std::string& s) {
        std::vector<std::string> parts;
        size_t start = 0;
        while (true) {
            size_t slash = s.find('/', start);
            parts.push_back(s.substr(start, slash == std::string::npos ? std::string::npos : slash - start));
            if (slash == std::string::npos) break;
            start = slash + 1;
        }
        return parts;
    }

    Segment parseSegment(const std::string& text, const std::string& glob) {
        Segment seg;
        if (text == "**") {
            seg.globstar = true;
            return seg;
        }

        size_t i = 0;
        while (i < text.size()) {
            Token t;
            char c = text[i];
            if (c == '*') {
                t.kind = Token::Star;
                // Consecutive stars inside a segment behave as one.
                while (i < text.size() && text[i] == '*') i++;
                seg.tokens.push_back(t);
                continue;
            }
            if (c == '?') {
                t.kind = Token::AnyChar;
                i++;
            } else if (c == '[') {
                size_t j = i + 1;
                if (j < text.size() && (text[j] == '!' || text[j] == '^')) {
                    t.negated = true;
                    j++;
                }
                size_t first = j;
                // A ']' right after the opening bracket is a member, not the end.
                while (j < text.size() && (text[j] != ']' || j == first)) {
                    unsigned char lo = static_cast<unsigned char>(text[j]);
                    unsigned char hi = lo;
                    if (j + 2 < text.size() && text[j + 1] == '-' && text[j + 2] != ']') {
                        hi = static_cast<unsigned char>(text[j + 2]);
                        j += 2;
                    }
                    t.ranges.emplace_back(lo, hi);
                    j++;
                }
                if (j >= text.size()) {
                    throw std::invalid_argument("Unterminated character class in glob: " + glob);
                }
                t.kind = Token::Class;
                i = j + 1;
            } else {
                t.kind = Token::Literal;
                t.literal = c;
                i++;
            }
            seg.tokens.push_back(t);
        }
        return seg;
    }

    bool matchSegment(const std::vector<Token>& pat, const std::string& s) {
        size_t p = 0, i = 0;
        size_t starP = std::string::npos, starI = 0;
        while (i < s.size()) {
            if (p < pat.size() && pat[p].kind == Token::Star) {
                starP = p++;
                starI = i;
            } else if (p < pat.size() && pat[p].matches(s[i])) {
                p++;
                i++;
            } else if (starP != std::string::npos) {
                p = starP + 1;
                i = ++starI;
            } else {
                return false;
            }
        }
        while (p < pat.size() && pat[p].kind == Token::Star) p++;
        return p == pat.size();
    }
}

struct GlobPattern::Impl {
    std::vector<Segment> segments;
};

GlobPattern::GlobPattern(const std::string& glob) : impl_(std::make_unique<Impl>()) {
    if (glob.empty()) {
        throw std::invalid_argument("Glob pattern must not be empty");
    }
    for (const auto& part : splitSegments(glob)) {
        impl_->segments.push_back(parseSegment(part, glob));
    }
}

GlobPattern::~GlobPattern() = default;
GlobPattern::GlobPattern(GlobPattern&&) noexcept = default;
GlobPattern& GlobPattern::operator=(GlobPattern&&) noexcept = default;

bool GlobPattern::matches(const fs::path& relativePath) const {
    const auto parts = splitSegments(relativePath.generic_string());
    const auto& segs = impl_->segments;

    // Same star/backtrack scheme as matchSegment, one level up: "**" is the
    // star and every other segment consumes exactly one path component.
    size_t p = 0, i = 0;
    size_t starP = std::string::npos, starI = 0;
    while (i < parts.size()) {
        if (p < segs.size() && segs[p].globstar) {
            starP = p++;
            starI = i;
        } else if (p < segs.size() && matchSegment(segs[p].tokens, parts[i])) {
            p++;
            i++;
        } else if (starP != std::string::npos) {
            p = starP + 1;
            i = ++starI;
        } else {
            return false;
        }
    }
    while (p < segs.size() && segs[p].globstar) p++;
    return p == segs.size();
}
