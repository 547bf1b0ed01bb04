#include "../../include/jscrush_crusher.hpp"
#include <array>
#include <optional>
#include <string>
#include <unordered_map>

namespace {

constexpr std::size_t kMinLength = 2;
constexpr std::size_t kMaxLength = 32;

struct Candidate {
    std::string text;
    long gain = 0;
};

struct Occurrence {
    std::size_t count = 0;
    std::size_t next_free = 0; // first position a non-overlapping match may start at
    std::size_t first = 0;
};

// characters that would need escaping inside the quoted literal, plus NUL
bool usable_key(const int c) {
    return c != 0 && c != '\n' && c != '\r' && c != '\'' && c != '\\';
}

std::optional<char> pick_key(const std::string& packed) {
    std::array<bool, 128> used{};
    for (const char ch : packed) {
        const auto u = static_cast<unsigned char>(ch);
        if (u < used.size()) used[u] = true;
    }
    for (int c = 127; c > 0; --c) {
        if (usable_key(c) && !used[static_cast<std::size_t>(c)]) {
            return static_cast<char>(c);
        }
    }
    return std::nullopt;
}

// UTF-8 continuation byte: a cut here would split a character
bool continuation(const char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// substring whose replacement saves the most characters, counting
// non-overlapping matches from the left the way String.split does.
// Candidates hold whole characters only.
std::optional<Candidate> best_candidate(const std::string& s) {
    std::optional<Candidate> best;
    std::size_t best_first = 0;

    for (std::size_t len = kMinLength; len <= kMaxLength && len <= s.size() / 2; ++len) {
        std::unordered_map<std::string_view, Occurrence> seen;
        seen.reserve(s.size());
        const std::string_view view(s);

        for (std::size_t i = 0; i + len <= s.size(); ++i) {
            if (continuation(s[i]) || (i + len < s.size() && continuation(s[i + len]))) continue;
            auto [it, inserted] = seen.try_emplace(view.substr(i, len));
            Occurrence& occ = it->second;
            if (inserted) occ.first = i;
            if (inserted || i >= occ.next_free) {
                ++occ.count;
                occ.next_free = i + len;
            }
        }

        for (const auto& [text, occ] : seen) {
            if (occ.count < 2) continue;
            const long count = static_cast<long>(occ.count);
            const long l = static_cast<long>(len);
            const long gain = count * l - count - l - 2;
            if (gain <= 0) continue;
            if (!best || gain > best->gain || (gain == best->gain && occ.first < best_first)) {
                best = Candidate{std::string(text), gain};
                best_first = occ.first;
            }
        }
    }
    return best;
}

std::string replace_all(const std::string& s, const std::string& needle, const char with) {
    std::string out;
    out.reserve(s.size());
    std::size_t pos = 0;
    for (;;) {
        const std::size_t hit = s.find(needle, pos);
        if (hit == std::string::npos) break;
        out.append(s, pos, hit - pos);
        out.push_back(with);
        pos = hit + needle.size();
    }
    out.append(s, pos, std::string::npos);
    return out;
}

std::string quote(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (const char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\'': out += "\\'"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            default: out.push_back(c);
        }
    }
    return out;
}

} // namespace

namespace crusher {

    std::string JscrushCrusher::run([[maybe_unused]] const ContentType type, const std::string_view content) const {
        std::string packed(content);
        std::string keys;

        for (;;) {
            const auto key = pick_key(packed);
            if (!key) break;
            const auto candidate = best_candidate(packed);
            if (!candidate) break;

            packed = replace_all(packed, candidate->text, *key);
            packed.push_back(*key);
            packed += candidate->text;
            keys.insert(keys.begin(), *key);
        }

        if (keys.empty()) {
            return std::string(content);
        }

        std::string program = "_='" + quote(packed) + "';for(Y in $='" + keys +
                              "')with(_.split($[Y]))_=join(pop());eval(_)";
        if (program.size() >= content.size()) {
            return std::string(content);
        }
        return program;
    }

} // namespace crusher
