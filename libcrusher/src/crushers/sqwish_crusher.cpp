#include "../../include/sqwish_crusher.hpp"
#include "../../include/errors.hpp"
#include <cctype>
#include <regex>
#include <string>

namespace {

bool no_space_after(const char c) {
    switch (c) {
        case '{': case '}': case ';': case ',': case '>': case ':':
            return true;
        default:
            return false;
    }
}

bool no_space_before(const char c, const int depth) {
    switch (c) {
        case '{': case '}': case ';': case ',': case '>':
            return true;
        case ':':
            return depth > 0;
        default:
            return false;
    }
}

std::string compact_value(const std::string& value) {
    static const std::regex long_hex(
        R"(#([0-9a-fA-F])\1([0-9a-fA-F])\2([0-9a-fA-F])\3(?![0-9a-fA-F]))");
    static const std::regex zero_unit(
        R"((^|[\s,(:])0(?:px|em|ex|pt|pc|in|cm|mm|rem|ch|vh|vw|vmin|vmax)(?![0-9a-zA-Z%]))");

    std::string out = std::regex_replace(value, long_hex, "#$1$2$3");
    // $01 is group 1, then a literal zero
    out = std::regex_replace(out, zero_unit, "$010");
    return out;
}

class Compactor {
public:
    explicit Compactor(const std::string_view input) : in_(input) {
        out_.reserve(input.size());
    }

    std::string run() {
        while (pos_ < in_.size()) {
            const char c = in_[pos_];
            if (c == '"' || c == '\'') {
                flush_space(c);
                copy_string(c);
            } else if (c == '/' && pos_ + 1 < in_.size() && in_[pos_ + 1] == '*') {
                skip_comment();
            } else if (std::isspace(static_cast<unsigned char>(c))) {
                pending_space_ = true;
                ++pos_;
            } else {
                flush_space(c);
                token(c);
                ++pos_;
            }
        }
        return std::move(out_);
    }

private:
    void flush_space(const char next) {
        if (pending_space_ && !out_.empty() && !no_space_after(out_.back()) &&
            !no_space_before(next, depth_)) {
            out_.push_back(' ');
        }
        pending_space_ = false;
    }

    void copy_string(const char quote) {
        const std::size_t start = pos_++;
        while (pos_ < in_.size() && in_[pos_] != quote) {
            if (in_[pos_] == '\\') ++pos_;
            ++pos_;
        }
        if (pos_ >= in_.size()) {
            throw crusher::CrushError(crusher::ErrorKind::TransformFailed, "Unterminated string in stylesheet");
        }
        ++pos_;
        out_.append(in_.substr(start, pos_ - start));
        if (in_value_) value_has_string_ = true;
    }

    void skip_comment() {
        const std::size_t end = in_.find("*/", pos_ + 2);
        if (end == std::string_view::npos) {
            throw crusher::CrushError(crusher::ErrorKind::TransformFailed, "Unterminated comment in stylesheet");
        }
        pos_ = end + 2;
    }

    void end_value() {
        if (in_value_ && !value_has_string_) {
            out_.replace(value_start_, std::string::npos, compact_value(out_.substr(value_start_)));
        }
        in_value_ = false;
    }

    void token(const char c) {
        switch (c) {
            case '{':
                // a ':' before '{' was a selector pseudo-class, not a value
                in_value_ = false;
                ++depth_;
                break;
            case '}':
                end_value();
                if (!out_.empty() && out_.back() == ';') out_.pop_back();
                if (depth_ > 0) --depth_;
                break;
            case ';':
                end_value();
                break;
            case ':':
                if (depth_ > 0 && !in_value_) {
                    out_.push_back(c);
                    in_value_ = true;
                    value_has_string_ = false;
                    value_start_ = out_.size();
                    return;
                }
                break;
            default:
                break;
        }
        out_.push_back(c);
    }

    std::string_view in_;
    std::size_t pos_ = 0;
    std::string out_;
    int depth_ = 0;
    bool pending_space_ = false;
    bool in_value_ = false;
    bool value_has_string_ = false;
    std::size_t value_start_ = 0;
};

} // namespace

namespace crusher {

    std::string SqwishCrusher::run([[maybe_unused]] const ContentType type, const std::string_view content) const {
        return Compactor(content).run();
    }

} // namespace crusher
